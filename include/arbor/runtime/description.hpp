#pragma once

/// @file description.hpp
/// @brief Node descriptions read from JSON
///
/// Each node is an object:
/// @code
/// {
///   "id": "name",            // string (hashed) or positive integer, required
///   "kind": "container",     // "container", "text" or "image"
///   "attributes": { "class": "row" },
///   "text": "...",
///   "focusable": false, "editable": false, "clip": false,
///   "children": [ ... ]
/// }
/// @endcode
/// Handlers cannot be expressed in JSON; attach them afterwards with
/// NodeDesc::on or NodeTree::set_handler.

#include <arbor/core/error.hpp>
#include <arbor/ui/node.hpp>

#include <filesystem>
#include <string>

namespace arbor_runtime {

/// Parse a description from JSON text.
/// Errors carry ErrorCode::ParseError and name the offending node path.
[[nodiscard]] arbor_core::Result<arbor_ui::NodeDesc> parse_description(const std::string& json_text);

/// Load a description from a file
[[nodiscard]] arbor_core::Result<arbor_ui::NodeDesc> load_description(const std::filesystem::path& path);

} // namespace arbor_runtime
