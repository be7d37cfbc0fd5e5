#pragma once

/// @file config.hpp
/// @brief Runtime configuration loaded from JSON
///
/// Layout of a configuration file (every key optional):
/// @code
/// {
///   "input":  { "drag_threshold": 4.0, "scroll_line_height": 30.0 },
///   "images": { "decode_threads": 2 },
///   "text":   { "glyph_advance": 8.0, "line_height": 16.0 },
///   "log":    { "level": "info", "directory": "" }
/// }
/// @endcode

#include "fwd.hpp"

#include <arbor/core/error.hpp>
#include <arbor/core/log.hpp>
#include <arbor/ui/dispatcher.hpp>

#include <filesystem>
#include <string>

namespace arbor_runtime {

struct InputConfig {
    float drag_threshold = 4.0f;
    float scroll_line_height = 30.0f;
};

struct ImageConfig {
    std::size_t decode_threads = 2;
};

struct TextConfig {
    float glyph_advance = 8.0f;
    float line_height = 16.0f;
};

struct LoggingConfig {
    std::string level = "info";
    std::string directory;  // Empty: console only
};

/// Settings for one Document and the process logging setup
struct RuntimeConfig {
    InputConfig input;
    ImageConfig images;
    TextConfig text;
    LoggingConfig log;

    [[nodiscard]] arbor_ui::DispatchConfig dispatch_config() const;
    [[nodiscard]] arbor_core::LogConfig log_config() const;
};

/// Parse configuration text. Unknown keys are ignored.
[[nodiscard]] arbor_core::Result<RuntimeConfig> parse_runtime_config(const std::string& json_text);

/// Load configuration from a file
[[nodiscard]] arbor_core::Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path);

} // namespace arbor_runtime
