#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arbor_runtime

namespace arbor_runtime {

struct InputConfig;
struct ImageConfig;
struct TextConfig;
struct LoggingConfig;
struct RuntimeConfig;

struct DocumentServices;
class Document;

} // namespace arbor_runtime
