/// @file config.cpp
/// @brief RuntimeConfig parsing

#include <arbor/runtime/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace arbor_runtime {

using arbor_core::ConfigError;
using arbor_core::Err;
using arbor_core::Ok;

namespace {

// =============================================================================
// JSON Helpers
// =============================================================================

arbor_core::Result<void> read_float(
    const nlohmann::json& section, const std::string& section_name, const char* key,
    bool allow_zero, float& out)
{
    if (!section.contains(key)) {
        return Ok();
    }
    std::string path = section_name + "." + key;
    const auto& value = section[key];
    if (!value.is_number()) {
        return Err(ConfigError::invalid_value(path, "expected a number"));
    }
    float number = value.get<float>();
    if (allow_zero ? number < 0.0f : number <= 0.0f) {
        return Err(ConfigError::invalid_value(path, allow_zero ? "must not be negative" : "must be positive"));
    }
    out = number;
    return Ok();
}

arbor_core::Result<void> read_string(
    const nlohmann::json& section, const std::string& section_name, const char* key, std::string& out)
{
    if (!section.contains(key)) {
        return Ok();
    }
    const auto& value = section[key];
    if (!value.is_string()) {
        return Err(ConfigError::invalid_value(section_name + "." + key, "expected a string"));
    }
    out = value.get<std::string>();
    return Ok();
}

/// Section object, or null when absent
arbor_core::Result<const nlohmann::json*> section_of(const nlohmann::json& root, const char* name) {
    if (!root.contains(name)) {
        return Ok<const nlohmann::json*>(nullptr);
    }
    const auto& section = root[name];
    if (!section.is_object()) {
        return Err<const nlohmann::json*>(ConfigError::invalid_value(name, "expected an object"));
    }
    return Ok(&section);
}

arbor_core::Result<void> parse_input(const nlohmann::json& section, InputConfig& out) {
    if (auto r = read_float(section, "input", "drag_threshold", true, out.drag_threshold); !r) {
        return r;
    }
    return read_float(section, "input", "scroll_line_height", false, out.scroll_line_height);
}

arbor_core::Result<void> parse_images(const nlohmann::json& section, ImageConfig& out) {
    if (!section.contains("decode_threads")) {
        return Ok();
    }
    const auto& value = section["decode_threads"];
    if (!value.is_number_integer() || value.get<std::int64_t>() < 1) {
        return Err(ConfigError::invalid_value("images.decode_threads", "expected a positive integer"));
    }
    out.decode_threads = value.get<std::size_t>();
    return Ok();
}

arbor_core::Result<void> parse_text(const nlohmann::json& section, TextConfig& out) {
    if (auto r = read_float(section, "text", "glyph_advance", false, out.glyph_advance); !r) {
        return r;
    }
    return read_float(section, "text", "line_height", false, out.line_height);
}

arbor_core::Result<void> parse_log(const nlohmann::json& section, LoggingConfig& out) {
    if (auto r = read_string(section, "log", "level", out.level); !r) {
        return r;
    }
    if (!arbor_core::parse_log_level(out.level)) {
        return Err(ConfigError::invalid_value("log.level", "unknown level '" + out.level + "'"));
    }
    return read_string(section, "log", "directory", out.directory);
}

} // anonymous namespace

// =============================================================================
// RuntimeConfig
// =============================================================================

arbor_ui::DispatchConfig RuntimeConfig::dispatch_config() const {
    arbor_ui::DispatchConfig config;
    config.drag_threshold = input.drag_threshold;
    config.scroll_line_height = input.scroll_line_height;
    return config;
}

arbor_core::LogConfig RuntimeConfig::log_config() const {
    arbor_core::LogConfig config;
    config.level = arbor_core::parse_log_level(log.level).value_or(spdlog::level::info);
    config.file_enabled = !log.directory.empty();
    config.log_directory = log.directory;
    return config;
}

arbor_core::Result<RuntimeConfig> parse_runtime_config(const std::string& json_text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<RuntimeConfig>(ConfigError::parse_error(e.what()));
    }
    if (!root.is_object()) {
        return Err<RuntimeConfig>(ConfigError::parse_error("top level must be an object"));
    }

    RuntimeConfig config;

    auto input = section_of(root, "input");
    if (!input) return Err<RuntimeConfig>(input.error());
    if (*input) {
        if (auto r = parse_input(**input, config.input); !r) return Err<RuntimeConfig>(r.error());
    }

    auto images = section_of(root, "images");
    if (!images) return Err<RuntimeConfig>(images.error());
    if (*images) {
        if (auto r = parse_images(**images, config.images); !r) return Err<RuntimeConfig>(r.error());
    }

    auto text = section_of(root, "text");
    if (!text) return Err<RuntimeConfig>(text.error());
    if (*text) {
        if (auto r = parse_text(**text, config.text); !r) return Err<RuntimeConfig>(r.error());
    }

    auto log = section_of(root, "log");
    if (!log) return Err<RuntimeConfig>(log.error());
    if (*log) {
        if (auto r = parse_log(**log, config.log); !r) return Err<RuntimeConfig>(r.error());
    }

    return Ok(std::move(config));
}

arbor_core::Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<RuntimeConfig>(ConfigError::io_error(path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_runtime_config(buffer.str());
    if (!config) {
        config.error().with_context("file", path.string());
    }
    return config;
}

} // namespace arbor_runtime
