/// @file error.cpp
/// @brief Error formatting for arbor_core

#include <arbor/core/error.hpp>
#include <sstream>
#include <vector>

namespace arbor_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_reconcile_error(const ReconcileError& err) {
    std::ostringstream oss;
    oss << "[ReconcileError] " << err.message;
    if (err.node != 0) {
        oss << " (node: " << err.node << ")";
    }
    return oss.str();
}

std::string format_layout_error(const LayoutError& err) {
    std::ostringstream oss;
    oss << "[LayoutError] " << err.message;
    if (err.node != 0) {
        oss << " (node: " << err.node << ")";
    }
    return oss.str();
}

std::string format_image_error(const ImageLoadError& err) {
    std::ostringstream oss;
    oss << "[ImageLoadError] " << err.message;
    if (!err.source.empty()) {
        oss << " (src: " << err.source << ")";
    }
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ReconcileError>) {
            oss << detail::format_reconcile_error(err);
        } else if constexpr (std::is_same_v<T, LayoutError>) {
            oss << detail::format_layout_error(err);
        } else if constexpr (std::is_same_v<T, ImageLoadError>) {
            oss << detail::format_image_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

} // namespace arbor_core
