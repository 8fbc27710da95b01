/// @file error.cpp
/// @brief Error formatting for crowd_core

#include <crowd_engine/core/error.hpp>
#include <sstream>
#include <vector>

namespace crowd_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_template_error(const TemplateError& err) {
    std::ostringstream oss;
    oss << "[TemplateError] " << err.message;
    if (!err.node_id.empty()) {
        oss << " (node: " << err.node_id << ")";
    }
    return oss.str();
}

std::string format_backend_error(const BackendError& err) {
    std::ostringstream oss;
    oss << "[BackendError] " << err.message;
    if (!err.operation.empty()) {
        oss << " (operation: " << err.operation << ")";
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
        } else if constexpr (std::is_same_v<T, TemplateError>) {
            oss << detail::format_template_error(err);
        } else if constexpr (std::is_same_v<T, BackendError>) {
            oss << detail::format_backend_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace crowd_core
