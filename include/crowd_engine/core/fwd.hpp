#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for crowd_core module

#include <cstdint>

namespace crowd_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct TemplateError;
struct BackendError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace crowd_core
