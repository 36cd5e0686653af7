#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for gravwell_core module

#include <cstdint>

namespace gravwell_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct HandleError;
struct PhysicsError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Handle Types
// =============================================================================

template<typename T>
struct Handle;

template<typename T>
class HandleAllocator;

template<typename T>
class HandleMap;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace gravwell_core
