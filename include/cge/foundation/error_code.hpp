#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the cultivation engine.

#include <cstdint>
#include <string_view>

namespace cge::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    OutOfRange = 0x0004,

    // Gameplay (0x0100 - 0x01FF)
    InsufficientResource = 0x0100,
    InvalidPhase = 0x0101,
    UnknownAction = 0x0102,
    SessionNotStarted = 0x0103,

    // Config (0x0200 - 0x02FF)
    ConfigLoadFailed = 0x0200,
    ConfigKeyNotFound = 0x0201,
    ConfigTypeMismatch = 0x0202,
    ConfigInvalidValue = 0x0203,

    // Logger (0x0300 - 0x03FF)
    LoggerError = 0x0300,
    LoggerFlushFailed = 0x0301,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Gameplay";
        case 0x0200: return "Config";
        case 0x0300: return "Logger";
        default: return "Unknown";
    }
}

/// Return the symbolic name of an error code (used in log lines).
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:              return "Success";
        case ErrorCode::Unknown:              return "Unknown";
        case ErrorCode::InvalidArgument:      return "InvalidArgument";
        case ErrorCode::NotFound:             return "NotFound";
        case ErrorCode::OutOfRange:           return "OutOfRange";
        case ErrorCode::InsufficientResource: return "InsufficientResource";
        case ErrorCode::InvalidPhase:         return "InvalidPhase";
        case ErrorCode::UnknownAction:        return "UnknownAction";
        case ErrorCode::SessionNotStarted:    return "SessionNotStarted";
        case ErrorCode::ConfigLoadFailed:     return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound:    return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch:   return "ConfigTypeMismatch";
        case ErrorCode::ConfigInvalidValue:   return "ConfigInvalidValue";
        case ErrorCode::LoggerError:          return "LoggerError";
        case ErrorCode::LoggerFlushFailed:    return "LoggerFlushFailed";
    }
    return "Unknown";
}

} // namespace cge::foundation
