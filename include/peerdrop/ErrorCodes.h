/**
 * @file ErrorCodes.h
 * @brief Error taxonomy and stable, user-visible error codes.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

#include <cstdint>
#include <string>

namespace PeerDrop {

/**
 * @brief Failure categories reported by the transfer protocol and the store
 */
enum class ErrorKind : uint8_t {
    NONE = 0,
    NO_ACTIVE_CHANNEL,    ///< Operation needs an open channel
    NO_FILES_SELECTED,    ///< Transfer started with an empty file set
    CHANNEL_ERROR,        ///< Transport failure, never retried
    PROTOCOL_VIOLATION,   ///< Malformed or out-of-order envelope
    INCOMPLETE_TRANSFER,  ///< Assembly attempted with missing chunks
    STORE_IO_ERROR,       ///< Durable tier unavailable or failed
    INVALID_STATE,        ///< Operation not valid in the current session state
    INVALID_ARGUMENT      ///< Caller-supplied input rejected
};

namespace ErrorCodes {

inline constexpr const char* NO_ACTIVE_CHANNEL = "PD-XFER-1000";
inline constexpr const char* NO_FILES_SELECTED = "PD-XFER-1001";
inline constexpr const char* INVALID_STATE = "PD-XFER-1002";
inline constexpr const char* CHANNEL_ERROR = "PD-CHAN-1100";
inline constexpr const char* PROTOCOL_VIOLATION = "PD-PROTO-1200";
inline constexpr const char* INCOMPLETE_TRANSFER = "PD-PROTO-1201";
inline constexpr const char* STORE_IO_ERROR = "PD-STORE-1300";
inline constexpr const char* INVALID_ARGUMENT = "PD-ARG-1400";

}  // namespace ErrorCodes

/**
 * @brief Map an ErrorKind to its stable code string
 * @return Code such as "PD-XFER-1000", or empty for ErrorKind::NONE
 */
inline const char* errorKindToCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NO_ACTIVE_CHANNEL:   return ErrorCodes::NO_ACTIVE_CHANNEL;
        case ErrorKind::NO_FILES_SELECTED:   return ErrorCodes::NO_FILES_SELECTED;
        case ErrorKind::CHANNEL_ERROR:       return ErrorCodes::CHANNEL_ERROR;
        case ErrorKind::PROTOCOL_VIOLATION:  return ErrorCodes::PROTOCOL_VIOLATION;
        case ErrorKind::INCOMPLETE_TRANSFER: return ErrorCodes::INCOMPLETE_TRANSFER;
        case ErrorKind::STORE_IO_ERROR:      return ErrorCodes::STORE_IO_ERROR;
        case ErrorKind::INVALID_STATE:       return ErrorCodes::INVALID_STATE;
        case ErrorKind::INVALID_ARGUMENT:    return ErrorCodes::INVALID_ARGUMENT;
        case ErrorKind::NONE:
        default:                             return "";
    }
}

/**
 * @brief Human-readable name of an ErrorKind
 */
inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                return "None";
        case ErrorKind::NO_ACTIVE_CHANNEL:   return "NoActiveChannel";
        case ErrorKind::NO_FILES_SELECTED:   return "NoFilesSelected";
        case ErrorKind::CHANNEL_ERROR:       return "ChannelError";
        case ErrorKind::PROTOCOL_VIOLATION:  return "ProtocolViolation";
        case ErrorKind::INCOMPLETE_TRANSFER: return "IncompleteTransfer";
        case ErrorKind::STORE_IO_ERROR:      return "StoreIOError";
        case ErrorKind::INVALID_STATE:       return "InvalidState";
        case ErrorKind::INVALID_ARGUMENT:    return "InvalidArgument";
        default:                             return "Unknown";
    }
}

/**
 * @brief Error output parameter filled by failing operations
 *
 * Operations return bool and describe the failure here, the same way the
 * transfer code reports through an errorMsg out-parameter.
 */
struct ErrorInfo {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;

    void set(ErrorKind k, const std::string& msg) {
        kind = k;
        message = msg;
    }

    void clear() {
        kind = ErrorKind::NONE;
        message.clear();
    }

    bool hasError() const { return kind != ErrorKind::NONE; }

    /**
     * @brief Render as "CODE (Name): message"
     */
    std::string toString() const {
        if (kind == ErrorKind::NONE) {
            return message;
        }
        return std::string(errorKindToCode(kind)) + " (" + errorKindToString(kind) + "): " + message;
    }
};

}  // namespace PeerDrop
