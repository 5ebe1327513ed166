#pragma once

#include <stdexcept>
#include <string>

namespace coedit {

/**
 * Error taxonomy for the bridge and room subsystems.
 * Each failure class maps to one code; the connection layer turns codes
 * into WebSocket close codes and HTTP statuses.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    CONFIG_INVALID = 2,

    // Analysis session errors
    FRAMING_FAILED = 100,
    SPAWN_FAILED = 101,
    VALIDATION_FAILED = 102,

    // Storage errors
    ROOM_LOAD_FAILED = 200,
    HISTORY_NOT_FOUND = 201,
    MIRROR_WRITE_FAILED = 202,

    // Replication protocol errors
    PROTOCOL_DECODE_FAILED = 300,

    INTERNAL_ERROR = 500
};

class CoeditException : public std::runtime_error {
public:
    explicit CoeditException(ErrorCode code, const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    // Message without the code/context decoration, suitable for close reasons.
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "coedit error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public CoeditException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : CoeditException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class ConfigError : public CoeditException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : CoeditException(ErrorCode::CONFIG_INVALID, message, context, suggestion) {}
};

// Malformed length header, truncated body or unparseable body on a framed stream.
class FramingError : public CoeditException {
public:
    explicit FramingError(const std::string& message, const std::string& context = "")
        : CoeditException(ErrorCode::FRAMING_FAILED, message, context) {}
};

class SpawnError : public CoeditException {
public:
    explicit SpawnError(const std::string& message,
                        const std::string& context = "",
                        const std::string& suggestion = "")
        : CoeditException(ErrorCode::SPAWN_FAILED, message, context, suggestion) {}
};

// Inbound message failed the URI-shape checks; fatal to the session.
class ValidationError : public CoeditException {
public:
    explicit ValidationError(const std::string& message, const std::string& context = "")
        : CoeditException(ErrorCode::VALIDATION_FAILED, message, context) {}
};

class RoomLoadError : public CoeditException {
public:
    explicit RoomLoadError(const std::string& message, const std::string& context = "")
        : CoeditException(ErrorCode::ROOM_LOAD_FAILED, message, context) {}
};

// Raised by the update store when a room has never been persisted.
class HistoryNotFound : public CoeditException {
public:
    explicit HistoryNotFound(const std::string& message, const std::string& context = "")
        : CoeditException(ErrorCode::HISTORY_NOT_FOUND, message, context) {}
};

class MirrorWriteError : public CoeditException {
public:
    explicit MirrorWriteError(const std::string& message, const std::string& context = "")
        : CoeditException(ErrorCode::MIRROR_WRITE_FAILED, message, context) {}
};

class ProtocolError : public CoeditException {
public:
    explicit ProtocolError(const std::string& message, const std::string& context = "")
        : CoeditException(ErrorCode::PROTOCOL_DECODE_FAILED, message, context) {}
};

#define COEDIT_THROW(code, message) \
    throw coedit::CoeditException(code, message, __func__)

#define COEDIT_CHECK_ARGUMENT(condition, message) \
    do { \
        if (!(condition)) { \
            throw coedit::InvalidArgumentError(message, __func__); \
        } \
    } while (0)

} // namespace coedit
