#pragma once

#include <string>
#include <utility>

namespace saltline {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    InvalidHash,            // String is not (a valid instance of) the expected hash format
    SettingOutOfRange,      // Salt/rounds outside bounds and not correctable in this mode
    UnknownScheme,          // Scheme not registered / not part of the active policy
    MisconfiguredHandler,   // HandlerSpec failed self-validation or duplicate registration
    InvalidPolicy,          // Policy source has unknown keys or malformed values
    Mismatch,               // Secret does not match the hash (CLI verify)
    IoError,
    InternalError
};

/// Stable lowercase name for an error code (used in CLI output and log lines)
inline const char* errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::InvalidHash: return "invalid-hash";
        case ErrorCode::SettingOutOfRange: return "setting-out-of-range";
        case ErrorCode::UnknownScheme: return "unknown-scheme";
        case ErrorCode::MisconfiguredHandler: return "misconfigured-handler";
        case ErrorCode::InvalidPolicy: return "invalid-policy";
        case ErrorCode::Mismatch: return "mismatch";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

}
