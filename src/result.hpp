// =============================================================================
// Tapshot - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Errors carry an ErrorKind so a caller can tell a cycle-aborting failure from
// one that is only attached to the record.
//
// Usage:
//   Result<std::string> dump() {
//       auto r = runAdb({"exec-out", "cat", remote});
//       if (r.is_err()) return wrapError(ErrorKind::Capture, "pull hierarchy", r.error());
//       return Ok(r.value().out);
//   }
// =============================================================================

#pragma once

#include <variant>
#include <optional>
#include <string>
#include <stdexcept>
#include <type_traits>

namespace tapshot {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorKind {
    Connection,   // device bridge unreachable
    Capture,      // hierarchy dump or screenshot failed
    Resolution,   // no node matched the query
    Validation,   // missing or contradictory action parameters
    Action,       // action primitive failed (soft)
    Ledger,       // ledger read/write failed
    Internal
};

inline const char* kindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Capture:    return "capture";
        case ErrorKind::Resolution: return "resolution";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Action:     return "action";
        case ErrorKind::Ledger:     return "ledger";
        case ErrorKind::Internal:   return "internal";
    }
    return "unknown";
}

// Generic error with kind and message
struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    int code = 0;

    Error() = default;
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }
};

// "[kind] message", for logs and control-plane replies
inline std::string describe(const Error& e) {
    return std::string("[") + kindName(e.kind) + "] " + e.message;
}

// Re-labels a lower-level failure: "<context>: <cause>", keeping its code.
inline Error wrapError(ErrorKind kind, const std::string& context, const Error& cause) {
    return Error(kind, context + ": " + cause.message, cause.code);
}

// IO error (process spawn, file, network)
struct IoError : Error {
    enum class Kind {
        NotFound,
        PermissionDenied,
        ConnectionRefused,
        Timeout,
        Other
    };
    Kind io_kind = Kind::Other;

    IoError() = default;
    explicit IoError(std::string msg, Kind k = Kind::Other)
        : Error(ErrorKind::Connection, std::move(msg)), io_kind(k) {}
};

// =============================================================================
// Result<T, E>
// =============================================================================

// Thrown by value()/error() on the wrong alternative. Carries the error so a
// boundary that catches it can still report the original kind.
class BadResultAccess : public std::runtime_error {
public:
    explicit BadResultAccess(const Error& e)
        : std::runtime_error("unchecked " + std::string(kindName(e.kind)) + " error: " + e.message),
          error_(e) {}
    BadResultAccess()
        : std::runtime_error("error() called on a successful result") {}

    const Error& error() const { return error_; }

private:
    Error error_;
};

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Any E, or a type convertible to it (IoError -> Error)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return !is_ok(); }
    explicit operator bool() const { return is_ok(); }

    T& value() & { requireOk(); return std::get<0>(data_); }
    const T& value() const& { requireOk(); return std::get<0>(data_); }
    T&& value() && { requireOk(); return std::get<0>(std::move(data_)); }

    E& error() & { requireErr(); return std::get<1>(data_); }
    const E& error() const& { requireErr(); return std::get<1>(data_); }

private:
    void requireOk() const {
        if (is_err()) throw BadResultAccess(std::get<1>(data_));
    }
    void requireErr() const {
        if (is_ok()) throw BadResultAccess();
    }

    std::variant<T, E> data_;
};

// Success carries nothing; only the error alternative holds data.
template<typename E>
class Result<void, E> {
public:
    Result() = default;

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : error_(E(std::move(error))) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (error_) throw BadResultAccess(*error_);
    }

    E& error() & {
        if (!error_) throw BadResultAccess();
        return *error_;
    }
    const E& error() const& {
        if (!error_) throw BadResultAccess();
        return *error_;
    }

private:
    std::optional<E> error_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T, typename E = Error>
Result<T, E> Err(E error) {
    return Result<T, E>(std::move(error));
}

template<typename T>
Result<T, Error> Err(ErrorKind kind, std::string message) {
    return Result<T, Error>(Error(kind, std::move(message)));
}

// =============================================================================
// Macros for Early Return
// =============================================================================

// Unwrap result or return its error from the enclosing function.
// Usage: auto xml = TAPSHOT_TRY(bridge.dumpHierarchy());
#define TAPSHOT_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

} // namespace tapshot
