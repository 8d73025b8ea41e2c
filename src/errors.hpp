#pragma once

#include <optional>
#include <string>
#include <utility>

namespace PakForge {

// Stable failure categories surfaced to callers. The names returned by
// errorKindName() are part of the command line output and must not change.
enum class ErrorKind {
    None,
    InvalidInput,
    SourceExhausted,
    CorruptArtifact,
    ToolMissing,
    ToolFailed,
    ArtifactNotFound,
    PatchNotApplied,
    ConflictUnresolved,
    ReplaceFailed,
    Cancelled
};

const char* errorKindName(ErrorKind kind);

// Short actionable guidance for a user-facing front end
const char* errorKindHint(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

// Outcome of an operation that produces no value
class Status {
public:
    Status() = default;

    static Status success() { return Status(); }
    static Status failure(ErrorKind kind, std::string message) {
        Status s;
        s.m_error.kind = kind;
        s.m_error.message = std::move(message);
        return s;
    }
    static Status failure(const Error& error) { return failure(error.kind, error.message); }

    bool ok() const { return m_error.kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    ErrorKind kind() const { return m_error.kind; }
    const std::string& message() const { return m_error.message; }
    const Error& error() const { return m_error; }

private:
    Error m_error;
};

// Either a value or an Error. Pipeline stages return this instead of throwing.
template<typename T>
class Result {
public:
    static Result success(T value) {
        Result r;
        r.m_value = std::move(value);
        return r;
    }
    static Result failure(ErrorKind kind, std::string message) {
        Result r;
        r.m_error.kind = kind;
        r.m_error.message = std::move(message);
        return r;
    }
    static Result failure(const Error& error) { return failure(error.kind, error.message); }
    static Result failure(const Status& status) { return failure(status.error()); }

    bool ok() const { return m_value.has_value(); }
    explicit operator bool() const { return ok(); }

    T& value() { return *m_value; }
    const T& value() const { return *m_value; }
    T* operator->() { return &*m_value; }
    const T* operator->() const { return &*m_value; }

    ErrorKind kind() const { return m_error.kind; }
    const std::string& message() const { return m_error.message; }
    const Error& error() const { return m_error; }
    Status status() const { return ok() ? Status::success() : Status::failure(m_error); }

private:
    Result() = default;

    std::optional<T> m_value;
    Error m_error;
};

} // namespace PakForge
