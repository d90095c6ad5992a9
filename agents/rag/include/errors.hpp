#pragma once
#include <stdexcept>
#include <string>

enum class BackendErrorKind {
    Unavailable,
    Timeout,
    InvalidResponse,
};

const char* to_string(BackendErrorKind kind);

// Failure of an external collaborator (cache, vector store, model, history).
class BackendError : public std::runtime_error {
public:
    BackendError(BackendErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    BackendErrorKind kind() const { return kind_; }

private:
    BackendErrorKind kind_;
};

class CacheError : public BackendError {
public:
    using BackendError::BackendError;
};

class RetrievalError : public BackendError {
public:
    using BackendError::BackendError;
};

class HistoryError : public BackendError {
public:
    using BackendError::BackendError;
};

class GenerationError : public BackendError {
public:
    using BackendError::BackendError;
};

enum class ConfigErrorKind {
    Invalid,
    SourceUnavailable,
};

class ConfigError : public std::runtime_error {
public:
    ConfigError(ConfigErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    ConfigErrorKind kind() const { return kind_; }

private:
    ConfigErrorKind kind_;
};

enum class ProtocolErrorKind {
    OversizedMessage,
    Malformed,
};

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ProtocolErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    ProtocolErrorKind kind() const { return kind_; }

private:
    ProtocolErrorKind kind_;
};
