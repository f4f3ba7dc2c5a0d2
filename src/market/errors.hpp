#pragma once

#include <stdexcept>
#include <string>

namespace market {

enum class ErrorKind { Transport, Schema, Parse };

inline const char* error_kind_label(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::Schema:
        return "schema";
    case ErrorKind::Parse:
        return "parse";
    }
    return "unknown";
}

class FetchError : public std::runtime_error {
public:
    FetchError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// network or HTTP status failure
class TransportError : public FetchError {
public:
    explicit TransportError(const std::string& message)
        : FetchError(ErrorKind::Transport, message)
    {
    }
};

// unexpected shape: column count, missing envelope, empty batch
class SchemaError : public FetchError {
public:
    explicit SchemaError(const std::string& message)
        : FetchError(ErrorKind::Schema, message)
    {
    }
};

// unparsable date, number or timestamp
class ParseError : public FetchError {
public:
    explicit ParseError(const std::string& message)
        : FetchError(ErrorKind::Parse, message)
    {
    }
};

} // namespace market
