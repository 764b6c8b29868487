#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

enum class ErrorKind {
    Workspace,   // directory creation failed
    Parse,       // malformed ledger line or WAV container
    Device,      // capture device could not be opened or read
    Index,       // ledger position out of range
    Io,          // file read/write failure
    State,       // session command issued in the wrong state
    EmptyCorpus, // corpus file has no usable line
};

struct Error {
    ErrorKind kind;
    std::string message;
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Workspace: return "WorkspaceError";
        case ErrorKind::Parse: return "ParseError";
        case ErrorKind::Device: return "DeviceError";
        case ErrorKind::Index: return "IndexError";
        case ErrorKind::Io: return "IOError";
        case ErrorKind::State: return "StateError";
        case ErrorKind::EmptyCorpus: return "EmptyCorpusError";
    }
    return "Error";
}

inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

template <typename T>
using Result = std::expected<T, Error>;
