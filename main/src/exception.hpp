#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    NotADirectory,
    IsADirectory,
    NotAFile,
    UnexpectedExtension,
    InvalidEntryPath,
    ArchiveFailure,
    IoFailure,
    UsageError
};

class LtarException : public std::runtime_error {
public:
    LtarException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};
