#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

enum class ErrorKind {
    InvalidArgument,
    MissingDependency,
    BuildFailed,
    UnknownModel,
    ModelNotFound,
    ModelDownloadFailed,
    AudioConversionFailed,
    EngineInvocationFailed,
    Cancelled,
    Storage,
};

struct Error {
    ErrorKind kind;
    std::string message;
    // Captured stdout/stderr of the failing tool, verbatim.
    std::string output;
    // Missing dependencies for MissingDependency, valid names for UnknownModel.
    std::vector<std::string> names;

    std::string describe() const;
};

template <typename T>
using Result = std::expected<T, Error>;

std::string_view to_string(ErrorKind kind);

inline std::unexpected<Error> fail(ErrorKind kind, std::string message, std::string output = {}) {
    return std::unexpected(Error{kind, std::move(message), std::move(output), {}});
}
