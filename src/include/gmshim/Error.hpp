#pragma once

#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace gmshim {

enum class ErrorKind {
    kCommandNotFound,     // "command not found": gm binary missing
    kFileNotFound,        // "No such file": input file missing
    kNoImageReturned,     // "Request did not return an image"
    kUnableToOpen,        // "unable to open image"
    kUnclassified,        // Any other non-empty output, kept in detail
    kMalformedMetadata,   // identify -format output couldn't be parsed
    kUnboundPlaceholder,  // A :name placeholder was left without a value
    kSpawnFailed,         // The shell couldn't be started or read
};

[[nodiscard]] std::string_view toString(ErrorKind kind);

struct Error {
    ErrorKind kind;
    // Raw output for kUnclassified, diagnostic text for the others.
    std::string detail;

    Error(ErrorKind k) : kind(k) {}  // NOLINT(google-explicit-constructor)
    Error(ErrorKind k, std::string d) : kind(k), detail(std::move(d)) {}

    bool operator==(const Error& other) const = default;
    bool operator==(const ErrorKind other) const { return kind == other; }
};

// Result of a command that only reports success or failure.
using CommandResult = std::expected<void, Error>;

template <typename T>
using Result = std::expected<T, Error>;

inline std::ostream& operator<<(std::ostream& os, const ErrorKind kind) {
    return os << toString(kind);
}

inline std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << error.kind;
    if (!error.detail.empty()) {
        os << ": " << error.detail;
    }
    return os;
}

}  // namespace gmshim
