#pragma once

#include <stdexcept>
#include <string>

namespace stylepatch {

enum class ErrorKind {
    MalformedHeader,
    TruncatedData,
    InvalidEncoding,
    EntryNotFound,
    NonTextEntry,
    AnchorNotFound,
    AmbiguousAnchor,
    PayloadEscapeViolation,
    Io,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedHeader: return "MalformedHeader";
        case ErrorKind::TruncatedData: return "TruncatedData";
        case ErrorKind::InvalidEncoding: return "InvalidEncoding";
        case ErrorKind::EntryNotFound: return "EntryNotFound";
        case ErrorKind::NonTextEntry: return "NonTextEntry";
        case ErrorKind::AnchorNotFound: return "AnchorNotFound";
        case ErrorKind::AmbiguousAnchor: return "AmbiguousAnchor";
        case ErrorKind::PayloadEscapeViolation: return "PayloadEscapeViolation";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

// Thrown by the archive codec, the injection engine and the file store.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace stylepatch
