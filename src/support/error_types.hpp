// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace sash {

/// Error codes for dataset integrity and configuration validation failures
enum class ValidationErrorCode {
    EmptyAxis,
    UnsortedAxis,
    NonFiniteValue,
    ShapeMismatch,
    EmptySystem,
    DuplicateEntry,
    EmptyKey,
    InvalidConfiguration
};

/// Detailed validation error
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The offending value (0 if not applicable)
    size_t index;  // Axis position or flat value index (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                    double value = 0.0,
                    size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Error codes for coefficient table loading and persistence
enum class TableErrorCode {
    InvalidGrid,
    FileNotFound,
    ParseFailed,
    SerializationFailed,
    ChecksumMismatch,
    UnsupportedFormat
};

/// Table load/store failure. Names the offending entry when one is known.
struct TableError {
    TableErrorCode code;
    std::string system_key;
    std::string category;
    std::optional<ValidationError> validation;
    std::string detail;
};

/// Per-request resolution failures
enum class ResolveErrorCode {
    UnknownSystem,
    InvalidDimensions
};

struct ResolveError {
    ResolveErrorCode code;
    double value = 0.0;   ///< Offending dimension for InvalidDimensions
    std::string message;
};

/// Failures surfaced to a ResolutionClient caller through on_error.
/// Cancellation is deliberately absent: cancelled calls deliver nothing.
enum class ClientErrorCode {
    TransportFailure,
    MalformedResponse,
    UnknownSystem,
    InvalidDimensions
};

struct ClientError {
    ClientErrorCode code;
    std::string message;
};

// ============================================================================
// Names and descriptions
// ============================================================================

std::string_view to_string(ValidationErrorCode code) noexcept;
std::string_view to_string(TableErrorCode code) noexcept;
std::string_view to_string(ResolveErrorCode code) noexcept;
std::string_view to_string(ClientErrorCode code) noexcept;

/// One-line human readable description
std::string describe(const ValidationError& err);
std::string describe(const TableError& err);
std::string describe(const ResolveError& err);
std::string describe(const ClientError& err);

/// Map a server-side resolution failure onto the client taxonomy
inline ClientError to_client_error(const ResolveError& err) {
    switch (err.code) {
        case ResolveErrorCode::UnknownSystem:
            return ClientError{ClientErrorCode::UnknownSystem, err.message};
        case ResolveErrorCode::InvalidDimensions:
            return ClientError{ClientErrorCode::InvalidDimensions, err.message};
    }
    return ClientError{ClientErrorCode::TransportFailure, err.message};
}

inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const TableError& err) {
    os << "TableError{code=" << to_string(err.code);
    if (!err.system_key.empty()) os << ", system=" << err.system_key;
    if (!err.category.empty()) os << ", category=" << err.category;
    if (err.validation) os << ", " << *err.validation;
    os << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const ResolveError& err) {
    os << "ResolveError{code=" << to_string(err.code)
       << ", value=" << err.value << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const ClientError& err) {
    os << "ClientError{code=" << to_string(err.code)
       << ", message=" << err.message << "}";
    return os;
}

} // namespace sash
