// SPDX-License-Identifier: MIT
#include "src/support/error_types.hpp"

#include <format>

namespace sash {

std::string_view to_string(ValidationErrorCode code) noexcept {
    switch (code) {
        case ValidationErrorCode::EmptyAxis: return "EmptyAxis";
        case ValidationErrorCode::UnsortedAxis: return "UnsortedAxis";
        case ValidationErrorCode::NonFiniteValue: return "NonFiniteValue";
        case ValidationErrorCode::ShapeMismatch: return "ShapeMismatch";
        case ValidationErrorCode::EmptySystem: return "EmptySystem";
        case ValidationErrorCode::DuplicateEntry: return "DuplicateEntry";
        case ValidationErrorCode::EmptyKey: return "EmptyKey";
        case ValidationErrorCode::InvalidConfiguration: return "InvalidConfiguration";
    }
    return "Unknown";
}

std::string_view to_string(TableErrorCode code) noexcept {
    switch (code) {
        case TableErrorCode::InvalidGrid: return "InvalidGrid";
        case TableErrorCode::FileNotFound: return "FileNotFound";
        case TableErrorCode::ParseFailed: return "ParseFailed";
        case TableErrorCode::SerializationFailed: return "SerializationFailed";
        case TableErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case TableErrorCode::UnsupportedFormat: return "UnsupportedFormat";
    }
    return "Unknown";
}

std::string_view to_string(ResolveErrorCode code) noexcept {
    switch (code) {
        case ResolveErrorCode::UnknownSystem: return "UnknownSystem";
        case ResolveErrorCode::InvalidDimensions: return "InvalidDimensions";
    }
    return "Unknown";
}

std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::TransportFailure: return "TransportFailure";
        case ClientErrorCode::MalformedResponse: return "MalformedResponse";
        case ClientErrorCode::UnknownSystem: return "UnknownSystem";
        case ClientErrorCode::InvalidDimensions: return "InvalidDimensions";
    }
    return "Unknown";
}

std::string describe(const ValidationError& err) {
    switch (err.code) {
        case ValidationErrorCode::EmptyAxis:
            return std::format("axis {} has no breakpoints", err.index);
        case ValidationErrorCode::UnsortedAxis:
            return std::format("axis breakpoint {} at position {} is not strictly increasing",
                               err.value, err.index);
        case ValidationErrorCode::NonFiniteValue:
            return std::format("non-finite value at position {}", err.index);
        case ValidationErrorCode::ShapeMismatch:
            return std::format("values hold {} entries where {} were expected",
                               err.index, static_cast<size_t>(err.value));
        case ValidationErrorCode::EmptySystem:
            return "system has no categories";
        case ValidationErrorCode::DuplicateEntry:
            return "entry is defined more than once";
        case ValidationErrorCode::EmptyKey:
            return "system key or category name is empty";
        case ValidationErrorCode::InvalidConfiguration:
            return std::format("invalid configuration value {}", err.value);
    }
    return "validation failed";
}

std::string describe(const TableError& err) {
    std::string out{to_string(err.code)};
    if (!err.system_key.empty()) {
        out += std::format(" [system '{}'", err.system_key);
        if (!err.category.empty()) {
            out += std::format(", category '{}'", err.category);
        }
        out += "]";
    }
    if (err.validation) {
        out += ": " + describe(*err.validation);
    }
    if (!err.detail.empty()) {
        out += ": " + err.detail;
    }
    return out;
}

std::string describe(const ResolveError& err) {
    if (err.message.empty()) {
        return std::string{to_string(err.code)};
    }
    return std::format("{}: {}", to_string(err.code), err.message);
}

std::string describe(const ClientError& err) {
    if (err.message.empty()) {
        return std::string{to_string(err.code)};
    }
    return std::format("{}: {}", to_string(err.code), err.message);
}

} // namespace sash
