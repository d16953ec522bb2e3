// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <magic_enum.hpp>

namespace logproof {

ErrorKind kind_of(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kTransport:
        case ErrorCode::kRemoteCall:
        case ErrorCode::kSubmission:
            return ErrorKind::kTransport;
        case ErrorCode::kHttpStatus:
        case ErrorCode::kJsonRpc:
            return ErrorKind::kProtocol;
        case ErrorCode::kMalformedResponse:
        case ErrorCode::kInvalidHex:
            return ErrorKind::kDecode;
        case ErrorCode::kIndexOutOfRange:
        case ErrorCode::kOverflow:
        case ErrorCode::kInvalidJobId:
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kInvalidConfig:
            return ErrorKind::kValidation;
        case ErrorCode::kNotFound:
        case ErrorCode::kNoLogs:
        case ErrorCode::kNoMatchingLog:
        case ErrorCode::kMissingChainId:
        case ErrorCode::kUnknownStatus:
        case ErrorCode::kProofFailed:
            return ErrorKind::kDomain;
        case ErrorCode::kPollingTimeout:
        case ErrorCode::kDeadlineExceeded:
        case ErrorCode::kCancelled:
            return ErrorKind::kTimeout;
    }
    return ErrorKind::kDomain;
}

std::string_view to_string(ErrorKind kind) noexcept {
    return magic_enum::enum_name(kind);
}

std::string_view to_string(ErrorCode code) noexcept {
    return magic_enum::enum_name(code);
}

Error::Error(ErrorCode code, const std::string& message)
    : Error{code, kind_of(code), message} {}

Error::Error(ErrorCode code, ErrorKind kind, const std::string& message)
    : std::runtime_error{message.empty() ? "Error: " + std::string{to_string(code)} : message},
      kind_{kind},
      code_{code} {}

Error Error::wrap(ErrorCode code, const std::string& context, const Error& cause) {
    Error error{code, cause.kind(), context + ": " + cause.what()};
    error.cause_ = std::make_exception_ptr(cause);
    return error;
}

std::ostream& operator<<(std::ostream& out, ErrorKind kind) {
    out << to_string(kind);
    return out;
}

std::ostream& operator<<(std::ostream& out, ErrorCode code) {
    out << to_string(code);
    return out;
}

}  // namespace logproof
