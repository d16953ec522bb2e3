// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace logproof {

//! Broad classification callers can match on
enum class ErrorKind {
    kTransport,   // network or connection failure
    kProtocol,    // non-2xx HTTP status or JSON-RPC error payload
    kDecode,      // malformed response body
    kValidation,  // bad user-supplied input, value out of range, missing required field
    kDomain,      // no logs, no matching log, missing chain ID, unknown/failed job status
    kTimeout,     // polling exhausted, deadline exceeded or cancelled
};

//! Specific failure reported by an operation
enum class ErrorCode {
    // JSON-RPC layer
    kTransport,
    kHttpStatus,
    kJsonRpc,
    kMalformedResponse,
    // Blockchain resolution
    kRemoteCall,
    kNotFound,
    kNoLogs,
    kIndexOutOfRange,
    kNoMatchingLog,
    kMissingChainId,
    // Numeric conversion
    kInvalidHex,
    kOverflow,
    // Proof service
    kSubmission,
    kInvalidJobId,
    kUnknownStatus,
    kProofFailed,
    kPollingTimeout,
    kDeadlineExceeded,
    kCancelled,
    // Configuration and user input
    kInvalidArgument,
    kInvalidConfig,
};

//! Default classification of each error code
ErrorKind kind_of(ErrorCode code) noexcept;

std::string_view to_string(ErrorKind kind) noexcept;
std::string_view to_string(ErrorCode code) noexcept;

class Error : public std::runtime_error {
  public:
    Error(ErrorCode code, const std::string& message);
    Error(ErrorCode code, ErrorKind kind, const std::string& message);

    //! Wrap a lower-level error adding operation context; the kind of a wrapped Error is preserved
    static Error wrap(ErrorCode code, const std::string& context, const Error& cause);

    ErrorKind kind() const noexcept { return kind_; }
    ErrorCode code() const noexcept { return code_; }

    //! The wrapped lower-level error, if any
    const std::exception_ptr& cause() const noexcept { return cause_; }

  private:
    ErrorKind kind_;
    ErrorCode code_;
    std::exception_ptr cause_;
};

std::ostream& operator<<(std::ostream& out, ErrorKind kind);
std::ostream& operator<<(std::ostream& out, ErrorCode code);

}  // namespace logproof
