// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <utility>

namespace neutron {

// Outcome codes reported by the managers behind the neutron handlers.
enum class StatusCode {
    SUCCESS,
    CREATED,
    BADREQUEST,
    UNAUTHORIZED,
    FORBIDDEN,
    NOTFOUND,
    NOTALLOWED,
    NOTACCEPTABLE,
    TIMEOUT,
    CONFLICT,
    GONE,
    UNSUPPORTED,
    INTERNALERROR,
    NOTIMPLEMENTED,
    NOSERVICE,
    UNDEFINED
};

// Operation result: a code plus an optional human-readable description.
class Status {
public:
    Status() = default;
    explicit Status(StatusCode code, std::string description = {})
        : code_(code), description_(std::move(description)) {}

    static Status Ok() { return Status(StatusCode::SUCCESS); }

    StatusCode code() const noexcept { return code_; }
    const std::string& description() const noexcept { return description_; }

    bool IsSuccess() const noexcept {
        return code_ == StatusCode::SUCCESS || code_ == StatusCode::CREATED;
    }

private:
    StatusCode code_{StatusCode::UNDEFINED};
    std::string description_{};
};

}  // namespace neutron
