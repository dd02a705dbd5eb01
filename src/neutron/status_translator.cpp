// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#include "neutron/status_translator.h"

#include <array>
#include <cassert>
#include <utility>

#include "neutron/http_status.h"
#include "neutron/logging.h"

namespace neutron {

namespace {

constexpr std::array<std::pair<std::string_view, StatusCode>, 16> kStatusNames{{
    {"SUCCESS", StatusCode::SUCCESS},
    {"CREATED", StatusCode::CREATED},
    {"BADREQUEST", StatusCode::BADREQUEST},
    {"UNAUTHORIZED", StatusCode::UNAUTHORIZED},
    {"FORBIDDEN", StatusCode::FORBIDDEN},
    {"NOTFOUND", StatusCode::NOTFOUND},
    {"NOTALLOWED", StatusCode::NOTALLOWED},
    {"NOTACCEPTABLE", StatusCode::NOTACCEPTABLE},
    {"TIMEOUT", StatusCode::TIMEOUT},
    {"CONFLICT", StatusCode::CONFLICT},
    {"GONE", StatusCode::GONE},
    {"UNSUPPORTED", StatusCode::UNSUPPORTED},
    {"INTERNALERROR", StatusCode::INTERNALERROR},
    {"NOTIMPLEMENTED", StatusCode::NOTIMPLEMENTED},
    {"NOSERVICE", StatusCode::NOSERVICE},
    {"UNDEFINED", StatusCode::UNDEFINED},
}};

constexpr std::array<std::pair<std::string_view, StatusCode>, 7> kUnderscoredNames{{
    {"BAD_REQUEST", StatusCode::BADREQUEST},
    {"NOT_FOUND", StatusCode::NOTFOUND},
    {"NOT_ALLOWED", StatusCode::NOTALLOWED},
    {"NOT_ACCEPTABLE", StatusCode::NOTACCEPTABLE},
    {"INTERNAL_ERROR", StatusCode::INTERNALERROR},
    {"NOT_IMPLEMENTED", StatusCode::NOTIMPLEMENTED},
    {"NO_SERVICE", StatusCode::NOSERVICE},
}};

}  // namespace

int TranslateFailureStatus(const Status& status) {
    assert(!status.IsSuccess());

    Logger()->debug("Exception code - {}, description - {}",
                    StatusCodeName(status.code()), status.description());

    return TranslateFailureStatus(status.code());
}

int TranslateFailureStatus(StatusCode code) {
    switch (code) {
        case StatusCode::BADREQUEST:    return http::kBadRequest;
        case StatusCode::CONFLICT:      return http::kConflict;
        case StatusCode::NOTACCEPTABLE: return http::kNotAcceptable;
        case StatusCode::NOTFOUND:      return http::kNotFound;
        default:                        return http::kInternalError;
    }
}

std::string_view StatusCodeName(StatusCode code) {
    for (const auto& [name, value] : kStatusNames) {
        if (value == code) {
            return name;
        }
    }
    return "UNKNOWN";
}

std::optional<StatusCode> ParseStatusCode(std::string_view name) {
    for (const auto& [spelling, value] : kStatusNames) {
        if (spelling == name) {
            return value;
        }
    }
    for (const auto& [spelling, value] : kUnderscoredNames) {
        if (spelling == name) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace neutron
