// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>

#include "neutron/status.h"

namespace neutron {

// Converts a failure status returned by a manager into the HTTP error
// code handed back to the neutron API service:
//   BADREQUEST -> 400, CONFLICT -> 409, NOTACCEPTABLE -> 406,
//   NOTFOUND -> 404, anything else -> 500.
// The status must not be a success status; that is asserted.
int TranslateFailureStatus(const Status& status);

// Same mapping for a bare code.
int TranslateFailureStatus(StatusCode code);

std::string_view StatusCodeName(StatusCode code);

// Accepts the enumerator spelling ("NOTFOUND") and the underscored one
// ("NOT_FOUND"). Case-sensitive.
std::optional<StatusCode> ParseStatusCode(std::string_view name);

}  // namespace neutron
