// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace neutron::http {

// Error codes returned to the neutron API service.
inline constexpr int kBadRequest = 400;
inline constexpr int kNotFound = 404;
inline constexpr int kNotAcceptable = 406;
inline constexpr int kConflict = 409;
inline constexpr int kInternalError = 500;

}  // namespace neutron::http
