// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <grpcpp/support/status.h>

#include "neutron/status.h"

namespace neutron {

// Adapts the status of a gRPC-backed storage call. The gRPC error
// message becomes the description.
Status FromGrpcStatus(const grpc::Status& status);

// TranslateFailureStatus applied to the adapted status.
int TranslateFailureStatus(const grpc::Status& status);

}  // namespace neutron
