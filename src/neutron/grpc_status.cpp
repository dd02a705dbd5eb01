// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#include "neutron/grpc_status.h"

#include "neutron/status_translator.h"

namespace neutron {

Status FromGrpcStatus(const grpc::Status& status) {
    StatusCode code = StatusCode::UNDEFINED;
    switch (status.error_code()) {
        case grpc::StatusCode::OK:
            code = StatusCode::SUCCESS;
            break;
        case grpc::StatusCode::INVALID_ARGUMENT:
        case grpc::StatusCode::OUT_OF_RANGE:
            code = StatusCode::BADREQUEST;
            break;
        case grpc::StatusCode::NOT_FOUND:
            code = StatusCode::NOTFOUND;
            break;
        case grpc::StatusCode::ALREADY_EXISTS:
        case grpc::StatusCode::ABORTED:
            code = StatusCode::CONFLICT;
            break;
        case grpc::StatusCode::FAILED_PRECONDITION:
            code = StatusCode::NOTACCEPTABLE;
            break;
        case grpc::StatusCode::PERMISSION_DENIED:
            code = StatusCode::FORBIDDEN;
            break;
        case grpc::StatusCode::UNAUTHENTICATED:
            code = StatusCode::UNAUTHORIZED;
            break;
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            code = StatusCode::TIMEOUT;
            break;
        case grpc::StatusCode::UNIMPLEMENTED:
            code = StatusCode::NOTIMPLEMENTED;
            break;
        case grpc::StatusCode::UNAVAILABLE:
            code = StatusCode::NOSERVICE;
            break;
        case grpc::StatusCode::INTERNAL:
        case grpc::StatusCode::DATA_LOSS:
            code = StatusCode::INTERNALERROR;
            break;
        default:
            code = StatusCode::UNDEFINED;
            break;
    }
    return Status(code, status.error_message());
}

int TranslateFailureStatus(const grpc::Status& status) {
    return TranslateFailureStatus(FromGrpcStatus(status));
}

}  // namespace neutron
