#pragma once

#include <string>

#include <grpcpp/grpcpp.h>

namespace tender::grpc {

// Request metadata header carrying the caller identity.
inline constexpr const char* kCallerMetadataKey = "x-tender-caller";

// Empty when the header is absent; authorization rejects empty callers.
std::string CallerFromContext(const ::grpc::ServerContext* context);

} // namespace tender::grpc
