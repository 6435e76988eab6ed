#pragma once

#include "hosting/v1/provisioning.pb.h"
#include "hosting/v1/provisioning_service.pb.h"
#include "hosting/v1/provisioning_service.grpc.pb.h"

namespace hosting::v1 {

constexpr const char* kHttpPullIngestProtocol = "urn:3gpp:5gms:content-protocol:http-pull-ingest";

} // namespace hosting::v1
