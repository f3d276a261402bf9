#pragma once

#include "flotilla/core/v1/types.pb.h"

#include "flotilla/bus/v1/bus.pb.h"

#include "flotilla/services/v1/controller_service.pb.h"
#include "flotilla/services/v1/drone_bus_service.pb.h"

#include "flotilla/services/v1/controller_service.grpc.pb.h"
#include "flotilla/services/v1/drone_bus_service.grpc.pb.h"

namespace flotilla::v1 {
using namespace ::flotilla::core::v1;
using namespace ::flotilla::bus::v1;
using namespace ::flotilla::services::v1;
}
