#pragma once

#include "workbundle/v1.hpp"

#include "workbundle/services/v1/bundle_store_service.pb.h"
#include "workbundle/services/v1/bundle_store_service.grpc.pb.h"

namespace workbundle::v1 {
using namespace ::workbundle::services::v1;
}
