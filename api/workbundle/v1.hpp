#pragma once

#include "workbundle/core/v1/bundle.pb.h"
#include "workbundle/objects/v1/objects.pb.h"

#include "workbundle/admin/v1/metrics.pb.h"

namespace workbundle::v1 {
using namespace ::workbundle::core::v1;
using namespace ::workbundle::objects::v1;
using namespace ::workbundle::admin::v1;
}
