#pragma once

#include "config/config.pb.h"
#include "optiraid/core/v1/manifest.pb.h"
#include "optiraid/core/v1/types.pb.h"

namespace optiraid::v1 {
using namespace ::optiraid::core::v1;
}
