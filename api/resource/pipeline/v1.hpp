#pragma once

#include "resource/pipeline/core/v1/id.pb.h"
#include "resource/pipeline/core/v1/types.pb.h"

#include "resource/pipeline/wire/v1/messages.pb.h"

namespace resource::pipeline::v1 {
using namespace ::resource::pipeline::core::v1;
using namespace ::resource::pipeline::wire::v1;
}
