#pragma once

#include "codeintel/checkpoint/v1/checkpoint.pb.h"
#include "codeintel/graph/v1/code_block.pb.h"

namespace codeintel::v1 {
using namespace ::codeintel::graph::v1;
using namespace ::codeintel::checkpoint::v1;
}
