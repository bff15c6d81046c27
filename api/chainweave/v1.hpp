#pragma once

#include "chainweave/chain/v1/chain.pb.h"
#include "config/config.pb.h"

namespace chainweave::v1 {
using namespace ::chainweave::chain::v1;
}
