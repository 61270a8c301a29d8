// SPDX-License-Identifier: Apache-2.0
// Copyright 2017-2018 Peter A. Bigot

#include <rp2040cxx/regmap.hpp>

namespace rp2040cxx {
namespace regmap {

int
wait_until (bus& rb,
            address_type addr,
            uint32_t mask,
            unsigned int max_iterations)
{
  for (unsigned int i = 0; i < max_iterations; ++i) {
    if (mask & rb.read(addr)) {
      return 0;
    }
  }
  return error_encoded(ErrorCode::PERIPHERAL_TIMEOUT);
}

} // namespace regmap
} // namespace rp2040cxx
