#pragma once

#include "../core/types.hpp"

namespace hubCore::platform {

struct platform_info {
    const char* name;
    bool has_os_entropy;   // random bytes come from the kernel, not a seeded PRNG
};

} // namespace hubCore::platform
