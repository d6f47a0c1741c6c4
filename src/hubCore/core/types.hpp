#pragma once

#include <cstddef>
#include <cstdint>

#include <etl/string.h>
#include <etl/string_view.h>

namespace hubCore {

// Basic integer types
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

// String types (fixed size, no dynamic allocation)
using string_view = etl::string_view;

// Time types (microseconds for precision)
using timestamp_t = u64;

}  // namespace hubCore
