#pragma once

#include <cstddef>
#include <string>
#include <stdbool.h>
#include <stdint.h>

using u64 = uint64_t;
using i64 = int64_t;

bool is_truthy(const char* str);

// Decimal or 0x-prefixed hex, the whole string must be the number.
// Throws std::invalid_argument or std::out_of_range otherwise, negative values included
u64 get_int(const char* str);
