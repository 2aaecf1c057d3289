#pragma once

#include <cstddef>
#include <sys/types.h>

namespace trafficmon {

using I8 = signed char;
using I16 = signed short;
using I32 = signed int;
using I64 = signed long long;

static_assert(sizeof(I64) == 8);

using U8 = unsigned char;
using U16 = unsigned short;
using U32 = unsigned int;
using U64 = unsigned long long;

static_assert(sizeof(U64) == 8);

using Size = size_t;
using SSize = ssize_t;

} // namespace trafficmon
