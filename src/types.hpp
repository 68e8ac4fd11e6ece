#ifndef TYPES_H
#define TYPES_H
#include <cstdint>

using ftype = float;
using u32 = uint32_t;

#endif
