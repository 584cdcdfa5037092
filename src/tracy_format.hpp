#pragma once

#ifdef TRACY_ENABLE

#include <stdio.h>
#include <algorithm>
#include <cz/assert.hpp>

/// Format a message into a stack buffer `var` of size `len` for `TracyMessage`.
/// `len_out` is declared with the length of the message.
#define TracyFormat(var, len_out, len, fmt, ...)         \
    char var[len];                                       \
    int len_out = snprintf(var, len, fmt, __VA_ARGS__);  \
    CZ_ASSERT(len_out >= 0);                             \
    len_out = std::min(len_out, (int)(sizeof(var) - 1));

#else

#define TracyFormat(var, len_out, len, fmt, ...)

#endif
