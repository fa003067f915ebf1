#pragma once

#include "sortfeed/config.hh"

#ifndef SORTFEED_ENABLE_ASSERTIONS

#  define SORTFEED_ASSERT(unused) static_cast<void>(0)

#else // SORTFEED_ENABLE_ASSERTIONS

#  include <cstdio>
#  include <cstdlib>

#  define SORTFEED_ASSERT(stmt)                                                \
    if (static_cast<bool>(stmt) == false) {                                    \
      printf("%s:%u: requirement failed '%s'\n", __FILE__, __LINE__, #stmt);  \
      ::abort();                                                               \
    }                                                                          \
    static_cast<void>(0)

#endif // SORTFEED_ENABLE_ASSERTIONS
