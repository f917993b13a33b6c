#pragma once
#include <cstdint>
#include <ctime>
#include <mailbridge/defs.h>

/* seconds between 1601-01-01 and 1970-01-01 */
#define TIME_FIXUP_CONSTANT_INT 11644473600LL

extern MB_EXPORT uint64_t rop_util_unix_to_nttime(time_t);
extern MB_EXPORT time_t rop_util_nttime_to_unix(uint64_t);
extern MB_EXPORT uint64_t rop_util_current_nttime();
