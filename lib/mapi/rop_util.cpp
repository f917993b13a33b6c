// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cstdint>
#include <ctime>
#include <limits>
#include <mailbridge/rop_util.hpp>

uint64_t rop_util_unix_to_nttime(time_t unix_time)
{
	auto w = static_cast<int64_t>(unix_time) + TIME_FIXUP_CONSTANT_INT;
	if (w < 0)
		return 0;
	uint64_t v = w;
	if (v > INT64_MAX / 10000000)
		return UINT64_MAX;
	return v * 10000000;
}

time_t rop_util_nttime_to_unix(uint64_t nt_time)
{
	/* After division by >=2, the value will fit in the range for signed int64 */
	int64_t unix_time = nt_time / 10000000;
	unix_time -= TIME_FIXUP_CONSTANT_INT;
	auto min = std::numeric_limits<time_t>::min();
	auto max = std::numeric_limits<time_t>::max();
	if (unix_time < min)
		return min;
	if (unix_time > max)
		return max;
	return unix_time;
}

uint64_t rop_util_current_nttime()
{
	struct timespec ts;
	clock_gettime(CLOCK_REALTIME, &ts);
	return rop_util_unix_to_nttime(ts.tv_sec) + ts.tv_nsec / 100;
}
