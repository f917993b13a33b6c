#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>
#include <mailbridge/defs.h>

namespace mailbridge {

using errno_t = int;

/**
 * %HEX2BIN_EMPTY:	return empty string on unrecognized input character
 * %HEX2BIN_STOP:	return partial string on unrecognized input character
 * %HEX2BIN_SKIP:	skip over unrecognized input characters
 */
enum hex2bin_mode {
	HEX2BIN_EMPTY, HEX2BIN_STOP, HEX2BIN_SKIP,
};

extern MB_EXPORT void mlog_init(const char *file, unsigned int level);
extern MB_EXPORT void mlog(unsigned int level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));
extern MB_EXPORT bool parse_bool(const char *s);
extern MB_EXPORT std::string bin2hex(const void *, size_t);
inline std::string bin2hex(std::string_view s) { return bin2hex(s.data(), s.size()); }
extern MB_EXPORT std::string hex2bin(std::string_view, hex2bin_mode = HEX2BIN_EMPTY);
extern MB_EXPORT std::vector<std::string> gx_split(const std::string_view &, char sep);
extern MB_EXPORT std::string_view strtrim(std::string_view);
extern MB_EXPORT bool str_icase_equal(std::string_view, std::string_view);
extern MB_EXPORT bool str_icase_contains(std::string_view haystack, std::string_view needle);
extern MB_EXPORT errno_t read_file_by_name(const char *file, std::string &out);
extern MB_EXPORT errno_t write_file_by_name(const char *file, std::string_view);
extern MB_EXPORT std::string safe_basename(std::string_view, unsigned int index);
extern MB_EXPORT std::string randstring(size_t len);

/* local-time rendering as used in summary records */
extern MB_EXPORT std::string localtime_str(time_t, const char *fmt = "%Y-%m-%d %H:%M:%S");
extern MB_EXPORT std::string iso8601_str(time_t, int tz_minutes = 0);
extern MB_EXPORT int parse_localtime(const char *, time_t *);

}
