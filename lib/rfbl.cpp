// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <algorithm>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <syslog.h>
#include <unistd.h>
#include <libHX/ctype_helper.h>
#include <libHX/io.h>
#include <libHX/string.h>
#include <sys/stat.h>
#include <mailbridge/fileio.h>
#include <mailbridge/util.hpp>

using namespace std::string_literals;

namespace mailbridge {

static unsigned int g_max_loglevel = LV_NOTICE;
static std::mutex g_log_mutex;
static std::unique_ptr<FILE, file_deleter> g_logfp;
static bool g_log_tty, g_log_syslog;

bool parse_bool(const char *s)
{
	if (s == nullptr)
		return false;
	char *end = nullptr;
	if (strtoul(s, &end, 0) == 0 && *end == '\0')
		return false;
	if (strcasecmp(s, "no") == 0 || strcasecmp(s, "off") == 0 ||
	    strcasecmp(s, "false") == 0)
		return false;
	return true;
}

std::string bin2hex(const void *vin, size_t len)
{
	std::string buffer;
	if (vin == nullptr)
		return buffer;
	static constexpr char digits[] = "0123456789abcdef";
	auto input = static_cast<const unsigned char *>(vin);
	buffer.resize(len * 2);
	for (size_t j = 0; len-- > 0; j += 2) {
		buffer[j]   = digits[(*input >> 4) & 0x0F];
		buffer[j+1] = digits[*input & 0x0F];
		++input;
	}
	return buffer;
}

static int hexval(unsigned char c)
{
	c = HX_tolower(c);
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	return -1;
}

std::string hex2bin(std::string_view input, hex2bin_mode onbad)
{
	std::string buf;
	buf.reserve(input.size() / 2);
	int hi = -1;
	for (auto c : input) {
		auto v = hexval(c);
		if (v < 0) {
			if (onbad == HEX2BIN_SKIP)
				continue;
			if (onbad == HEX2BIN_STOP)
				return buf;
			return {};
		}
		if (hi < 0) {
			hi = v;
			continue;
		}
		buf += static_cast<char>((hi << 4) | v);
		hi = -1;
	}
	if (hi >= 0 && onbad == HEX2BIN_EMPTY)
		/* odd number of digits */
		return {};
	return buf;
}

std::vector<std::string> gx_split(const std::string_view &sv, char sep)
{
	size_t start = 0, pos;
	std::vector<std::string> out;
	while ((pos = sv.find(sep, start)) != sv.npos) {
		out.push_back(std::string(sv.substr(start, pos - start)));
		start = pos + 1;
	}
	out.push_back(std::string(sv.substr(start)));
	return out;
}

std::string_view strtrim(std::string_view s)
{
	while (s.size() > 0 && HX_isspace(s.front()))
		s.remove_prefix(1);
	while (s.size() > 0 && HX_isspace(s.back()))
		s.remove_suffix(1);
	return s;
}

bool str_icase_equal(std::string_view a, std::string_view b)
{
	if (a.size() != b.size())
		return false;
	for (size_t i = 0; i < a.size(); ++i)
		if (HX_tolower(a[i]) != HX_tolower(b[i]))
			return false;
	return true;
}

bool str_icase_contains(std::string_view h, std::string_view n)
{
	if (n.empty())
		return true;
	for (size_t i = 0; i + n.size() <= h.size(); ++i)
		if (str_icase_equal(h.substr(i, n.size()), n))
			return true;
	return false;
}

errno_t read_file_by_name(const char *file, std::string &out) try
{
	size_t len = 0;
	std::unique_ptr<char[], stdlib_delete> buf(HX_slurp_file(file, &len));
	if (buf == nullptr)
		return errno;
	out.assign(buf.get(), len);
	return 0;
} catch (const std::bad_alloc &) {
	return ENOMEM;
}

errno_t write_file_by_name(const char *file, std::string_view data)
{
	std::unique_ptr<FILE, file_deleter> fp(fopen(file, "w"));
	if (fp == nullptr)
		return errno;
	if (data.size() > 0 && fwrite(data.data(), data.size(), 1, fp.get()) != 1)
		return EIO;
	if (fflush(fp.get()) != 0)
		return errno;
	return 0;
}

/**
 * Reduce an attachment name to a plain file name that cannot leave the
 * target directory. @index is used for the substitute name (1-based).
 */
std::string safe_basename(std::string_view raw, unsigned int index)
{
	std::string name(raw);
	for (auto &c : name)
		if (c == '\\')
			c = '/';
	auto pos = name.rfind('/');
	if (pos != name.npos)
		name.erase(0, pos + 1);
	name.erase(std::remove_if(name.begin(), name.end(),
		[](char c) { return c == '\0' || c == '\n' || c == '\r'; }), name.end());
	if (name.empty() || name == "." || name == "..")
		name = "attachment_" + std::to_string(index);
	return name;
}

std::string randstring(size_t len)
{
	static constexpr char alpha[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
	thread_local std::mt19937 rng{std::random_device{}()};
	std::uniform_int_distribution<size_t> dist(0, sizeof(alpha) - 2);
	std::string s;
	s.resize(len);
	for (auto &c : s)
		c = alpha[dist(rng)];
	return s;
}

std::string localtime_str(time_t t, const char *fmt)
{
	struct tm tm{};
	char buf[64];
	localtime_r(&t, &tm);
	strftime(buf, std::size(buf), fmt, &tm);
	return buf;
}

/**
 * @tz_minutes:	offset east of UTC that @t should be rendered in
 */
std::string iso8601_str(time_t t, int tz_minutes)
{
	struct tm tm{};
	char buf[64];
	time_t lt = t + tz_minutes * 60;
	gmtime_r(&lt, &tm);
	strftime(buf, std::size(buf), "%FT%T", &tm);
	std::string s = buf;
	auto a = tz_minutes < 0 ? -tz_minutes : tz_minutes;
	snprintf(buf, std::size(buf), "%c%02d:%02d", tz_minutes < 0 ? '-' : '+',
	         a / 60, a % 60);
	return s + buf;
}

/**
 * Accepts a unix timestamp or "YYYY-MM-DD[ HH:MM:SS]" in local time.
 */
int parse_localtime(const char *str, time_t *out)
{
	char *end = nullptr;
	auto v = strtoll(str, &end, 0);
	if (end != str && *end == '\0') {
		*out = v;
		return 0;
	}
	struct tm tm{};
	end = strptime(str, "%Y-%m-%d", &tm);
	if (end != nullptr && *end != '\0')
		end = strptime(end, " %H:%M:%S", &tm);
	if (end == nullptr || *end != '\0')
		return -EINVAL;
	tm.tm_isdst = -1;
	*out = mktime(&tm);
	return 0;
}

void tmpfile::close()
{
	if (m_fd < 0)
		return;
	::close(m_fd);
	m_fd = -1;
	if (m_path.empty())
		return;
	if (remove(m_path.c_str()) < 0 && errno != ENOENT)
		mlog(LV_ERR, "E-2902: remove %s: %s", m_path.c_str(), strerror(errno));
	m_path.clear();
}

int tmpfile::open(const char *dir, const char *suffix, unsigned int flags,
    unsigned int mode) try
{
	close();
	m_path = dir + "/"s + randstring(16) + suffix;
	m_fd = ::open(m_path.c_str(), O_CREAT | O_EXCL | flags, mode);
	if (m_fd >= 0)
		return m_fd;
	m_path.clear();
	return -errno;
} catch (const std::bad_alloc &) {
	return -ENOMEM;
}

void mlog_init(const char *filename, unsigned int max_level)
{
	g_max_loglevel = max_level;
	if (filename == nullptr || *filename == '\0' || strcmp(filename, "-") == 0)
		g_logfp.reset();
	g_log_syslog = filename != nullptr && strcmp(filename, "syslog") == 0;
	g_log_tty    = isatty(STDERR_FILENO);
	if (g_log_syslog) {
		openlog(nullptr, LOG_PID, LOG_MAIL);
		setlogmask((1 << (max_level + 2)) - 1);
		return;
	}
	if (filename == nullptr || *filename == '\0' || strcmp(filename, "-") == 0) {
		setvbuf(stderr, nullptr, _IOLBF, 0);
		return;
	}
	std::lock_guard hold(g_log_mutex);
	g_logfp.reset(fopen(filename, "a"));
	if (g_logfp == nullptr) {
		fprintf(stderr, "Could not open %s for writing: %s. Using stderr.\n",
		        filename, strerror(errno));
		setvbuf(stderr, nullptr, _IOLBF, 0);
	} else {
		setvbuf(g_logfp.get(), nullptr, _IOLBF, 0);
	}
}

void mlog(unsigned int level, const char *fmt, ...)
{
	if (level > g_max_loglevel)
		return;
	va_list args;
	va_start(args, fmt);
	if (g_log_syslog) {
		vsyslog(level + 1, fmt, args);
		va_end(args);
		return;
	} else if (g_logfp == nullptr) {
		std::lock_guard hold(g_log_mutex);
		if (g_log_tty)
			fputs(level <= LV_ERR ? "\e[1;31m" :
			      level <= LV_WARN ? "\e[31m" :
			      level <= LV_NOTICE ? "\e[1;37m" :
			      level == LV_DEBUG ? "\e[1;30m" : "", stderr);
		vfprintf(stderr, fmt, args);
		if (g_log_tty)
			fputs("\e[0m", stderr);
		fputc('\n', stderr);
		va_end(args);
		return;
	}
	char buf[64];
	buf[0] = '<';
	buf[1] = '0' + level;
	buf[2] = '>';
	auto now = time(nullptr);
	struct tm tmbuf;
	strftime(buf + 3, std::size(buf) - 3, "%FT%T ", localtime_r(&now, &tmbuf));
	{
		std::lock_guard hold(g_log_mutex);
		fputs(buf, g_logfp.get());
		vfprintf(g_logfp.get(), fmt, args);
		fputc('\n', g_logfp.get());
	}
	va_end(args);
}

}
