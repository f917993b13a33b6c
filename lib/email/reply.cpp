// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cstring>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <strings.h>
#include <libHX/ctype_helper.h>
#include <mailbridge/reply.hpp>
#include <mailbridge/util.hpp>

namespace mailbridge {

namespace {
struct attribution {
	const char *lead;
	const char *tail[2];
};
}

/* "On <date>, <who> wrote:" and its translations */
static constexpr attribution attributions[] = {
	{"On ", {"wrote:", nullptr}},
	{"Am ", {"schrieb:", nullptr}},
	{"Le ", {"a \xc3\xa9" "crit :", "a \xc3\xa9" "crit:"}},
	{"El ", {"escribi\xc3\xb3:", nullptr}},
	{"Op ", {"schreef:", nullptr}},
};

/* matched against the whole line, dashes around them stripped */
static constexpr const char *separators[] = {
	"Original Message", "Forwarded message",
	"Urspr\xc3\xbcngliche Nachricht", "Weitergeleitete Nachricht",
};

static constexpr const char *hdr_from[] = {"From:", "Von:", "De:"};
static constexpr const char *hdr_sent[] = {"Sent:", "Date:", "Gesendet:", "Envoy\xc3\xa9 :", "Envoy\xc3\xa9:"};

static bool starts_with(std::string_view s, std::string_view p)
{
	return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

static bool ends_with(std::string_view s, std::string_view p)
{
	return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
}

static bool starts_with_any(std::string_view s, const char *const *b, const char *const *e)
{
	for (; b != e; ++b)
		if (starts_with(s, *b))
			return true;
	return false;
}

static bool is_attribution(const std::vector<std::string_view> &lines, size_t i)
{
	for (const auto &a : attributions) {
		if (!starts_with(lines[i], a.lead))
			continue;
		for (auto tail : a.tail) {
			if (tail == nullptr)
				continue;
			if (ends_with(lines[i], tail))
				return true;
			/* wrapped over two lines */
			if (i + 1 < lines.size() && ends_with(lines[i+1], tail))
				return true;
		}
	}
	return false;
}

static bool is_header_block(const std::vector<std::string_view> &lines, size_t i)
{
	if (!starts_with_any(lines[i], std::begin(hdr_from), std::end(hdr_from)))
		return false;
	for (size_t j = i + 1; j < lines.size() && j <= i + 4; ++j)
		if (starts_with_any(lines[j], std::begin(hdr_sent), std::end(hdr_sent)))
			return true;
	return false;
}

static bool is_separator(std::string_view l)
{
	auto p = l.find_first_not_of('-');
	if (p == l.npos)
		return false;
	l.remove_prefix(p);
	l.remove_suffix(l.size() - l.find_last_not_of('-') - 1);
	l = strtrim(l);
	for (auto sep : separators)
		if (str_icase_equal(l, sep))
			return true;
	return false;
}

static bool is_quote_start(const std::vector<std::string_view> &lines, size_t i)
{
	auto l = lines[i];
	if (starts_with(l, ">"))
		return true;
	if (is_separator(l))
		return true;
	if (l.size() >= 10 && l.find_first_not_of('_') == l.npos)
		return true;
	return is_attribution(lines, i) || is_header_block(lines, i);
}

std::optional<std::string> latest_reply(std::string_view body)
{
	std::vector<std::string_view> lines;
	size_t start = 0;
	while (start <= body.size()) {
		auto nl = body.find('\n', start);
		auto end = nl == body.npos ? body.size() : nl;
		lines.push_back(strtrim(body.substr(start, end - start)));
		if (nl == body.npos)
			break;
		start = nl + 1;
	}
	size_t cut = 0;
	while (cut < lines.size() && !is_quote_start(lines, cut))
		++cut;
	if (cut == lines.size())
		cut = body.size();
	else
		/* offset of the first quoted line in @body */
		cut = lines[cut].data() - body.data();
	auto reply = strtrim(body.substr(0, cut));
	if (reply.empty())
		return std::nullopt;
	return std::string(reply);
}

std::string normalize_subject(std::string_view s)
{
	static constexpr const char *prefixes[] = {"re:", "fw:", "fwd:", "aw:", "wg:"};
	s = strtrim(s);
	bool again = true;
	while (again) {
		again = false;
		for (auto p : prefixes) {
			auto z = strlen(p);
			if (s.size() < z || strncasecmp(s.data(), p, z) != 0)
				continue;
			s = strtrim(s.substr(z));
			again = true;
			break;
		}
	}
	return std::string(s);
}

std::string clean_message_id(std::string_view s)
{
	while (s.size() > 0 && (s.front() == '<' || s.front() == '>' || HX_isspace(s.front())))
		s.remove_prefix(1);
	while (s.size() > 0 && (s.back() == '<' || s.back() == '>' || HX_isspace(s.back())))
		s.remove_suffix(1);
	return std::string(s);
}

}
