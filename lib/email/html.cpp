// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <strings.h>
#include <libHX/ctype_helper.h>
#include <mailbridge/html.hpp>
#include <mailbridge/util.hpp>

namespace mailbridge {

namespace {
struct entity {
	const char *name;
	uint32_t cp;
};
}

static constexpr entity html_entities[] = {
	{"amp", '&'}, {"lt", '<'}, {"gt", '>'}, {"quot", '"'}, {"apos", '\''},
	{"nbsp", ' '}, {"copy", 0xA9}, {"reg", 0xAE}, {"trade", 0x2122},
	{"hellip", 0x2026}, {"mdash", 0x2014}, {"ndash", 0x2013},
	{"lsquo", 0x2018}, {"rsquo", 0x2019}, {"ldquo", 0x201C},
	{"rdquo", 0x201D}, {"bull", 0x2022}, {"euro", 0x20AC},
	{"auml", 0xE4}, {"ouml", 0xF6}, {"uuml", 0xFC}, {"Auml", 0xC4},
	{"Ouml", 0xD6}, {"Uuml", 0xDC}, {"szlig", 0xDF}, {"eacute", 0xE9},
	{"egrave", 0xE8}, {"agrave", 0xE0}, {"ccedil", 0xE7},
};

/* Elements that start a new line in the text rendition */
static constexpr const char *html_block_tags[] = {
	"br", "p", "div", "li", "tr", "h1", "h2", "h3", "h4", "h5", "h6",
	"table", "blockquote", "hr",
};

bool looks_like_html(std::string_view s)
{
	for (size_t i = 0; i + 1 < s.size(); ++i) {
		if (s[i] != '<' || !HX_isalpha(s[i+1]))
			continue;
		return s.find('>', i + 2) != s.npos;
	}
	return false;
}

void utf8_append(std::string &out, uint32_t cp)
{
	if (cp < 0x80) {
		out += static_cast<char>(cp);
	} else if (cp < 0x800) {
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if (cp < 0x10000) {
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if (cp < 0x110000) {
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

/**
 * Decode the entity starting at @s[@i] (which is '&'). On success, the
 * text is appended to @out and the index of the terminating ';' is
 * returned; otherwise @i.
 */
static size_t htp_entity(std::string_view s, size_t i, std::string &out)
{
	auto semi = s.find(';', i + 1);
	if (semi == s.npos || semi - i > 12 || semi == i + 1)
		return i;
	std::string name(s.substr(i + 1, semi - i - 1));
	if (name[0] == '#') {
		char *end = nullptr;
		unsigned long cp = name.size() > 1 && (name[1] == 'x' || name[1] == 'X') ?
		                   strtoul(&name[2], &end, 16) : strtoul(&name[1], &end, 10);
		if (end == nullptr || *end != '\0' || cp == 0 || cp > 0x10FFFF)
			return i;
		utf8_append(out, cp == 0xA0 ? ' ' : cp);
		return semi;
	}
	for (const auto &e : html_entities) {
		if (strcmp(e.name, name.c_str()) != 0)
			continue;
		utf8_append(out, e.cp);
		return semi;
	}
	return i;
}

static bool htp_is_block(const std::string &tag)
{
	for (auto t : html_block_tags)
		if (tag == t)
			return true;
	return false;
}

/* Squeeze whitespace, drop blank line runs, trim */
static std::string htp_tidy(const std::string &raw)
{
	std::string out;
	size_t blanks = 0;
	for (const auto &line : gx_split(raw, '\n')) {
		std::string cooked;
		bool space = false;
		for (auto c : line) {
			if (c == ' ' || c == '\t' || c == '\r') {
				space = true;
				continue;
			}
			if (space && !cooked.empty())
				cooked += ' ';
			space = false;
			cooked += c;
		}
		if (cooked.empty()) {
			++blanks;
			continue;
		}
		if (!out.empty())
			out += blanks > 0 ? "\n\n" : "\n";
		blanks = 0;
		out += cooked;
	}
	return out;
}

int html_to_plain(std::string_view s, std::string &outbuf) try
{
	std::string raw;
	raw.reserve(s.size());
	size_t i = 0;
	while (i < s.size()) {
		auto c = s[i];
		if (c == '&') {
			auto j = htp_entity(s, i, raw);
			if (j == i)
				raw += '&';
			i = j + 1;
			continue;
		}
		if (c == '\n' || c == '\r' || c == '\t') {
			/* source line breaks carry no meaning in HTML */
			raw += ' ';
			++i;
			continue;
		}
		if (c != '<' || i + 1 >= s.size()) {
			raw += c;
			++i;
			continue;
		}
		if (s.compare(i, 4, "<!--") == 0) {
			auto e = s.find("-->", i + 4);
			i = e == s.npos ? s.size() : e + 3;
			continue;
		}
		auto n = s[i+1];
		if (!HX_isalpha(n) && n != '/' && n != '!' && n != '?') {
			raw += c;
			++i;
			continue;
		}
		/* tag name */
		size_t p = i + 1;
		bool closing = s[p] == '/';
		if (closing)
			++p;
		std::string tag;
		while (p < s.size() && HX_isalnum(s[p]))
			tag += HX_tolower(s[p++]);
		/* end of tag, honoring quoted attribute values */
		char q = 0;
		while (p < s.size() && (q != 0 || s[p] != '>')) {
			if (q == 0 && (s[p] == '"' || s[p] == '\''))
				q = s[p];
			else if (q != 0 && s[p] == q)
				q = 0;
			++p;
		}
		i = p < s.size() ? p + 1 : s.size();
		if (!closing && (tag == "style" || tag == "script")) {
			auto needle = "</" + tag;
			size_t e = i;
			while (e < s.size() && strncasecmp(&s[e], needle.c_str(),
			       std::min(needle.size(), s.size() - e)) != 0)
				++e;
			if (e >= s.size()) {
				i = s.size();
				continue;
			}
			auto gt = s.find('>', e);
			i = gt == s.npos ? s.size() : gt + 1;
			continue;
		}
		if (htp_is_block(tag))
			raw += '\n';
		else if (tag == "td" || tag == "th")
			raw += ' ';
	}
	outbuf = htp_tidy(raw);
	return 0;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1501: ENOMEM");
	return -ENOMEM;
}

}
