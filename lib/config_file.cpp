// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
/*
 * Config file parser for a (key = value) format config file.
 * Comments start with '#' at the start of a line.
 */
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <libHX/ctype_helper.h>
#include <libHX/string.h>
#include <mailbridge/config_file.hpp>
#include <mailbridge/fileio.h>
#include <mailbridge/util.hpp>

using namespace mailbridge;

static void config_file_apply_1(config_file &cfg, const cfg_directive &d);

static const char *default_searchpath()
{
	const char *ed = getenv("MAILBRIDGE_CONFIG_PATH");
	return ed != nullptr ? ed : MAILBRIDGE_SYSCONFDIR;
}

static bool cfg_key_valid(const char *key)
{
	for (; *key != '\0'; ++key)
		if (!HX_isalnum(*key) && *key != '-' && *key != '_')
			return false;
	return true;
}

static void config_file_parse_line(config_file &cfg, char *line)
{
	HX_chomp(line);
	HX_strrtrim(line);
	HX_strltrim(line);
	if (*line == '#')
		return;
	auto equal_ptr = strchr(line, '=');
	if (equal_ptr == nullptr)
		return;
	*equal_ptr++ = '\0';
	HX_strrtrim(line);
	HX_strltrim(equal_ptr);
	if (*line == '\0' || !cfg_key_valid(line))
		return;
	cfg.set_value(line, equal_ptr);
}

static void config_file_apply(config_file &cfg, const cfg_directive *key_desc)
{
	if (key_desc != nullptr)
		for (; key_desc->key != nullptr; ++key_desc)
			config_file_apply_1(cfg, *key_desc);
}

std::shared_ptr<config_file> config_file_init(const char *filename,
    const cfg_directive *key_desc) try
{
	std::unique_ptr<FILE, file_deleter> fp(fopen(filename, "r"));
	if (fp == nullptr)
		return nullptr;
	auto cfg = std::make_shared<config_file>();
	hxmc_t *line = nullptr;
	while (HX_getl(&line, fp.get()) != nullptr)
		config_file_parse_line(*cfg, line);
	HXmc_free(line);
	cfg->m_filename = filename;
	config_file_apply(*cfg, key_desc);
	return cfg;
} catch (const std::bad_alloc &) {
	errno = ENOMEM;
	return nullptr;
}

/***
 * @fb:		filename (base) - "foo.cfg"
 * @sdlist:	colon-separated path list
 *
 * Attempt to read config file @fb from various paths (@sdlist). If none
 * exists, the defaults of @key_desc are used.
 */
std::shared_ptr<config_file> config_file_initd(const char *fb,
    const char *sdlist, const cfg_directive *key_desc) try
{
	if (sdlist == nullptr || strchr(fb, '/') != nullptr)
		return config_file_init(fb, key_desc);
	for (const auto &dir : gx_split(sdlist, ':')) {
		if (dir.size() == 0)
			continue;
		errno = 0;
		auto full = dir + "/" + fb;
		auto cfg = config_file_init(full.c_str(), key_desc);
		if (cfg != nullptr)
			return cfg;
		if (errno != ENOENT) {
			fprintf(stderr, "config_file_initd %s: %s\n",
			        full.c_str(), strerror(errno));
			return nullptr;
		}
	}
	auto cfg = std::make_shared<config_file>();
	cfg->m_filename = fb;
	config_file_apply(*cfg, key_desc);
	return cfg;
} catch (const std::bad_alloc &) {
	errno = ENOMEM;
	return nullptr;
}

/**
 * Read user-specified config file (@ov) or, if that is unset, try the
 * default file (@fb, located in default searchpaths) in silent mode.
 */
std::shared_ptr<config_file> config_file_prg(const char *ov, const char *fb,
    const cfg_directive *key_desc)
{
	if (ov == nullptr)
		return config_file_initd(fb, default_searchpath(), key_desc);
	auto cfg = config_file_init(ov, key_desc);
	if (cfg == nullptr)
		fprintf(stderr, "config_file_init %s: %s\n", ov, strerror(errno));
	return cfg;
}

const char *config_file::get_value(const char *key) const
{
	std::string k = key;
	HX_strlower(k.data());
	auto i = m_vars.find(k);
	return i != m_vars.end() ? i->second.c_str() : nullptr;
}

void config_file::set_value(const char *key, const char *value)
{
	std::string k = key;
	HX_strlower(k.data());
	m_vars[std::move(k)] = value;
}

unsigned long long config_file::get_ll(const char *key) const
{
	auto sv = get_value(key);
	if (sv == nullptr) {
		fprintf(stderr, "*** config key \"%s\" has no default and was not set either\n", key);
		throw cfg_error(key);
	}
	return strtoull(sv, nullptr, 0);
}

static void config_file_apply_1(config_file &cfg, const cfg_directive &d)
{
	auto sv = cfg.get_value(d.key);
	if (sv == nullptr)
		sv = d.deflt;
	if (sv == nullptr)
		return;
	if (d.flags & CFG_BOOL) {
		cfg.set_value(d.key, parse_bool(sv) ? "1" : "0");
		return;
	}
	if (d.flags & (CFG_TIME | CFG_TIME_NS)) {
		auto cvt = d.flags & CFG_TIME_NS ? HX_strtoull_nsec : HX_strtoull_sec;
		auto nv = cvt(sv, nullptr);
		if (d.min != nullptr)
			nv = std::max(nv, cvt(d.min, nullptr));
		if (d.max != nullptr)
			nv = std::min(nv, cvt(d.max, nullptr));
		cfg.set_value(d.key, std::to_string(nv).c_str());
		return;
	}
	if (d.flags & CFG_SIZE) {
		auto nv = HX_strtoull_unit(sv, nullptr, 1024);
		if (d.min != nullptr)
			nv = std::max(nv, HX_strtoull_unit(d.min, nullptr, 1024));
		if (d.max != nullptr)
			nv = std::min(nv, HX_strtoull_unit(d.max, nullptr, 1024));
		cfg.set_value(d.key, std::to_string(nv).c_str());
		return;
	}
	cfg.set_value(d.key, sv);
}
