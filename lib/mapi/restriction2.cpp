// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <ctime>
#include <iterator>
#include <string>
#include <variant>
#include <fmt/core.h>
#include <mailbridge/mapidefs.h>
#include <mailbridge/rop_util.hpp>
#include <mailbridge/util.hpp>

/*
 * We should emit hexnumbers with 0x%x rather than %xh notation.
 * This makes copy-paste to source code easier.
 */

using namespace mailbridge;

const char *relop_repr(relop r)
{
	switch (r) {
	case RELOP_LT: return "<";
	case RELOP_LE: return "<=";
	case RELOP_GT: return ">";
	case RELOP_GE: return ">=";
	case RELOP_EQ: return "==";
	case RELOP_NE: return "!=";
	default: return "??";
	}
}

static std::string systime_repr(uint64_t v)
{
	auto ut = rop_util_nttime_to_unix(v);
	char buf[80]{};
	struct tm tmbuf;
	auto tm = localtime_r(&ut, &tmbuf);
	if (tm != nullptr)
		strftime(buf, std::size(buf), "%FT%T", tm);
	return fmt::format("{} (raw=0x{:x})", buf, v);
}

std::string TAGGED_PROPVAL::repr() const
{
	auto type = PROP_TYPE(proptag);
	if (auto v = std::get_if<uint8_t>(&value))
		return *v ? "true" : "false";
	if (auto v = std::get_if<uint32_t>(&value))
		return type == PT_ERROR ? fmt::format("<error {}>", mapi_strerror(*v)) :
		       fmt::format("{}/0x{:x}", *v, *v);
	if (auto v = std::get_if<uint64_t>(&value))
		return type == PT_SYSTIME ? systime_repr(*v) :
		       fmt::format("{}/0x{:x}", *v, *v);
	if (auto v = std::get_if<double>(&value))
		return std::to_string(*v);
	if (auto v = std::get_if<std::string>(&value))
		return fmt::format("[{}]=\"{}\"", v->size(), *v);
	if (auto v = std::get_if<BINARY>(&value))
		return fmt::format("[{} bytes]", v->cb());
	return {};
}

std::string RESTRICTION::repr() const
{
	switch (rt) {
	case RES_AND:
	case RES_OR: {
		auto s = fmt::format("RES_{}[{}]{{", rt == RES_AND ? "AND" : "OR", sub.size());
		for (size_t i = 0; i < sub.size(); ++i) {
			if (i > 0)
				s += ",";
			s += sub[i].repr();
		}
		return s + "}";
	}
	case RES_NOT:
		return "RES_NOT{" + (sub.size() > 0 ? sub[0].repr() : std::string()) + "}";
	case RES_CONTENT:
		return fmt::format("RES_CONTENT{{0x{:x},{}{}{},{}}}", proptag,
		       (fuzzy_level & 0xFFFF) == FL_SUBSTRING ? "FL_SUBSTRING" :
		       (fuzzy_level & 0xFFFF) == FL_PREFIX ? "FL_PREFIX" : "FL_FULLSTRING",
		       fuzzy_level & FL_IGNORECASE ? "|" : "",
		       fuzzy_level & FL_IGNORECASE ? "FL_IGNORECASE" : "",
		       propval.repr());
	case RES_PROPERTY:
		return fmt::format("RES_PROPERTY{{0x{:x}{}{}}}", proptag,
		       relop_repr(relop), propval.repr());
	case RES_BITMASK:
		return fmt::format("RES_BITMASK{{0x{:x}&0x{:x}{}}}", proptag,
		       mask, bitmask_relop == BMR_EQZ ? "==0" : "!=0");
	case RES_EXIST:
		return fmt::format("RES_EXIST{{0x{:x}}}", proptag);
	case RES_NULL:
		return "RES_NULL{}";
	default:
		return "RES_??{}";
	}
}
