// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <strings.h>
#include <string>
#include <variant>
#include <mailbridge/mapidefs.h>

template<typename T> static inline int three_way_compare(const T &a, const T &b)
{
	return (a < b) ? -1 : (a == b) ? 0 : 1;
}

static bool three_way_evaluate(int order, enum relop r)
{
	switch (r) {
	case RELOP_LT: return order < 0;
	case RELOP_LE: return order <= 0;
	case RELOP_GT: return order > 0;
	case RELOP_GE: return order >= 0;
	case RELOP_EQ: return order == 0;
	case RELOP_NE: return order != 0;
	default: return false;
	}
}

ec_error_t TPROPVAL_ARRAY::error_of(uint32_t tag) const
{
	if (has(tag))
		return ecSuccess;
	auto v = get<uint32_t>(CHANGE_PROP_TYPE(tag, PT_ERROR));
	return v != nullptr ? static_cast<ec_error_t>(*v) : ecNotFound;
}

/**
 * A column fault is any error other than the property simply not being
 * set on the object.
 */
bool TPROPVAL_ARRAY::fault(uint32_t tag) const
{
	auto e = error_of(tag);
	return e != ecSuccess && e != ecNotFound;
}

void TPROPVAL_ARRAY::set(uint32_t tag, propval_t &&v)
{
	for (auto &p : ppropval) {
		if (p.proptag != tag)
			continue;
		p.value = std::move(v);
		return;
	}
	ppropval.emplace_back(tag, std::move(v));
}

void TPROPVAL_ARRAY::erase(uint32_t tag)
{
	ppropval.erase(std::remove_if(ppropval.begin(), ppropval.end(),
		[&](const TAGGED_PROPVAL &p) { return p.proptag == tag; }),
		ppropval.end());
}

/**
 * Order two values of the same alternative. Strings compare
 * case-insensitively. Values of different alternatives order by their
 * variant index, so that absent (std::monostate) sorts first.
 */
int propval_compare(const propval_t &a, const propval_t &b)
{
	if (a.index() != b.index())
		return three_way_compare(a.index(), b.index());
	if (auto x = std::get_if<uint8_t>(&a))
		return three_way_compare(*x, std::get<uint8_t>(b));
	if (auto x = std::get_if<uint32_t>(&a))
		return three_way_compare(*x, std::get<uint32_t>(b));
	if (auto x = std::get_if<uint64_t>(&a))
		return three_way_compare(*x, std::get<uint64_t>(b));
	if (auto x = std::get_if<double>(&a))
		return three_way_compare(*x, std::get<double>(b));
	if (auto x = std::get_if<std::string>(&a)) {
		auto r = strcasecmp(x->c_str(), std::get<std::string>(b).c_str());
		return r < 0 ? -1 : r > 0 ? 1 : 0;
	}
	if (auto x = std::get_if<BINARY>(&a))
		return three_way_compare(x->pv, std::get<BINARY>(b).pv);
	return 0;
}

bool propval_compare_relop(enum relop relop, const propval_t &a,
    const propval_t &b)
{
	/* values of differing types never satisfy a relation */
	if (a.index() != b.index() || std::holds_alternative<std::monostate>(a))
		return false;
	return three_way_evaluate(propval_compare(a, b), relop);
}
