// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <mailbridge/mapidefs.h>
#include <mailbridge/util.hpp>

using namespace mailbridge;

RESTRICTION RESTRICTION::make_prop(enum relop op, uint32_t tag, propval_t &&v)
{
	RESTRICTION r;
	r.rt = RES_PROPERTY;
	r.relop = op;
	r.proptag = tag;
	r.propval = TAGGED_PROPVAL(tag, std::move(v));
	return r;
}

RESTRICTION RESTRICTION::make_content(uint32_t fuzzy, uint32_t tag, std::string &&v)
{
	RESTRICTION r;
	r.rt = RES_CONTENT;
	r.fuzzy_level = fuzzy;
	r.proptag = tag;
	r.propval = TAGGED_PROPVAL(tag, propval_t(std::move(v)));
	return r;
}

RESTRICTION RESTRICTION::make_bitmask(enum bm_relop op, uint32_t tag, uint32_t mask)
{
	RESTRICTION r;
	r.rt = RES_BITMASK;
	r.bitmask_relop = op;
	r.proptag = tag;
	r.mask = mask;
	return r;
}

RESTRICTION RESTRICTION::make_exist(uint32_t tag)
{
	RESTRICTION r;
	r.rt = RES_EXIST;
	r.proptag = tag;
	return r;
}

RESTRICTION RESTRICTION::make_not(RESTRICTION &&inner)
{
	RESTRICTION r;
	r.rt = RES_NOT;
	r.sub.push_back(std::move(inner));
	return r;
}

RESTRICTION RESTRICTION::make_and(std::vector<RESTRICTION> &&v)
{
	RESTRICTION r;
	r.rt = RES_AND;
	r.sub = std::move(v);
	return r;
}

RESTRICTION RESTRICTION::make_or(std::vector<RESTRICTION> &&v)
{
	RESTRICTION r;
	r.rt = RES_OR;
	r.sub = std::move(v);
	return r;
}

static bool content_eval(uint32_t fuzzy_level, const std::string &lhs,
    const std::string &rhs)
{
	bool icase = fuzzy_level & FL_IGNORECASE;
	switch (fuzzy_level & 0xFFFF) {
	case FL_FULLSTRING:
		return icase ? str_icase_equal(lhs, rhs) : lhs == rhs;
	case FL_SUBSTRING:
		return icase ? str_icase_contains(lhs, rhs) :
		       lhs.find(rhs) != lhs.npos;
	case FL_PREFIX:
		if (lhs.size() < rhs.size())
			return false;
		return icase ? str_icase_equal(std::string_view(lhs).substr(0, rhs.size()), rhs) :
		       lhs.compare(0, rhs.size(), rhs) == 0;
	}
	return false;
}

/**
 * Evaluate the restriction against one row of properties. Properties
 * that are absent (or carry an error) never satisfy a comparison.
 */
bool RESTRICTION::eval(const TPROPVAL_ARRAY &row) const
{
	switch (rt) {
	case RES_AND:
		return std::all_of(sub.begin(), sub.end(),
		       [&](const RESTRICTION &r) { return r.eval(row); });
	case RES_OR:
		return std::any_of(sub.begin(), sub.end(),
		       [&](const RESTRICTION &r) { return r.eval(row); });
	case RES_NOT:
		return sub.size() == 1 && !sub[0].eval(row);
	case RES_CONTENT: {
		auto rhs = std::get_if<std::string>(&propval.value);
		if (rhs == nullptr)
			return false;
		if (PROP_TYPE(proptag) == PT_BINARY) {
			auto lhs = row.get<BINARY>(proptag);
			return lhs != nullptr && content_eval(fuzzy_level, lhs->pv, *rhs);
		}
		auto lhs = row.get<std::string>(proptag);
		return lhs != nullptr && content_eval(fuzzy_level, *lhs, *rhs);
	}
	case RES_PROPERTY: {
		auto v = row.find(proptag);
		if (v == nullptr)
			return false;
		return propval_compare_relop(relop, v->value, propval.value);
	}
	case RES_BITMASK: {
		auto v = row.get<uint32_t>(proptag);
		if (v == nullptr)
			return false;
		return bitmask_relop == BMR_EQZ ? (*v & mask) == 0 : (*v & mask) != 0;
	}
	case RES_EXIST:
		return row.has(proptag);
	case RES_NULL:
		return true;
	default:
		return false;
	}
}

static bool restriction_bound(const RESTRICTION &res, const uint32_t *tags,
    size_t ntags, bool upper, uint64_t &bound)
{
	switch (res.rt) {
	case RES_AND: {
		bool found = false;
		for (const auto &r : res.sub) {
			uint64_t b = 0;
			if (!restriction_bound(r, tags, ntags, upper, b))
				continue;
			if (!found)
				bound = b;
			else
				bound = upper ? std::min(bound, b) : std::max(bound, b);
			found = true;
		}
		return found;
	}
	case RES_OR: {
		/* every branch has to be bounded; the loosest one wins */
		if (res.sub.empty())
			return false;
		for (size_t i = 0; i < res.sub.size(); ++i) {
			uint64_t b = 0;
			if (!restriction_bound(res.sub[i], tags, ntags, upper, b))
				return false;
			if (i == 0)
				bound = b;
			else
				bound = upper ? std::max(bound, b) : std::min(bound, b);
		}
		return true;
	}
	case RES_PROPERTY: {
		if (std::find(tags, tags + ntags, res.proptag) == tags + ntags)
			return false;
		if (upper && res.relop != RELOP_LE && res.relop != RELOP_LT &&
		    res.relop != RELOP_EQ)
			return false;
		if (!upper && res.relop != RELOP_GE && res.relop != RELOP_GT &&
		    res.relop != RELOP_EQ)
			return false;
		auto v = std::get_if<uint64_t>(&res.propval.value);
		if (v == nullptr)
			return false;
		bound = *v;
		return true;
	}
	default:
		return false;
	}
}

/**
 * Determine the tightest bound that @res places on the PT_SYSTIME or
 * PT_I8 property @tag, looking through AND and OR nodes (an OR only
 * bounds if all of its branches do). Returns false if the restriction
 * does not bound @tag in that direction.
 */
bool restriction_upper_bound(const RESTRICTION &res, uint32_t tag, uint64_t &bound)
{
	return restriction_bound(res, &tag, 1, true, bound);
}

bool restriction_lower_bound(const RESTRICTION &res, uint32_t tag, uint64_t &bound)
{
	return restriction_bound(res, &tag, 1, false, bound);
}

/**
 * Lower bound placed on any of @tags, for properties that are ordered
 * among themselves (an end time never lies before its start time, so a
 * bound on either start or end bounds the end).
 */
bool restriction_lower_bound(const RESTRICTION &res, const PROPTAG_ARRAY &tags,
    uint64_t &bound)
{
	return restriction_bound(res, tags.data(), tags.size(), false, bound);
}
