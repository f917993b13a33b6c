// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cstdio>
#include <cstdlib>
#include <string>
#include <mailbridge/bridge.hpp>
#include <mailbridge/mapidefs.h>
#include <mailbridge/util.hpp>
#undef assert
#define assert(x) do { if (!(x)) { printf("%s failed\n", #x); return EXIT_FAILURE; } } while (false)
using namespace mailbridge;

static TPROPVAL_ARRAY sample_row()
{
	TPROPVAL_ARRAY row;
	row.set(PR_SUBJECT, std::string("Quarterly Report"));
	row.set(PR_MESSAGE_FLAGS, uint32_t(MSGFLAG_READ | MSGFLAG_HASATTACH));
	row.set(PR_MESSAGE_DELIVERY_TIME, uint64_t(1000));
	row.set(PR_HASATTACH, uint8_t(1));
	row.set(CHANGE_PROP_TYPE(PR_BODY, PT_ERROR), uint32_t(ecMAPIOOM));
	return row;
}

static int t_eval()
{
	auto row = sample_row();
	assert(RESTRICTION::make_content(FL_SUBSTRING | FL_IGNORECASE, PR_SUBJECT, "report").eval(row));
	assert(!RESTRICTION::make_content(FL_SUBSTRING, PR_SUBJECT, "report").eval(row));
	assert(RESTRICTION::make_content(FL_PREFIX, PR_SUBJECT, "Quarter").eval(row));
	assert(!RESTRICTION::make_content(FL_FULLSTRING, PR_SUBJECT, "Quarter").eval(row));
	assert(RESTRICTION::make_content(FL_FULLSTRING | FL_IGNORECASE, PR_SUBJECT, "quarterly report").eval(row));
	assert(RESTRICTION::make_prop(RELOP_GE, PR_MESSAGE_DELIVERY_TIME, uint64_t(1000)).eval(row));
	assert(!RESTRICTION::make_prop(RELOP_GT, PR_MESSAGE_DELIVERY_TIME, uint64_t(1000)).eval(row));
	/* type mismatch never matches */
	assert(!RESTRICTION::make_prop(RELOP_EQ, PR_MESSAGE_DELIVERY_TIME, uint32_t(1000)).eval(row));
	assert(RESTRICTION::make_bitmask(BMR_NEZ, PR_MESSAGE_FLAGS, MSGFLAG_READ).eval(row));
	assert(!RESTRICTION::make_bitmask(BMR_EQZ, PR_MESSAGE_FLAGS, MSGFLAG_READ).eval(row));
	assert(RESTRICTION::make_exist(PR_SUBJECT).eval(row));
	/* a faulted property does not exist for comparison purposes */
	assert(!RESTRICTION::make_exist(PR_BODY).eval(row));
	assert(!RESTRICTION::make_content(FL_SUBSTRING, PR_BODY, "x").eval(row));
	assert(RESTRICTION::make_not(RESTRICTION::make_exist(PR_BODY)).eval(row));
	assert(RESTRICTION::make_and({}).eval(row));
	assert(!RESTRICTION::make_or({}).eval(row));
	assert(RESTRICTION::make_or({
		RESTRICTION::make_exist(PR_BODY),
		RESTRICTION::make_exist(PR_SUBJECT),
	}).eval(row));
	return EXIT_SUCCESS;
}

static int t_faults()
{
	auto row = sample_row();
	assert(row.error_of(PR_SUBJECT) == ecSuccess);
	assert(row.error_of(PR_BODY) == ecMAPIOOM);
	assert(row.error_of(PR_HTML) == ecNotFound);
	assert(row.fault(PR_BODY));
	assert(!row.fault(PR_HTML));
	assert(!row.fault(PR_SUBJECT));
	assert(row.get_or<std::string>(PR_BODY, "dflt") == "dflt");
	row.erase(PR_SUBJECT);
	assert(!row.has(PR_SUBJECT));
	row.set(PR_HASATTACH, uint8_t(0));
	assert(row.get_or<uint8_t>(PR_HASATTACH, 1) == 0);
	return EXIT_SUCCESS;
}

static int t_bounds()
{
	constexpr uint32_t tag = PROP_TAG(PT_SYSTIME, 0x8000);
	constexpr uint32_t other = PROP_TAG(PT_SYSTIME, 0x8001);
	uint64_t b = 0;
	auto r = RESTRICTION::make_and({
		RESTRICTION::make_prop(RELOP_LE, tag, uint64_t(500)),
		RESTRICTION::make_prop(RELOP_LT, tag, uint64_t(300)),
		RESTRICTION::make_prop(RELOP_GE, other, uint64_t(100)),
	});
	assert(restriction_upper_bound(r, tag, b) && b == 300);
	assert(!restriction_lower_bound(r, tag, b));
	assert(restriction_lower_bound(r, other, b) && b == 100);
	assert(!restriction_upper_bound(r, other, b));
	/* OR bounds only if every branch does, with the loosest value */
	auto o = RESTRICTION::make_or({
		RESTRICTION::make_prop(RELOP_LE, tag, uint64_t(5)),
		RESTRICTION::make_prop(RELOP_LT, other, uint64_t(1)),
	});
	assert(!restriction_upper_bound(o, tag, b));
	o = RESTRICTION::make_or({
		RESTRICTION::make_prop(RELOP_LE, tag, uint64_t(5)),
		RESTRICTION::make_and({
			RESTRICTION::make_exist(tag),
			RESTRICTION::make_prop(RELOP_LT, tag, uint64_t(9)),
		}),
	});
	assert(restriction_upper_bound(o, tag, b) && b == 9);
	/* a lower bound on either of two ordered tags */
	auto w = RESTRICTION::make_or({
		RESTRICTION::make_prop(RELOP_GE, other, uint64_t(70)),
		RESTRICTION::make_and({
			RESTRICTION::make_not(RESTRICTION::make_exist(other)),
			RESTRICTION::make_prop(RELOP_GE, tag, uint64_t(60)),
		}),
	});
	assert(!restriction_lower_bound(w, other, b));
	assert(restriction_lower_bound(w, {other, tag}, b) && b == 60);
	auto nested = RESTRICTION::make_and({RESTRICTION::make_and({
		RESTRICTION::make_prop(RELOP_EQ, tag, uint64_t(42))})});
	assert(restriction_upper_bound(nested, tag, b) && b == 42);
	assert(restriction_lower_bound(nested, tag, b) && b == 42);
	return EXIT_SUCCESS;
}

static int t_repr()
{
	auto r = RESTRICTION::make_and({
		RESTRICTION::make_content(FL_SUBSTRING | FL_IGNORECASE, PR_SUBJECT, "abc"),
		RESTRICTION::make_bitmask(BMR_EQZ, PR_MESSAGE_FLAGS, MSGFLAG_READ),
	});
	auto s = r.repr();
	printf("%s\n", s.c_str());
	assert(s.find("RES_AND[2]") == 0);
	assert(s.find("FL_SUBSTRING|FL_IGNORECASE") != s.npos);
	assert(s.find("RES_BITMASK") != s.npos);
	assert(std::string(relop_repr(RELOP_LE)) == "<=");
	return EXIT_SUCCESS;
}

static int t_search()
{
	auto row = sample_row();
	row.set(PR_SENDER_NAME, std::string("Bob Builder"));
	row.set(PR_SENDER_EMAIL_ADDRESS, std::string("bob@example.com"));
	RESTRICTION res;
	search_criteria c;
	c.sender = "EXAMPLE.com";
	assert(search_restriction(c, res));
	assert(res.rt == RES_OR);
	assert(res.eval(row));
	c.has_attachments = true;
	assert(search_restriction(c, res));
	assert(res.rt == RES_AND && res.sub.size() == 2);
	assert(res.eval(row));
	c.has_attachments = false;
	assert(search_restriction(c, res));
	assert(!res.eval(row));
	c = {};
	c.unread = false;
	assert(search_restriction(c, res));
	assert(res.eval(row));
	c.unread = true;
	assert(search_restriction(c, res));
	assert(!res.eval(row));
	c = {};
	c.body = "anything";
	assert(search_restriction(c, res));
	assert(!res.eval(row));
	return EXIT_SUCCESS;
}

int main()
{
	using fpt = decltype(&t_eval);
	fpt fct[] = {t_eval, t_faults, t_bounds, t_repr, t_search};
	for (auto f : fct)
		if (f() != EXIT_SUCCESS)
			return EXIT_FAILURE;
	return EXIT_SUCCESS;
}
