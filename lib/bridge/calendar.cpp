// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <mailbridge/calendar.hpp>
#include <mailbridge/listing.hpp>
#include <mailbridge/rop_util.hpp>
#include <mailbridge/util.hpp>

namespace mailbridge {

ec_error_t calendar_tags::resolve(store_client &store)
{
	static const std::vector<PROPERTY_NAME> propname_buff = {
		{MNID_ID, PSETID_Appointment, PidLidAppointmentStartWhole},
		{MNID_ID, PSETID_Appointment, PidLidAppointmentEndWhole},
		{MNID_ID, PSETID_Appointment, PidLidLocation},
		{MNID_ID, PSETID_Appointment, PidLidAppointmentSubType},
		{MNID_ID, PSETID_Appointment, PidLidAppointmentStateFlags},
		{MNID_ID, PSETID_Appointment, PidLidResponseStatus},
		{MNID_ID, PSETID_Appointment, PidLidToAttendeesString},
		{MNID_ID, PSETID_Appointment, PidLidCcAttendeesString},
	};
	std::vector<uint16_t> ids;
	auto ret = store.get_named_propids(false, propname_buff, ids);
	if (ret != ecSuccess)
		return ret;
	if (ids.size() != propname_buff.size())
		return ecError;
	/* an unknown name yields id 0, which no row ever carries */
	start        = ids[0] != 0 ? PROP_TAG(PT_SYSTIME, ids[0]) : 0;
	end          = ids[1] != 0 ? PROP_TAG(PT_SYSTIME, ids[1]) : 0;
	location     = PROP_TAG(PT_UNICODE, ids[2]);
	subtype      = PROP_TAG(PT_BOOLEAN, ids[3]);
	stateflags   = PROP_TAG(PT_LONG,    ids[4]);
	respstatus   = PROP_TAG(PT_LONG,    ids[5]);
	to_attendees = PROP_TAG(PT_UNICODE, ids[6]);
	cc_attendees = PROP_TAG(PT_UNICODE, ids[7]);
	return ecSuccess;
}

PROPTAG_ARRAY calendar_tags::columns() const
{
	return {PR_ENTRYID, PR_SUBJECT, start, end, location,
	       PR_SENT_REPRESENTING_NAME, subtype, to_attendees, cc_attendees,
	       respstatus, stateflags, PR_RESPONSE_REQUESTED};
}

const char *response_status_name(uint32_t v)
{
	switch (v) {
	case respNone: return "None";
	case respOrganized: return "Organizer";
	case respTentative: return "Tentative";
	case respAccepted: return "Accepted";
	case respDeclined: return "Declined";
	case respNotResponded: return "NotResponded";
	default: return "Unknown";
	}
}

const char *meeting_status_name(uint32_t v)
{
	if (v & asfCanceled)
		return "Canceled";
	switch (v) {
	case 0: return "NonMeeting";
	case asfMeeting: return "Meeting";
	case asfMeeting | asfReceived: return "Received";
	default: return "Unknown";
	}
}

/**
 * Returns false if the row does not make an event: a column faulted,
 * the identity is missing, or there is no start time.
 */
bool event_from_row(const calendar_tags &tags, const TPROPVAL_ARRAY &row,
    calendar_event &ev)
{
	for (auto tag : tags.columns()) {
		if (!row.fault(tag))
			continue;
		mlog(LV_DEBUG, "calendar: skipping item, column %xh: %s", tag,
		        mapi_strerror(row.error_of(tag)));
		return false;
	}
	ev.entry_id = eid_encode(row);
	auto start = row.get<uint64_t>(tags.start);
	if (ev.entry_id.empty() || start == nullptr) {
		mlog(LV_DEBUG, "calendar: skipping item without identity or start");
		return false;
	}
	ev.nt_start = *start;
	ev.start = localtime_str(rop_util_nttime_to_unix(*start));
	auto end = row.get<uint64_t>(tags.end);
	ev.nt_end = end != nullptr ? *end : *start;
	if (end != nullptr)
		ev.end = localtime_str(rop_util_nttime_to_unix(*end));
	else
		ev.end.reset();
	auto subj = row.get<std::string>(PR_SUBJECT);
	ev.subject  = subj != nullptr ? *subj : "(No Subject)";
	ev.location = row.get_or<std::string>(tags.location, "");
	auto org = row.get<std::string>(PR_SENT_REPRESENTING_NAME);
	if (org != nullptr)
		ev.organizer = *org;
	else
		ev.organizer.reset();
	ev.all_day = row.get_or<uint8_t>(tags.subtype, 0) != 0;
	ev.required_attendees = row.get_or<std::string>(tags.to_attendees, "");
	ev.optional_attendees = row.get_or<std::string>(tags.cc_attendees, "");
	ev.response_status = response_status_name(row.get_or<uint32_t>(tags.respstatus, respNone));
	ev.meeting_status  = meeting_status_name(row.get_or<uint32_t>(tags.stateflags, 0));
	ev.response_requested = row.get_or<uint8_t>(PR_RESPONSE_REQUESTED, 0) != 0;
	return true;
}

std::vector<calendar_event> list_calendar(store_client &store,
    folder_object &calendar, time_t window_start, time_t window_end,
    bool unbounded, unsigned int batch_size) try
{
	std::vector<calendar_event> out;
	calendar_tags tags;
	auto ret = tags.resolve(store);
	if (ret != ecSuccess || !tags.ok()) {
		mlog(LV_ERR, "calendar: cannot resolve appointment properties: %s",
		        mapi_strerror(ret != ecSuccess ? ret : ecNotFound));
		return out;
	}
	std::unique_ptr<content_table> table;
	ret = calendar.load_content_table(table);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "calendar: load_content_table: %s", mapi_strerror(ret));
		return out;
	}

	/* Appointments and subclasses only; meeting requests and the like are out */
	ret = table->restrict(RESTRICTION::make_and({
		RESTRICTION::make_prop(RELOP_GE, PR_MESSAGE_CLASS, std::string("IPM.Appointment")),
		RESTRICTION::make_prop(RELOP_LT, PR_MESSAGE_CLASS, std::string("IPM.Appointment{")),
	}));
	if (ret != ecSuccess) {
		mlog(LV_ERR, "calendar: class restriction: %s", mapi_strerror(ret));
		return out;
	}
	/*
	 * Expansion has to be switched on before sorting, and the window
	 * has to be in place before the first row is read; otherwise an
	 * endless series expands without bound.
	 */
	if (!unbounded) {
		ret = table->include_recurrences(true);
		if (ret != ecSuccess) {
			mlog(LV_ERR, "calendar: include_recurrences: %s", mapi_strerror(ret));
			return out;
		}
	}
	ret = table->sort({{tags.start, TABLE_SORT_ASCEND}});
	if (ret != ecSuccess) {
		mlog(LV_ERR, "calendar: sort: %s", mapi_strerror(ret));
		return out;
	}
	uint64_t nt_ws = rop_util_unix_to_nttime(window_start);
	uint64_t nt_we = rop_util_unix_to_nttime(window_end);
	if (!unbounded) {
		/* an appointment without an end lasts for an instant at its start */
		auto res = RESTRICTION::make_and({
			RESTRICTION::make_prop(RELOP_LE, tags.start, nt_we),
			RESTRICTION::make_or({
				RESTRICTION::make_prop(RELOP_GE, tags.end, nt_ws),
				RESTRICTION::make_and({
					RESTRICTION::make_not(RESTRICTION::make_exist(tags.end)),
					RESTRICTION::make_prop(RELOP_GE, tags.start, nt_ws),
				}),
			}),
		});
		mlog(LV_DEBUG, "calendar: window %s", res.repr().c_str());
		ret = table->restrict(res);
		if (ret != ecSuccess) {
			mlog(LV_ERR, "calendar: window restriction: %s", mapi_strerror(ret));
			return out;
		}
	}
	ret = table->set_columns(tags.columns());
	if (ret != ecSuccess) {
		mlog(LV_ERR, "calendar: set_columns: %s", mapi_strerror(ret));
		return out;
	}

	batch_size = std::clamp(batch_size, 1U, LIST_BATCH_MAX);
	while (true) {
		TARRAY_SET rows;
		ret = table->query_rows(batch_size, rows);
		if (ret != ecSuccess) {
			mlog(LV_ERR, "calendar: query_rows: %s (ending with %zu events)",
			        mapi_strerror(ret), out.size());
			break;
		}
		if (rows.empty())
			break;
		for (const auto &row : rows) {
			calendar_event ev;
			if (!event_from_row(tags, row, ev))
				continue;
			if (!unbounded && (ev.nt_start > nt_we || ev.nt_end < nt_ws)) {
				mlog(LV_DEBUG, "calendar: dropping %s outside the window",
				        ev.entry_id.c_str());
				continue;
			}
			out.push_back(std::move(ev));
		}
	}
	return out;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1402: ENOMEM");
	return {};
}

}
