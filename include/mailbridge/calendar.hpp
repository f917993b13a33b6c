#pragma once
#include <cstdint>
#include <ctime>
#include <vector>
#include <mailbridge/defs.h>
#include <mailbridge/mapidefs.h>
#include <mailbridge/records.hpp>
#include <mailbridge/store.hpp>

namespace mailbridge {

/* Property tags of the named appointment properties in one store */
struct MB_EXPORT calendar_tags {
	calendar_tags() = default;
	ec_error_t resolve(store_client &);
	inline bool ok() const { return start != 0 && end != 0; }
	PROPTAG_ARRAY columns() const;

	uint32_t start = 0, end = 0, location = 0, subtype = 0;
	uint32_t stateflags = 0, respstatus = 0, to_attendees = 0, cc_attendees = 0;
};

/**
 * List the appointments of @calendar that overlap
 * [@window_start, @window_end], in ascending start order. With
 * @unbounded, the window is ignored and recurring series are reported
 * once, by their master item.
 */
extern MB_EXPORT std::vector<calendar_event> list_calendar(store_client &,
	folder_object &calendar, time_t window_start, time_t window_end,
	bool unbounded, unsigned int batch_size = 50);
extern MB_EXPORT bool event_from_row(const calendar_tags &, const TPROPVAL_ARRAY &, calendar_event &);
extern MB_EXPORT const char *response_status_name(uint32_t);
extern MB_EXPORT const char *meeting_status_name(uint32_t);

}
