#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <mailbridge/defs.h>
#include <mailbridge/mapidefs.h>

namespace mailbridge {

/*
 * Accessor interface to a MAPI-style store. Every call returns an
 * ec_error_t for the call as a whole; properties that could not be read
 * individually are reported inside the returned rows as PT_ERROR values
 * (see TPROPVAL_ARRAY::error_of). Properties that are simply not set on
 * an object are absent from the row.
 *
 * The store has thread affinity: thread_init() must have succeeded on
 * the calling thread before any other call is made from that thread.
 */

/**
 * A view onto the items of one folder. restrict() narrows the view
 * further with every call. include_recurrences() makes the view yield
 * one row per occurrence of a recurring appointment; restrictions added
 * afterwards also bound the expansion.
 */
class MB_EXPORT content_table {
	public:
	virtual ~content_table() = default;
	virtual ec_error_t restrict(const RESTRICTION &) = 0;
	virtual ec_error_t include_recurrences(bool) = 0;
	virtual ec_error_t sort(const SORTORDER_SET &) = 0;
	virtual ec_error_t set_columns(const PROPTAG_ARRAY &) = 0;
	/* Fetch up to @max rows from the cursor. An empty set means the end. */
	virtual ec_error_t query_rows(uint32_t max, TARRAY_SET &) = 0;
	virtual ec_error_t get_row_count(uint32_t &) = 0;
};

class MB_EXPORT message_object {
	public:
	virtual ~message_object() = default;
	virtual ec_error_t get_properties(const PROPTAG_ARRAY &, TPROPVAL_ARRAY &) = 0;
	/* Rows of PR_ATTACH_NUM plus the requested columns. */
	virtual ec_error_t query_attachments(const PROPTAG_ARRAY &, TARRAY_SET &) = 0;
	virtual ec_error_t read_attachment(uint32_t attach_num, std::string &data) = 0;
	/* Export as RFC 5322 to @path. */
	virtual ec_error_t save_as(const char *path) = 0;
};

class MB_EXPORT folder_object {
	public:
	virtual ~folder_object() = default;
	virtual ec_error_t get_properties(const PROPTAG_ARRAY &, TPROPVAL_ARRAY &) = 0;
	virtual ec_error_t load_content_table(std::unique_ptr<content_table> &) = 0;
};

class MB_EXPORT store_client {
	public:
	virtual ~store_client() = default;
	virtual ec_error_t thread_init() = 0;
	virtual void thread_fini() = 0;
	/*
	 * Map named properties to property ids. Unknown names map to 0
	 * unless @create is set.
	 */
	virtual ec_error_t get_named_propids(bool create, const std::vector<PROPERTY_NAME> &, std::vector<uint16_t> &) = 0;
	/* Look up a folder by display name, case-insensitively. */
	virtual ec_error_t open_folder(const char *name, std::unique_ptr<folder_object> &) = 0;
	/* Look up any item by its binary entry id. */
	virtual ec_error_t open_message(const std::string &entryid, std::unique_ptr<message_object> &) = 0;
	/*
	 * The folder hierarchy in depth-first order, as rows of
	 * PR_DISPLAY_NAME, PR_ENTRYID, PR_PARENT_ENTRYID (absent for
	 * top-level folders), PR_CONTENT_COUNT and PR_DEPTH.
	 */
	virtual ec_error_t list_folders(TARRAY_SET &) = 0;
};

/*
 * Convert an identity as handed out in records back to the binary entry
 * id. Hex digits decode (either case); anything else is taken verbatim.
 * Returns false for an empty identity.
 */
extern MB_EXPORT bool eid_decode(const std::string &ident, std::string &bin);
/*
 * Render PR_ENTRYID of @row as identity string, always in hex (also for
 * textual ids); empty if unreadable.
 */
extern MB_EXPORT std::string eid_encode(const TPROPVAL_ARRAY &row, uint32_t tag = PR_ENTRYID);

}
