// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <mailbridge/listing.hpp>
#include <mailbridge/rop_util.hpp>
#include <mailbridge/util.hpp>

namespace mailbridge {

const PROPTAG_ARRAY &summary_columns()
{
	static const PROPTAG_ARRAY tags = {
		PR_ENTRYID, PR_SUBJECT, PR_SENDER_NAME, PR_SENDER_EMAIL_ADDRESS,
		PR_MESSAGE_DELIVERY_TIME, PR_MESSAGE_FLAGS, PR_HASATTACH,
	};
	return tags;
}

/**
 * Returns false if the row cannot be turned into a summary: a column
 * faulted, or the identity is missing.
 */
bool summary_from_row(const TPROPVAL_ARRAY &row, message_summary &sum)
{
	for (auto tag : summary_columns()) {
		if (!row.fault(tag))
			continue;
		mlog(LV_DEBUG, "list: skipping row, column %xh: %s", tag,
		        mapi_strerror(row.error_of(tag)));
		return false;
	}
	sum.entry_id = eid_encode(row);
	if (sum.entry_id.empty()) {
		mlog(LV_DEBUG, "list: skipping row without identity");
		return false;
	}
	sum.subject     = row.get_or<std::string>(PR_SUBJECT, "");
	sum.sender_name = row.get_or<std::string>(PR_SENDER_NAME, "");
	sum.sender      = row.get_or<std::string>(PR_SENDER_EMAIL_ADDRESS, "");
	auto dt = row.get<uint64_t>(PR_MESSAGE_DELIVERY_TIME);
	if (dt != nullptr)
		sum.received_time = localtime_str(rop_util_nttime_to_unix(*dt));
	else
		sum.received_time.reset();
	auto flags = row.get<uint32_t>(PR_MESSAGE_FLAGS);
	sum.unread = flags != nullptr && !(*flags & MSGFLAG_READ);
	sum.has_attachments = row.get_or<uint8_t>(PR_HASATTACH, 0) != 0;
	return true;
}

std::vector<message_summary> list_messages(folder_object &folder, int limit,
    unsigned int batch_size, const RESTRICTION *res) try
{
	std::vector<message_summary> out;
	if (limit <= 0)
		return out;
	batch_size = std::clamp(batch_size, 1U, LIST_BATCH_MAX);

	std::unique_ptr<content_table> table;
	auto ret = folder.load_content_table(table);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "list: load_content_table: %s", mapi_strerror(ret));
		return out;
	}
	if (res != nullptr) {
		ret = table->restrict(*res);
		if (ret != ecSuccess) {
			mlog(LV_ERR, "list: restrict %s: %s", res->repr().c_str(),
			        mapi_strerror(ret));
			return out;
		}
	}
	ret = table->set_columns(summary_columns());
	if (ret != ecSuccess) {
		mlog(LV_ERR, "list: set_columns: %s", mapi_strerror(ret));
		return out;
	}
	ret = table->sort({{PR_MESSAGE_DELIVERY_TIME, TABLE_SORT_DESCEND}});
	if (ret != ecSuccess) {
		mlog(LV_ERR, "list: sort: %s", mapi_strerror(ret));
		return out;
	}

	size_t want = limit;
	out.reserve(std::min(want, static_cast<size_t>(LIST_BATCH_MAX)));
	while (out.size() < want) {
		uint32_t n = std::min(want - out.size(), static_cast<size_t>(batch_size));
		TARRAY_SET rows;
		ret = table->query_rows(n, rows);
		if (ret != ecSuccess) {
			mlog(LV_ERR, "list: query_rows: %s (ending with %zu items)",
			        mapi_strerror(ret), out.size());
			break;
		}
		if (rows.empty())
			break;
		for (const auto &row : rows) {
			if (out.size() >= want)
				break;
			message_summary sum;
			if (summary_from_row(row, sum))
				out.push_back(std::move(sum));
		}
	}
	return out;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1401: ENOMEM");
	return {};
}

}
