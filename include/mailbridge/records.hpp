#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <mailbridge/defs.h>

namespace mailbridge {

/* Local-time "YYYY-MM-DD HH:MM:SS" strings unless noted otherwise */

struct message_summary {
	std::string entry_id, subject, sender, sender_name;
	std::optional<std::string> received_time;
	bool unread = false, has_attachments = false;
};

struct message_detail : public message_summary {
	std::string body, html_body;
};

struct calendar_event {
	std::string entry_id, subject = "(No Subject)", start;
	std::optional<std::string> end, organizer;
	std::string location, required_attendees, optional_attendees;
	const char *response_status = "None", *meeting_status = "NonMeeting";
	bool all_day = false, response_requested = false;
	/* NT time of start and end, for ordering and window checks */
	uint64_t nt_start = 0, nt_end = 0;
};

struct appointment_detail : public calendar_event {
	std::string body;
};

struct task_item {
	std::string entry_id, subject, body;
	std::optional<std::string> due_date;
	std::optional<uint32_t> status, priority;
	bool complete = false;
	double percent_complete = 0;
};

struct folder_info {
	std::string name, entry_id;
	std::optional<std::string> parent_name, parent_id;
	uint32_t number_of_items = 0, depth = 0;
	std::string path;
};

using address_pair = std::pair<std::string, std::string>;

struct attachment_info {
	std::string filename, content_type;
	uint64_t size = 0;
	std::optional<std::string> content_id;
};

struct received_hop {
	std::string from, by, with, id, for_, date;
};

enum class dedup_tier {
	none, low, medium, high,
};

extern MB_EXPORT const char *dedup_tier_name(dedup_tier);
extern MB_EXPORT bool dedup_tier_parse(const char *, dedup_tier &);

struct parsed_message {
	std::string entry_id, subject;
	std::vector<address_pair> from, to, cc, bcc;
	std::optional<std::string> date;
	std::string message_id, in_reply_to;
	std::vector<std::pair<std::string, std::string>> headers;
	std::vector<std::string> text_plain, text_html;
	std::string body;
	std::vector<attachment_info> attachments;
	std::vector<received_hop> received;
	std::optional<std::string> latest_reply;
	dedup_tier deduplication_tier = dedup_tier::none;
	std::optional<bool> parent_found;
};

}
