#pragma once
#include <optional>
#include <string>
#include <mailbridge/defs.h>
#include <mailbridge/records.hpp>
#include <mailbridge/store.hpp>

namespace mailbridge {

/* What a message says about the message it answers */
struct reply_evidence {
	std::string in_reply_to, subject;
	/* Message-ID of the reply itself, never its own parent */
	std::string message_id;
};

/* Answers whether the parent of a reply is present in the store */
class MB_EXPORT parent_locator {
	public:
	virtual ~parent_locator() = default;
	virtual bool by_message_id(const std::string &) = 0;
	/* @self_id: Message-ID (without brackets) of a message to disregard */
	virtual bool by_subject(const std::string &subject, const std::string &self_id) = 0;
};

/* Looks for parents in one folder of a store (normally the Inbox) */
class MB_EXPORT folder_parent_locator final : public parent_locator {
	public:
	folder_parent_locator(store_client &s, const char *folder) : m_store(s), m_folder(folder) {}
	bool by_message_id(const std::string &) override;
	bool by_subject(const std::string &subject, const std::string &self_id) override;

	private:
	bool exists(const RESTRICTION &);

	store_client &m_store;
	std::string m_folder;
};

struct tier_outcome {
	std::string body;
	std::optional<std::string> latest_reply;
	std::optional<bool> parent_found;
};

/**
 * Decide what the body of a message should be under @tier. With
 * dedup_tier::none, nothing is looked up and @body is returned as is.
 * Otherwise the latest reply is extracted, the parent is searched for
 * (by In-Reply-To; for medium and high also by normalized subject), and
 * the body is reduced to the latest reply only if the parent exists.
 */
extern MB_EXPORT tier_outcome evaluate_tier(dedup_tier tier,
	const reply_evidence &, parent_locator &, const std::string &body);

struct primary_attempt {
	bool ok = false;
	std::string reason;
	parsed_message msg;
};

/* Export @msg as RFC 5322 into a scratch file below @tmpdir and parse it */
extern MB_EXPORT primary_attempt primary_parse(message_object &msg, const char *tmpdir);
/* Build the record from the store's own properties */
extern MB_EXPORT ec_error_t fallback_parse(message_object &msg, parsed_message &out);
/* Apply the strip_html policy to body and text_html */
extern MB_EXPORT void normalize_html_body(parsed_message &, bool strip_html);

struct parse_options {
	std::string tmpdir = "/tmp", inbox = "Inbox";
};

/**
 * Structured record for one message. std::nullopt if the identity does
 * not resolve to a message. If the message opens but none of its content
 * can be read, a record with only the entry id (and empty body and
 * lists) is returned.
 */
extern MB_EXPORT std::optional<parsed_message> parse_message(store_client &,
	const parse_options &, const std::string &entry_id, dedup_tier,
	bool strip_html);

}
