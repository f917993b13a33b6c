#pragma once
#include <chrono>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <mailbridge/config_file.hpp>
#include <mailbridge/dedup.hpp>
#include <mailbridge/defs.h>
#include <mailbridge/listing.hpp>
#include <mailbridge/mapidefs.h>
#include <mailbridge/records.hpp>
#include <mailbridge/store.hpp>

namespace mailbridge {

/* Directives of mailbridge.cfg, shared by all programs */
extern MB_EXPORT const cfg_directive mailbridge_cfg_defaults[];

struct MB_EXPORT bridge_config {
	bridge_config() = default;
	explicit bridge_config(const config_file &);

	unsigned int batch_size = LIST_BATCH_MAX, list_limit = 10;
	unsigned int search_limit = 100, calendar_days = 7;
	std::string inbox = "Inbox", calendar = "Calendar", tasks = "Tasks";
	std::string tmpdir = "/tmp";
	unsigned int warmup_attempts = 5;
	std::chrono::nanoseconds warmup_interval = std::chrono::milliseconds(500);
};

struct search_criteria {
	std::optional<std::string> subject, sender, body;
	std::optional<bool> unread, has_attachments;
};

/*
 * Translate @c into a restriction. Returns false if @c holds no
 * criterion at all, in which case @res is left alone.
 */
extern MB_EXPORT bool search_restriction(const search_criteria &c, RESTRICTION &res);
extern MB_EXPORT bool task_from_row(const TPROPVAL_ARRAY &, const PROPTAG_ARRAY &tags, task_item &);

/**
 * Binds a store to the configured well-known folders. Each operation
 * first makes sure the calling thread holds a store session, so one
 * bridge can be shared by any number of threads.
 */
class MB_EXPORT bridge {
	public:
	bridge(std::shared_ptr<store_client>, const bridge_config &);
	NOMOVE(bridge);

	/* Establish the thread session explicitly (e.g. to fail early) */
	ec_error_t attach();
	/*
	 * Try up to warmup_attempts times to count the items of the Inbox,
	 * pausing warmup_interval in between.
	 */
	ec_error_t warmup();

	std::vector<message_summary> list_emails(const char *folder, int limit);
	std::vector<message_summary> search_emails(const search_criteria &, const char *folder, int limit);
	std::optional<message_detail> get_email(const std::string &id);
	std::optional<parsed_message> get_email_parsed(const std::string &id, dedup_tier, bool strip_html);
	/* Window [now, now+days]; @all lists every appointment instead */
	std::vector<calendar_event> list_calendar(int days, bool all);
	std::vector<calendar_event> list_calendar(time_t start, time_t end, bool all);
	std::optional<appointment_detail> get_appointment(const std::string &id);
	std::vector<task_item> list_tasks(bool include_completed);
	std::optional<task_item> get_task(const std::string &id);
	std::vector<folder_info> list_folders();
	/* Paths of the written files; std::nullopt if @id does not resolve */
	std::optional<std::vector<std::string>> extract_attachments(const std::string &id, const char *dir);

	const bridge_config &config() const { return m_cfg; }

	private:
	std::unique_ptr<folder_object> open_folder(const char *name, bool inbox_fallback);
	std::unique_ptr<message_object> open_message(const std::string &id);
	ec_error_t task_columns(PROPTAG_ARRAY &);

	std::shared_ptr<store_client> m_store;
	bridge_config m_cfg;
};

}
