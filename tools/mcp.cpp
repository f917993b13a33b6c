// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
/*
 * Tool server speaking JSON-RPC 2.0 on stdin/stdout, one message per
 * line. Requests are handed to a fixed pool of workers that share one
 * store; stdout carries nothing but responses.
 */
#include <cerrno>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <libHX/io.h>
#include <libHX/option.h>
#include <libHX/string.h>
#include <mailbridge/bridge.hpp>
#include <mailbridge/config_file.hpp>
#include <mailbridge/database.h>
#include <mailbridge/rpc.hpp>
#include <mailbridge/scope.hpp>
#include <mailbridge/sqlite_store.hpp>
#include <mailbridge/thread_scope.hpp>
#include <mailbridge/util.hpp>

using namespace mailbridge;

static constexpr int EXIT_PARAM = 2;
static char *g_config_file, *g_store_path;

static constexpr HXoption g_options_table[] = {
	{nullptr, 'c', HXTYPE_STRING, &g_config_file, nullptr, nullptr, 0, "Config file to read", "FILE"},
	{nullptr, 's', HXTYPE_STRING, &g_store_path, nullptr, nullptr, 0, "Store database (overrides store_path)", "FILE"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

namespace {

struct request_queue {
	std::mutex lock;
	std::condition_variable cond;
	std::deque<std::string> items;
	bool closed = false;
};

}

static std::mutex g_out_lock;

static void send_line(const std::string &s)
{
	std::lock_guard hold(g_out_lock);
	if (fwrite(s.data(), s.size(), 1, stdout) != 1 || fputc('\n', stdout) == EOF ||
	    fflush(stdout) != 0)
		mlog(LV_ERR, "E-1440: stdout: %s", strerror(errno));
}

static void worker(bridge *br, request_queue *q, unsigned int indent)
{
	auto cl_0 = make_scope_exit([]() { store_thread_release(); });
	for (;;) {
		std::string line;
		{
			std::unique_lock hold(q->lock);
			q->cond.wait(hold, [&]() { return q->closed || !q->items.empty(); });
			if (q->items.empty())
				return;
			line = std::move(q->items.front());
			q->items.pop_front();
		}
		std::string response;
		if (rpc_handle(*br, line, response, indent))
			send_line(response);
	}
}

int main(int argc, char **argv)
{
	if (HX_getopt5(g_options_table, argv, &argc, &argv,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	auto cl_0 = make_scope_exit([=]() { HX_zvecfree(argv); });
	auto cfg = config_file_prg(g_config_file, "mailbridge.cfg", mailbridge_cfg_defaults);
	if (cfg == nullptr)
		return EXIT_FAILURE;
	mlog_init(cfg->get_value("log_file"), cfg->get_ll("log_level"));
	gx_sqlite_debug = cfg->get_ll("sqlite_debug");
	auto path = g_store_path != nullptr ? g_store_path : cfg->get_value("store_path");
	auto store = std::make_shared<sqlite_store>(path, cfg->get_ll("recurrence_limit"));
	bridge br(store, bridge_config(*cfg));
	if (br.warmup() != ecSuccess) {
		mlog(LV_ERR, "mcp: store %s could not be reached, exiting", path);
		return EXIT_FAILURE;
	}
	store_thread_release();

	unsigned int nthr = cfg->get_ll("worker_threads");
	unsigned int indent = cfg->get_ll("json_indent");
	request_queue queue;
	std::vector<std::thread> pool;
	pool.reserve(nthr);
	for (unsigned int i = 0; i < nthr; ++i)
		pool.emplace_back(worker, &br, &queue, indent);
	mlog(LV_NOTICE, "mcp: serving %s with %u workers", path, nthr);

	hxmc_t *line = nullptr;
	auto cl_1 = make_scope_exit([&]() { HXmc_free(line); });
	while (HX_getl(&line, stdin) != nullptr) {
		HX_chomp(line);
		if (*line == '\0')
			continue;
		std::lock_guard hold(queue.lock);
		queue.items.emplace_back(line);
		queue.cond.notify_one();
	}
	{
		std::lock_guard hold(queue.lock);
		queue.closed = true;
	}
	queue.cond.notify_all();
	for (auto &t : pool)
		t.join();
	return EXIT_SUCCESS;
}
