// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <string>
#include <json/value.h>
#include <mailbridge/bridge.hpp>
#include <mailbridge/json.hpp>
#include <mailbridge/rpc.hpp>
#include <mailbridge/thread_scope.hpp>
#include "fakestore.hpp"
#undef assert
#define assert(x) do { if (!(x)) { printf("%s failed\n", #x); return EXIT_FAILURE; } } while (false)
using namespace mailbridge;

static std::shared_ptr<fake::store> make_store()
{
	auto st = std::make_shared<fake::store>();
	auto &inbox = st->add_folder("Inbox");
	for (unsigned int i = 0; i < 5; ++i)
		inbox.items.push_back(fake::mail("m" + std::to_string(i),
			"Subject " + std::to_string(i), 1704067200 + i * 60));
	st->add_folder("Calendar");
	st->add_folder("Tasks");
	return st;
}

static bool call(bridge &br, const char *req, Json::Value &resp)
{
	std::string out;
	if (!rpc_handle(br, req, out))
		return false;
	printf("%s\n", out.c_str());
	return json_from_str(out, resp);
}

static int error_code(const Json::Value &resp)
{
	return resp["error"]["code"].asInt();
}

static int t_protocol()
{
	bridge br(make_store(), bridge_config{});
	Json::Value r;
	assert(call(br, "{not json", r));
	assert(error_code(r) == RPC_PARSE_ERROR && r["id"].isNull());
	assert(call(br, "[1,2]", r));
	assert(error_code(r) == RPC_INVALID_REQUEST);
	assert(call(br, R"({"jsonrpc":"2.0","id":7})", r));
	assert(error_code(r) == RPC_INVALID_REQUEST && r["id"].asInt() == 7);

	std::string out;
	assert(!rpc_handle(br, R"({"jsonrpc":"2.0","method":"notifications/initialized"})", out));

	assert(call(br, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})", r));
	assert(r["id"].asInt() == 1);
	assert(r["result"]["protocolVersion"].asString() == MAILBRIDGE_RPC_PROTOCOL);
	assert(r["result"]["serverInfo"]["name"].asString() == "mailbridge");
	assert(r["result"]["capabilities"].isMember("tools"));

	assert(call(br, R"({"jsonrpc":"2.0","id":"p","method":"ping"})", r));
	assert(r["id"].asString() == "p" && r["result"].isObject());
	assert(call(br, R"({"jsonrpc":"2.0","id":2,"method":"resources/list"})", r));
	assert(error_code(r) == RPC_METHOD_NOT_FOUND);
	return EXIT_SUCCESS;
}

static int t_tool_list()
{
	auto tl = rpc_tool_list();
	const auto &tools = tl["tools"];
	assert(tools.size() == 9);
	bool seen = false;
	for (const auto &t : tools) {
		assert(t["inputSchema"]["type"].asString() == "object");
		if (t["name"].asString() != "get_email_parsed")
			continue;
		seen = true;
		const auto &p = t["inputSchema"]["properties"];
		assert(p["strip_html"]["type"].asString() == "boolean");
		assert(p["deduplication_tier"]["type"].asString() == "string");
		assert(t["inputSchema"]["required"][0].asString() == "entry_id");
	}
	assert(seen);
	return EXIT_SUCCESS;
}

static int t_tool_call()
{
	bridge br(make_store(), bridge_config{});
	Json::Value r, inner;
	assert(call(br, R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"list_emails","arguments":{"limit":2}}})", r));
	assert(!r["result"]["isError"].asBool());
	assert(r["result"]["content"][0]["type"].asString() == "text");
	assert(json_from_str(r["result"]["content"][0]["text"].asString(), inner));
	assert(inner.isArray() && inner.size() == 2);
	assert(inner[0]["subject"].asString() == "Subject 4");
	assert(inner[0]["entry_id"].asString() == bin2hex("m4"));

	assert(call(br, R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"get_email","arguments":{"entry_id":"ffff"}}})", r));
	assert(json_from_str(r["result"]["content"][0]["text"].asString(), inner));
	assert(inner.isNull());

	assert(call(br, R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"list_folders"}})", r));
	assert(json_from_str(r["result"]["content"][0]["text"].asString(), inner));
	assert(inner.size() == 4);

	/* argument validation */
	assert(call(br, R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"list_emails","arguments":{"limit":"ten"}}})", r));
	assert(error_code(r) == RPC_INVALID_PARAMS);
	assert(call(br, R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"get_email","arguments":{}}})", r));
	assert(error_code(r) == RPC_INVALID_PARAMS);
	assert(call(br, R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"no_such_tool"}})", r));
	assert(error_code(r) == RPC_INVALID_PARAMS);
	assert(call(br, R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"list_calendar_events","arguments":{"days":-1}}})", r));
	assert(error_code(r) == RPC_INVALID_PARAMS);
	assert(call(br, R"({"jsonrpc":"2.0","id":10,"method":"tools/call","params":{"name":"get_email_parsed","arguments":{"entry_id":"00","deduplication_tier":"bogus"}}})", r));
	assert(error_code(r) == RPC_INVALID_PARAMS);
	return EXIT_SUCCESS;
}

static int t_unavailable()
{
	auto st = make_store();
	st->init_result = ecRpcFailed;
	bridge br(st, bridge_config{});
	Json::Value r;
	assert(call(br, R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"list_emails"}})", r));
	assert(r["result"]["isError"].asBool());
	assert(r["result"]["content"][0]["text"].asString().find("store unavailable") == 0);
	assert(r["result"]["content"][0]["text"].asString().find("ecRpcFailed") != std::string::npos);
	store_thread_release();
	return EXIT_SUCCESS;
}

int main()
{
	setenv("TZ", "UTC", 1);
	tzset();
	using fpt = decltype(&t_protocol);
	fpt fct[] = {t_protocol, t_tool_list, t_tool_call, t_unavailable};
	for (auto f : fct)
		if (f() != EXIT_SUCCESS)
			return EXIT_FAILURE;
	return EXIT_SUCCESS;
}
