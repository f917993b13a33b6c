// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
/*
 * JSON-RPC 2.0 request processing for the stdio tool server
 */
#include <cstring>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <json/value.h>
#include <mailbridge/bridge.hpp>
#include <mailbridge/json.hpp>
#include <mailbridge/rpc.hpp>
#include <mailbridge/util.hpp>

#ifndef PACKAGE_VERSION
#	define PACKAGE_VERSION "0"
#endif

using namespace std::string_literals;

namespace mailbridge {

namespace {

enum class targ { string, integer, boolean };

struct tool_param {
	const char *name = nullptr;
	targ type = targ::string;
	const char *desc = nullptr;
	bool required = false;
};

enum tool_status { TOOL_OK, TOOL_BADARGS };

using tool_fn = tool_status (*)(bridge &, const Json::Value &, Json::Value &);

struct tool_def {
	const char *name, *desc;
	std::vector<tool_param> params;
	tool_fn fn;
};

}

static std::optional<std::string> opt_string(const Json::Value &a, const char *k)
{
	if (!a.isMember(k) || a[k].isNull())
		return std::nullopt;
	return a[k].asString();
}

static std::optional<bool> opt_bool(const Json::Value &a, const char *k)
{
	if (!a.isMember(k) || a[k].isNull())
		return std::nullopt;
	return a[k].asBool();
}

static tool_status t_list_emails(bridge &br, const Json::Value &a, Json::Value &out)
{
	const auto &cfg = br.config();
	auto limit  = a.get("limit", cfg.list_limit).asInt();
	auto folder = a.get("folder", cfg.inbox).asString();
	out = to_json(br.list_emails(folder.c_str(), limit));
	return TOOL_OK;
}

static tool_status t_get_email(bridge &br, const Json::Value &a, Json::Value &out)
{
	out = to_json(br.get_email(a["entry_id"].asString()));
	return TOOL_OK;
}

static tool_status t_get_email_parsed(bridge &br, const Json::Value &a, Json::Value &out)
{
	auto tier = dedup_tier::none;
	auto ts = opt_string(a, "deduplication_tier");
	if (ts.has_value() && !dedup_tier_parse(ts->c_str(), tier))
		return TOOL_BADARGS;
	auto strip = a.get("strip_html", true).asBool();
	out = to_json(br.get_email_parsed(a["entry_id"].asString(), tier, strip));
	return TOOL_OK;
}

static tool_status t_search_emails(bridge &br, const Json::Value &a, Json::Value &out)
{
	const auto &cfg = br.config();
	search_criteria c;
	c.subject = opt_string(a, "subject");
	c.sender  = opt_string(a, "sender");
	c.body    = opt_string(a, "body");
	c.unread  = opt_bool(a, "unread");
	c.has_attachments = opt_bool(a, "has_attachments");
	auto limit  = a.get("limit", cfg.search_limit).asInt();
	auto folder = a.get("folder", cfg.inbox).asString();
	out = to_json(br.search_emails(c, folder.c_str(), limit));
	return TOOL_OK;
}

static tool_status t_list_calendar(bridge &br, const Json::Value &a, Json::Value &out)
{
	auto days = a.get("days", br.config().calendar_days).asInt();
	if (days < 0)
		return TOOL_BADARGS;
	out = to_json(br.list_calendar(days, a.get("all", false).asBool()));
	return TOOL_OK;
}

static tool_status t_get_appointment(bridge &br, const Json::Value &a, Json::Value &out)
{
	out = to_json(br.get_appointment(a["entry_id"].asString()));
	return TOOL_OK;
}

static tool_status t_list_tasks(bridge &br, const Json::Value &a, Json::Value &out)
{
	out = to_json(br.list_tasks(a.get("include_completed", false).asBool()));
	return TOOL_OK;
}

static tool_status t_get_task(bridge &br, const Json::Value &a, Json::Value &out)
{
	out = to_json(br.get_task(a["entry_id"].asString()));
	return TOOL_OK;
}

static tool_status t_list_folders(bridge &br, const Json::Value &, Json::Value &out)
{
	out = to_json(br.list_folders());
	return TOOL_OK;
}

static const tool_param p_entry_id = {"entry_id", targ::string, "Identity of the item", true};
static const tool_param p_folder = {"folder", targ::string, "Folder name (default: Inbox)"};

static const tool_def g_tools[] = {
	{"list_emails", "List the most recent messages of a folder",
	 {{"limit", targ::integer, "Maximum number of messages"}, p_folder},
	 t_list_emails},
	{"get_email", "Get one message including its body", {p_entry_id}, t_get_email},
	{"get_email_parsed", "Get one message as a structured record with optional quote stripping",
	 {p_entry_id,
	  {"deduplication_tier", targ::string, "none, low, medium or high"},
	  {"strip_html", targ::boolean, "Convert HTML bodies to text (default: true)"}},
	 t_get_email_parsed},
	{"search_emails", "Search messages by subject, sender, body and flags",
	 {{"subject", targ::string, "Subject substring"},
	  {"sender", targ::string, "Sender name or address substring"},
	  {"body", targ::string, "Body substring"},
	  {"unread", targ::boolean, "Only unread (true) or read (false) messages"},
	  {"has_attachments", targ::boolean, "Filter on attachment presence"},
	  {"limit", targ::integer, "Maximum number of messages"}, p_folder},
	 t_search_emails},
	{"list_calendar_events", "List appointments of the next days",
	 {{"days", targ::integer, "Window length in days"},
	  {"all", targ::boolean, "List all appointments regardless of date"}},
	 t_list_calendar},
	{"get_appointment", "Get one appointment including its body", {p_entry_id}, t_get_appointment},
	{"list_tasks", "List tasks",
	 {{"include_completed", targ::boolean, "Include completed tasks"}},
	 t_list_tasks},
	{"get_task", "Get one task", {p_entry_id}, t_get_task},
	{"list_folders", "List the folder hierarchy", {}, t_list_folders},
};

static const char *targ_name(targ t)
{
	switch (t) {
	case targ::integer: return "integer";
	case targ::boolean: return "boolean";
	default: return "string";
	}
}

static bool targ_match(targ t, const Json::Value &v)
{
	switch (t) {
	case targ::integer: return v.isInt();
	case targ::boolean: return v.isBool();
	default: return v.isString();
	}
}

Json::Value rpc_tool_list()
{
	Json::Value tools(Json::arrayValue);
	for (const auto &t : g_tools) {
		Json::Value d(Json::objectValue), schema(Json::objectValue);
		Json::Value props(Json::objectValue), req(Json::arrayValue);
		d["name"] = t.name;
		d["description"] = t.desc;
		schema["type"] = "object";
		for (const auto &p : t.params) {
			auto &e = props[p.name];
			e["type"] = targ_name(p.type);
			e["description"] = p.desc;
			if (p.required)
				req.append(p.name);
		}
		schema["properties"] = std::move(props);
		if (req.size() > 0)
			schema["required"] = std::move(req);
		d["inputSchema"] = std::move(schema);
		tools.append(std::move(d));
	}
	Json::Value r(Json::objectValue);
	r["tools"] = std::move(tools);
	return r;
}

static const tool_def *tool_lookup(const char *name)
{
	for (const auto &t : g_tools)
		if (strcmp(t.name, name) == 0)
			return &t;
	return nullptr;
}

static bool tool_args_valid(const tool_def &t, const Json::Value &args)
{
	for (const auto &p : t.params) {
		if (!args.isMember(p.name) || args[p.name].isNull()) {
			if (p.required)
				return false;
			continue;
		}
		if (!targ_match(p.type, args[p.name]))
			return false;
	}
	return true;
}

static Json::Value rpc_error(const Json::Value &id, int code, const char *msg)
{
	Json::Value r(Json::objectValue), e(Json::objectValue);
	r["jsonrpc"] = "2.0";
	r["id"] = id;
	e["code"] = code;
	e["message"] = msg;
	r["error"] = std::move(e);
	return r;
}

static Json::Value rpc_result(const Json::Value &id, Json::Value &&result)
{
	Json::Value r(Json::objectValue);
	r["jsonrpc"] = "2.0";
	r["id"] = id;
	r["result"] = std::move(result);
	return r;
}

static Json::Value tool_text(std::string &&text, bool is_error)
{
	Json::Value c(Json::objectValue), content(Json::arrayValue), r(Json::objectValue);
	c["type"] = "text";
	c["text"] = std::move(text);
	content.append(std::move(c));
	r["content"] = std::move(content);
	r["isError"] = is_error;
	return r;
}

static Json::Value rpc_tools_call(bridge &br, const Json::Value &id,
    const Json::Value &params, unsigned int indent)
{
	if (!params.isObject() || !params["name"].isString())
		return rpc_error(id, RPC_INVALID_PARAMS, "Missing tool name");
	auto name = params["name"].asString();
	auto tool = tool_lookup(name.c_str());
	if (tool == nullptr)
		return rpc_error(id, RPC_INVALID_PARAMS, "Unknown tool");
	Json::Value args = params.get("arguments", Json::Value(Json::objectValue));
	if (args.isNull())
		args = Json::Value(Json::objectValue);
	if (!args.isObject() || !tool_args_valid(*tool, args))
		return rpc_error(id, RPC_INVALID_PARAMS, "Invalid arguments");
	auto ret = br.attach();
	if (ret != ecSuccess) {
		char ebuf[32];
		mlog(LV_ERR, "rpc: %s: store session: %s", tool->name, mapi_strerror(ret));
		return rpc_result(id, tool_text("store unavailable: "s +
		       mapi_errname_r(ret, ebuf, std::size(ebuf)) + " (" +
		       mapi_strerror(ret) + ")", true));
	}
	Json::Value out;
	if (tool->fn(br, args, out) != TOOL_OK)
		return rpc_error(id, RPC_INVALID_PARAMS, "Invalid arguments");
	return rpc_result(id, tool_text(json_to_str(out, indent), false));
}

bool rpc_handle(bridge &br, std::string_view line, std::string &response,
    unsigned int indent) try
{
	Json::Value req;
	if (!json_from_str(line, req)) {
		response = json_to_str(rpc_error(Json::Value(), RPC_PARSE_ERROR, "Parse error"));
		return true;
	}
	if (!req.isObject() || !req["method"].isString()) {
		response = json_to_str(rpc_error(req.isObject() ? req["id"] : Json::Value(),
		           RPC_INVALID_REQUEST, "Invalid Request"));
		return true;
	}
	auto method = req["method"].asString();
	if (!req.isMember("id")) {
		/* notifications (notifications/initialized and others) get no answer */
		mlog(LV_DEBUG, "rpc: notification %s", method.c_str());
		return false;
	}
	const auto &id = req["id"];
	const auto &params = req["params"];
	mlog(LV_DEBUG, "rpc: %s", method.c_str());
	if (method == "initialize") {
		Json::Value r(Json::objectValue), caps(Json::objectValue), info(Json::objectValue);
		r["protocolVersion"] = params.isObject() && params["protocolVersion"].isString() ?
		                       params["protocolVersion"] : Json::Value(MAILBRIDGE_RPC_PROTOCOL);
		caps["tools"] = Json::Value(Json::objectValue);
		r["capabilities"] = std::move(caps);
		info["name"] = "mailbridge";
		info["version"] = PACKAGE_VERSION;
		r["serverInfo"] = std::move(info);
		response = json_to_str(rpc_result(id, std::move(r)));
	} else if (method == "ping") {
		response = json_to_str(rpc_result(id, Json::Value(Json::objectValue)));
	} else if (method == "tools/list") {
		response = json_to_str(rpc_result(id, rpc_tool_list()));
	} else if (method == "tools/call") {
		response = json_to_str(rpc_tools_call(br, id, params, indent));
	} else {
		response = json_to_str(rpc_error(id, RPC_METHOD_NOT_FOUND, "Method not found"));
	}
	return true;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1430: ENOMEM");
	response = "{\"jsonrpc\":\"2.0\",\"id\":null,\"error\":{\"code\":-32603,\"message\":\"Out of memory\"}}";
	return true;
} catch (const Json::Exception &e) {
	mlog(LV_ERR, "E-1431: rpc: %s", e.what());
	response = "{\"jsonrpc\":\"2.0\",\"id\":null,\"error\":{\"code\":-32603,\"message\":\"Internal error\"}}";
	return true;
}

}
