#pragma once
#include <string>
#include <string_view>
#include <json/value.h>
#include <mailbridge/bridge.hpp>
#include <mailbridge/defs.h>

namespace mailbridge {

/* JSON-RPC 2.0 error codes */
enum {
	RPC_PARSE_ERROR = -32700,
	RPC_INVALID_REQUEST = -32600,
	RPC_METHOD_NOT_FOUND = -32601,
	RPC_INVALID_PARAMS = -32602,
	RPC_INTERNAL_ERROR = -32603,
};

#define MAILBRIDGE_RPC_PROTOCOL "2024-11-05"

/* The tools/list result */
extern MB_EXPORT Json::Value rpc_tool_list();
/**
 * Process one request line and produce the response line in @response
 * (single-line JSON). Returns false if the request was a notification,
 * in which case no response must be sent. @indent governs the rendering
 * of tool result texts.
 */
extern MB_EXPORT bool rpc_handle(bridge &, std::string_view line,
	std::string &response, unsigned int indent = 2);

}
