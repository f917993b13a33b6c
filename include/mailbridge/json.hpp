#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <json/value.h>
#include <mailbridge/defs.h>
#include <mailbridge/records.hpp>

namespace mailbridge {

extern MB_EXPORT bool json_from_str(std::string_view, Json::Value &);
/* @indent = 0 gives single-line output */
extern MB_EXPORT std::string json_to_str(const Json::Value &, unsigned int indent = 0);

extern MB_EXPORT Json::Value to_json(const message_summary &);
extern MB_EXPORT Json::Value to_json(const message_detail &);
extern MB_EXPORT Json::Value to_json(const calendar_event &);
extern MB_EXPORT Json::Value to_json(const appointment_detail &);
extern MB_EXPORT Json::Value to_json(const task_item &);
extern MB_EXPORT Json::Value to_json(const folder_info &);
extern MB_EXPORT Json::Value to_json(const parsed_message &);
extern MB_EXPORT Json::Value to_json(const std::string &);

template<typename T> Json::Value to_json(const std::vector<T> &v)
{
	Json::Value a(Json::arrayValue);
	for (const auto &e : v)
		a.append(to_json(e));
	return a;
}

/* not-found maps to null */
template<typename T> Json::Value to_json(const std::optional<T> &v)
{
	return v.has_value() ? to_json(*v) : Json::Value(Json::nullValue);
}

}
