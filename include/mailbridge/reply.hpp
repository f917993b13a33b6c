#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <mailbridge/defs.h>

namespace mailbridge {

/*
 * The newest part of a reply: the text in front of the first quote
 * marker (quoted lines, attribution lines, separators, header blocks),
 * trimmed. std::nullopt if nothing remains.
 */
extern MB_EXPORT std::optional<std::string> latest_reply(std::string_view body);
/* Subject without any number of leading reply/forward prefixes */
extern MB_EXPORT std::string normalize_subject(std::string_view);
/* Message-ID without angle brackets and surrounding whitespace */
extern MB_EXPORT std::string clean_message_id(std::string_view);

}
