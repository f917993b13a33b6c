#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <mailbridge/defs.h>

namespace mailbridge {

/* A '<' immediately followed by a letter, with a '>' somewhere after it */
extern MB_EXPORT bool looks_like_html(std::string_view);
/*
 * Render HTML as plain text: tags dropped, style/script contents
 * skipped, entities decoded, block elements on lines of their own.
 * Returns 0 on success or a negative errno.
 */
extern MB_EXPORT int html_to_plain(std::string_view in, std::string &out);
extern MB_EXPORT void utf8_append(std::string &, uint32_t codepoint);

}
