#pragma once
#include <string>
#include <vector>
#include <mailbridge/defs.h>
#include <mailbridge/records.hpp>

namespace mailbridge {

/**
 * Parse an RFC 5322 message and fill the envelope, header, body and
 * attachment fields of @out. Attachment contents are only kept if
 * @payloads is given (one entry per out.attachments element).
 * On failure, @reason says why and @out is unspecified.
 */
extern MB_EXPORT bool mime_parse(const std::string &raw, parsed_message &out,
	std::string &reason, std::vector<std::string> *payloads = nullptr);
/* The header block of @raw, without the separating empty line */
extern MB_EXPORT std::string mime_header_block(const std::string &raw);

}
