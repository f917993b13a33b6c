// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <string>
#include <libHX/ctype_helper.h>
#include <mailbridge/store.hpp>
#include <mailbridge/util.hpp>

namespace mailbridge {

bool eid_decode(const std::string &ident, std::string &bin)
{
	if (ident.empty())
		return false;
	bool hex = ident.size() % 2 == 0;
	for (auto c : ident)
		if (!HX_isxdigit(c)) {
			hex = false;
			break;
		}
	bin = hex ? hex2bin(ident) : ident;
	return !bin.empty();
}

std::string eid_encode(const TPROPVAL_ARRAY &row, uint32_t tag)
{
	/* textual ids are hex-encoded too, so eid_decode gets them back */
	auto b = row.get<BINARY>(tag);
	if (b != nullptr)
		return bin2hex(b->pv);
	auto s = row.get<std::string>(tag);
	return s != nullptr ? bin2hex(*s) : std::string();
}

}
