// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cstdio>
#include <iterator>
#include <libHX/string.h>
#include <mailbridge/defs.h>

static const char *mapi_errname(unsigned int e)
{
#define E(s) case (s): return #s;
	switch(e) {
	E(ecSuccess)
	E(ecServerOOM)
	E(ecNullObject)
	E(ecError)
	E(ecNotSupported)
	E(ecNotFound)
	E(ecRpcFailed)
	E(ecTooComplex)
	E(ecNotInitialized)
	E(ecAccessDenied)
	E(ecMAPIOOM)
	E(ecInvalidParam)
	default: {
		thread_local char xbuf[32];
		snprintf(xbuf, std::size(xbuf), "%xh", e);
		return xbuf;
	}
	}
#undef E
}

const char *mapi_errname_r(unsigned int e, char *b, size_t bz)
{
	HX_strlcpy(b, mapi_errname(e), bz);
	return b;
}

const char *mapi_strerror(unsigned int e)
{
#define E(v, s) case v: return s;
	switch (e) {
	E(ecSuccess, "Success")
	E(ecServerOOM, "Store backend out of memory")
	E(ecNullObject, "No store object given")
	E(ecError, "Unspecified store error")
	E(ecNotSupported, "Operation not supported by the store")
	E(ecNotFound, "Object not found in the store")
	E(ecRpcFailed, "Store connection failed")
	E(ecTooComplex, "Request too complex for the store (unbounded expansion?)")
	E(ecNotInitialized, "No store session on this thread")
	E(ecAccessDenied, "Access to the store denied")
	E(ecMAPIOOM, "Out of memory")
	E(ecInvalidParam, "Invalid parameter")
	default: {
		thread_local char xbuf[40];
		snprintf(xbuf, sizeof(xbuf), "Unknown store error %xh", e);
		return xbuf;
	}
	}
#undef E
}
