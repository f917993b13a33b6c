#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#define MB_EXPORT __attribute__((visibility("default")))
#define NOMOVE(K) \
	K(K &&) noexcept = delete; \
	void operator=(K &&) noexcept = delete;

enum gx_loglevel {
	LV_CRIT = 1,
	LV_ERR = 2,
	LV_WARN = 3,
	LV_NOTICE = 4,
	LV_INFO = 5,
	LV_DEBUG = 6,
};

/* MAPI error codes (MS-OXCDATA §2.4) as far as the store interface uses them */
enum ec_error_t : uint32_t {
	ecSuccess = 0,
	ecServerOOM = 0x000003F0,
	ecNullObject = 0x000004B9,
	ecError = 0x80004005,
	ecNotSupported = 0x80040102,
	ecNotFound = 0x8004010F,
	ecRpcFailed = 0x80040115,
	ecTooComplex = 0x80040117,
	ecNotInitialized = 0x80040605,
	ecAccessDenied = 0x80070005,
	ecMAPIOOM = 0x8007000E,
	ecInvalidParam = 0x80070057,
};

extern MB_EXPORT const char *mapi_errname_r(unsigned int, char *, size_t);
extern MB_EXPORT const char *mapi_strerror(unsigned int);


static inline const char *znul(const char *s) { return s != nullptr ? s : ""; }
