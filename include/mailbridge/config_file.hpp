#pragma once
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <mailbridge/defs.h>
#define CFG_TABLE_END {}

enum cfg_flags {
	CFG_BOOL = 0x1U,
	CFG_SIZE = 0x2U,
	CFG_TIME = 0x4U,
	CFG_TIME_NS = 0x10U,
};

/**
 * @deflt:	default value for this key.
 * @min,@max:	clamp value to minimum/maximum (only if %CFG_SIZE,%CFG_TIME)
 */
struct cfg_directive {
	const char *key = nullptr, *deflt = nullptr;
	unsigned int flags = 0;
	const char *min = nullptr, *max = nullptr;
};

struct MB_EXPORT cfg_error : public std::runtime_error {
	cfg_error(const char *key) : std::runtime_error(key) {}
};

class MB_EXPORT config_file {
	public:
	config_file() = default;
	const char *get_value(const char *key) const __attribute__((nonnull(2)));
	unsigned long long get_ll(const char *key) const __attribute__((nonnull(2)));
	void set_value(const char *k, const char *v) __attribute__((nonnull(2,3)));

	std::string m_filename;

	private:
	std::map<std::string, std::string> m_vars;
};

#define MAILBRIDGE_SYSCONFDIR "/etc/mailbridge"

extern MB_EXPORT std::shared_ptr<config_file> config_file_init(const char *filename, const cfg_directive *);
extern MB_EXPORT std::shared_ptr<config_file> config_file_initd(const char *basename, const char *searchdirs, const cfg_directive *);
extern MB_EXPORT std::shared_ptr<config_file> config_file_prg(const char *priority_location, const char *fallback_location_basename, const cfg_directive *);
