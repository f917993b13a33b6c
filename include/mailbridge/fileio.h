#pragma once
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <fcntl.h>
#include <unistd.h>
#include <mailbridge/defs.h>
#include <mailbridge/util.hpp>

namespace mailbridge {

struct file_deleter {
	inline void operator()(FILE *f) const { fclose(f); }
};

struct stdlib_delete {
	inline void operator()(void *p) const { free(p); }
};

/**
 * Named temporary file. The file is removed when the object goes out of
 * scope or when close() is called, whichever comes first.
 */
class MB_EXPORT tmpfile {
	public:
	tmpfile() = default;
	~tmpfile() { close(); }
	NOMOVE(tmpfile);

	int open(const char *dir, const char *suffix = "", unsigned int flags = O_RDWR | O_TRUNC, unsigned int mode = 0600);
	void close();
	operator int() const { return m_fd; }
	const std::string &path() const { return m_path; }

	private:
	int m_fd = -1;
	std::string m_path;
};

}
