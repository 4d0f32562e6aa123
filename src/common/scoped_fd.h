// RAII wrapper for file descriptors (data file, output CSV).
// Ensures fd is closed on scope exit; prevents leaks on early return.
#ifndef STABPING_SRC_COMMON_SCOPED_FD_H_
#define STABPING_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Stabping {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			reset();
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	// Close now. Returns the result of close(2), or 0 if nothing was open.
	int reset() {
		int rc = 0;
		if (fd >= 0) {
			rc = ::close(fd);
			fd = -1;
		}
		return rc;
	}
};

}  // namespace Stabping

#endif  // STABPING_SRC_COMMON_SCOPED_FD_H_
