// RAII wrapper for the pipe ends shared with optimizer child processes.
#ifndef WIPFLOW_SRC_COMMON_SCOPED_FD_H_
#define WIPFLOW_SRC_COMMON_SCOPED_FD_H_

#include <fcntl.h>
#include <unistd.h>

namespace Wipflow {

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

	void reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}

	bool SetNonBlocking() const {
		int flags = ::fcntl(fd, F_GETFL, 0);
		return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
	}
};

/// Read end first, write end second. Both close-on-exec.
struct ScopedPipe {
	ScopedFd read_end;
	ScopedFd write_end;

	bool Open() {
		int fds[2];
		if (::pipe2(fds, O_CLOEXEC) != 0) return false;
		read_end = ScopedFd(fds[0]);
		write_end = ScopedFd(fds[1]);
		return true;
	}
};

} // namespace Wipflow

#endif  // WIPFLOW_SRC_COMMON_SCOPED_FD_H_
