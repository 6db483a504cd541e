// Owns a POSIX file descriptor (uinput device node) and closes it on scope exit.
#ifndef ROUNDWATCH_SRC_COMMON_SCOPED_FD_H_
#define ROUNDWATCH_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Roundwatch {

class ScopedFd {
public:
	ScopedFd() = default;
	explicit ScopedFd(int fd) : fd_(fd) {}

	~ScopedFd() { Reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			Reset();
			fd_ = o.fd_;
			o.fd_ = -1;
		}
		return *this;
	}

	int get() const { return fd_; }
	bool valid() const { return fd_ >= 0; }

	void Reset() {
		if (fd_ >= 0) {
			::close(fd_);
			fd_ = -1;
		}
	}

private:
	int fd_ = -1;
};

} // namespace Roundwatch

#endif  // ROUNDWATCH_SRC_COMMON_SCOPED_FD_H_
