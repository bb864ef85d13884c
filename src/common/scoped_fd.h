// Owns one open descriptor and closes it on scope exit.
#ifndef AUTHMAP_SRC_COMMON_SCOPED_FD_H_
#define AUTHMAP_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

#include <cerrno>

namespace Authmap {

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

	// Closes now and reports the close(2) result; 0 when nothing was open.
	// Writes are only durable once this succeeds.
	int Close() {
		if (fd_ < 0) return 0;
		int rc = ::close(fd_);
		fd_ = -1;
		return rc;
	}

private:
	void Reset() {
		if (fd_ >= 0) {
			int saved = errno;
			::close(fd_);
			errno = saved;
			fd_ = -1;
		}
	}

	int fd_ = -1;
};

} // namespace Authmap

#endif // AUTHMAP_SRC_COMMON_SCOPED_FD_H_
