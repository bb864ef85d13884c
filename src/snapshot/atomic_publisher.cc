#include "atomic_publisher.h"

#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <glog/logging.h>

#include "../common/errors.h"
#include "../common/scoped_fd.h"

namespace Authmap {

namespace fs = std::filesystem;

namespace {

// Unlinks the temporary file unless it was renamed into place.
class TempFileGuard {
public:
	explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
	~TempFileGuard() {
		if (!path_.empty() && ::unlink(path_.c_str()) != 0 && errno != ENOENT) {
			PLOG(WARNING) << "Failed to remove temporary file " << path_;
		}
	}
	TempFileGuard(const TempFileGuard&) = delete;
	TempFileGuard& operator=(const TempFileGuard&) = delete;

	const std::string& path() const { return path_; }
	void Release() { path_.clear(); }

private:
	std::string path_;
};

void WriteAll(int fd, const std::string& content, const std::string& path) {
	const char* p = content.data();
	size_t left = content.size();
	while (left > 0) {
		ssize_t n = ::write(fd, p, left);
		if (n < 0) {
			if (errno == EINTR) continue;
			throw PublishError("write failed for " + path, errno);
		}
		p += n;
		left -= static_cast<size_t>(n);
	}
}

} // namespace

const char* PublishOutcomeName(PublishOutcome outcome) {
	switch (outcome) {
		case PublishOutcome::kUpToDate:
			return "up-to-date";
		case PublishOutcome::kUpdated:
			return "updated";
	}
	return "unknown";
}

std::string AtomicPublisher::ReadCurrent(const std::string& path) {
	std::ifstream in(path, std::ios::binary);
	if (!in.is_open()) {
		return std::string();
	}
	std::ostringstream buf;
	buf << in.rdbuf();
	if (in.bad()) {
		return std::string();
	}
	return buf.str();
}

PublishOutcome AtomicPublisher::Publish(const std::string& target, const std::string& content) const {
	if (ReadCurrent(target) == content) {
		LOG_IF(INFO, verbose_) << target << ": up-to-date";
		return PublishOutcome::kUpToDate;
	}
	LOG_IF(INFO, verbose_) << target << ": updating contents";

	fs::path target_path(target);
	fs::path dir = target_path.parent_path();
	if (dir.empty()) {
		dir = ".";
	}
	std::string tmpl = (dir / ("." + target_path.filename().string() + ".XXXXXX")).string();
	std::vector<char> name(tmpl.begin(), tmpl.end());
	name.push_back('\0');

	ScopedFd fd(::mkstemp(name.data()));
	if (!fd.valid()) {
		throw PublishError("cannot create temporary file in " + dir.string(), errno);
	}
	TempFileGuard tmp(name.data());

	WriteAll(fd.get(), content, tmp.path());
	if (::fchmod(fd.get(), settings_.FileMode()) != 0) {
		throw PublishError("chmod failed for " + tmp.path(), errno);
	}
	if (::fsync(fd.get()) != 0) {
		throw PublishError("fsync failed for " + tmp.path(), errno);
	}
	if (fd.Close() != 0) {
		throw PublishError("close failed for " + tmp.path(), errno);
	}
	if (::rename(tmp.path().c_str(), target.c_str()) != 0) {
		throw PublishError("cannot rename " + tmp.path() + " to " + target, errno);
	}
	tmp.Release();

	VLOG(1) << "Published " << content.size() << " bytes to " << target;
	return PublishOutcome::kUpdated;
}

} // namespace Authmap
