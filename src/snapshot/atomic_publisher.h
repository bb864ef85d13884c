#ifndef AUTHMAP_SRC_SNAPSHOT_ATOMIC_PUBLISHER_H_
#define AUTHMAP_SRC_SNAPSHOT_ATOMIC_PUBLISHER_H_

#include <string>

#include "../common/process_settings.h"

namespace Authmap {

enum class PublishOutcome {
	kUpToDate,
	kUpdated,
};

const char* PublishOutcomeName(PublishOutcome outcome);

/**
 * Replaces a file's contents without ever exposing a partial file.
 *
 * New content goes to a temporary file created next to the target (same
 * directory, so the same filesystem), is flushed, given mode
 * 0666 & ~umask and then renamed over the target. The rename is the only
 * mutation visible at the target path. When the target already holds the
 * exact bytes nothing is written at all.
 */
class AtomicPublisher {
public:
	explicit AtomicPublisher(ProcessSettings settings, bool verbose = false)
		: settings_(settings), verbose_(verbose) {}

	/// Throws PublishError; the temporary file is removed on failure.
	PublishOutcome Publish(const std::string& target, const std::string& content) const;

	/// Current contents, or "" when the file is missing or unreadable.
	static std::string ReadCurrent(const std::string& path);

private:
	ProcessSettings settings_;
	bool verbose_;
};

} // namespace Authmap

#endif // AUTHMAP_SRC_SNAPSHOT_ATOMIC_PUBLISHER_H_
