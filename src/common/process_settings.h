#ifndef AUTHMAP_SRC_COMMON_PROCESS_SETTINGS_H_
#define AUTHMAP_SRC_COMMON_PROCESS_SETTINGS_H_

#include <sys/types.h>

namespace Authmap {

/// Process-wide state the pipeline depends on, read once at start-up and
/// then passed around by value.
struct ProcessSettings {
	/// Active file-creation mask.
	mode_t umask = 022;

	/// Permission bits for newly published files: 0666 minus the mask.
	mode_t FileMode() const { return static_cast<mode_t>(0666 & ~umask); }

	/// Reads the current umask without changing it.
	static ProcessSettings Capture();
};

} // namespace Authmap

#endif // AUTHMAP_SRC_COMMON_PROCESS_SETTINGS_H_
