#include "process_settings.h"

#include <sys/stat.h>

namespace Authmap {

ProcessSettings ProcessSettings::Capture() {
	// umask() can only be read by setting it; restore immediately.
	mode_t current = ::umask(0);
	::umask(current);

	ProcessSettings settings;
	settings.umask = current;
	return settings;
}

} // namespace Authmap
