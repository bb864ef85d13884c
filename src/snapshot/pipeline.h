#ifndef AUTHMAP_SRC_SNAPSHOT_PIPELINE_H_
#define AUTHMAP_SRC_SNAPSHOT_PIPELINE_H_

#include <cstddef>
#include <iosfwd>
#include <string>

#include "../common/configuration.h"
#include "../common/process_settings.h"
#include "../store/connector.h"
#include "atomic_publisher.h"

namespace Authmap {

struct SnapshotOptions {
	std::string output_path;
	bool verbose = false;
};

struct SnapshotStats {
	size_t identity_rows = 0;
	size_t kept = 0;
	size_t duplicates = 0;
	size_t unsafe = 0;
	size_t deactivated = 0;
	size_t locked = 0;
	size_t grants_attached = 0;
	size_t grants_orphaned = 0;
	PublishOutcome outcome = PublishOutcome::kUpToDate;
};

std::ostream& operator<<(std::ostream& os, const SnapshotStats& stats);

/**
 * One complete run: connect, fetch, sanitize, aggregate roles,
 * canonicalize and publish. Systemic failures propagate as exceptions
 * wrapped with the stage they happened in (see DescribeNested).
 */
SnapshotStats RunSnapshot(Connector& connector, const QuerySet& queries,
		const SnapshotOptions& options, const ProcessSettings& settings);

} // namespace Authmap

#endif // AUTHMAP_SRC_SNAPSHOT_PIPELINE_H_
