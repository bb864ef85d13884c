#include "pipeline.h"

#include <ostream>

#include <glog/logging.h>

#include "absl/container/btree_set.h"

#include "../common/errors.h"
#include "../store/row_fetcher.h"
#include "canonicalizer.h"
#include "identity_sanitizer.h"
#include "role_aggregator.h"

namespace Authmap {

std::ostream& operator<<(std::ostream& os, const SnapshotStats& stats) {
	return os << "rows=" << stats.identity_rows
		<< " kept=" << stats.kept
		<< " duplicates=" << stats.duplicates
		<< " unsafe=" << stats.unsafe
		<< " deactivated=" << stats.deactivated
		<< " locked=" << stats.locked
		<< " grants=" << stats.grants_attached
		<< " orphan_grants=" << stats.grants_orphaned
		<< " output=" << PublishOutcomeName(stats.outcome);
}

SnapshotStats RunSnapshot(Connector& connector, const QuerySet& queries,
		const SnapshotOptions& options, const ProcessSettings& settings) {
	SnapshotStats stats;
	RowFetcher fetcher(connector, queries);

	try {
		connector.Connect();
	} catch (const std::exception&) {
		std::throw_with_nested(Error("connecting to the identity store"));
	}

	std::vector<RawIdentityRow> rows;
	try {
		rows = fetcher.FetchIdentities();
	} catch (const std::exception&) {
		std::throw_with_nested(Error("fetching identities"));
	}
	stats.identity_rows = rows.size();

	IdentitySanitizer sanitizer(options.verbose);
	IdentityTable identities;
	// Ids are unique in the store. On a duplicate the first row decides,
	// even when it is discarded.
	absl::btree_set<IdentityId> seen;
	for (const auto& row : rows) {
		if (!seen.insert(row.id).second) {
			++stats.duplicates;
			LOG_IF(WARNING, options.verbose) << "id=" << row.id << ": duplicate identity row ignored";
			continue;
		}
		SanitizeResult result = sanitizer.Sanitize(row);
		if (!result.kept()) {
			if (result.reason == DiscardReason::kUnsafe) ++stats.unsafe;
			if (result.reason == DiscardReason::kDeactivated) ++stats.deactivated;
			continue;
		}
		if (result.locked) ++stats.locked;
		identities.emplace(row.id, std::move(*result.record));
	}
	stats.kept = identities.size();

	std::vector<RoleGrantRow> grants;
	try {
		grants = fetcher.FetchRoleGrants();
	} catch (const std::exception&) {
		std::throw_with_nested(Error("fetching role grants"));
	}

	RoleAggregator aggregator(identities);
	for (const auto& grant : grants) {
		aggregator.Attach(grant);
	}
	stats.grants_attached = aggregator.attached();
	stats.grants_orphaned = aggregator.orphaned();

	const std::string content = Canonicalize(identities);

	AtomicPublisher publisher(settings, options.verbose);
	try {
		stats.outcome = publisher.Publish(options.output_path, content);
	} catch (const std::exception&) {
		std::throw_with_nested(Error("publishing " + options.output_path));
	}
	return stats;
}

} // namespace Authmap
