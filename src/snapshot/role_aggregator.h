#ifndef AUTHMAP_SRC_SNAPSHOT_ROLE_AGGREGATOR_H_
#define AUTHMAP_SRC_SNAPSHOT_ROLE_AGGREGATOR_H_

#include <cstddef>

#include "identity_record.h"

namespace Authmap {

/**
 * Attaches role grants to already retained identity records.
 * Grants for identities that are not in the table are dropped and
 * counted; that is expected whenever the sanitizer discarded someone.
 */
class RoleAggregator {
public:
	explicit RoleAggregator(IdentityTable& identities) : identities_(identities) {}

	// Returns false when the grant had no matching identity.
	bool Attach(const RoleGrantRow& grant);

	size_t attached() const { return attached_; }
	size_t orphaned() const { return orphaned_; }

private:
	IdentityTable& identities_;
	size_t attached_ = 0;
	size_t orphaned_ = 0;
};

} // namespace Authmap

#endif // AUTHMAP_SRC_SNAPSHOT_ROLE_AGGREGATOR_H_
