#include "role_aggregator.h"

#include <glog/logging.h>

#include "validators.h"

namespace Authmap {

bool RoleAggregator::Attach(const RoleGrantRow& grant) {
	auto it = grant.identity_id ? identities_.find(*grant.identity_id) : identities_.end();
	if (it == identities_.end()) {
		++orphaned_;
		VLOG(3) << "Dropping " << grant.kind << " grant '" << grant.role_title
			<< "' without a retained identity";
		return false;
	}

	it->second.roles[NormalizeRoleToken(grant.role_title)].push_back(
		grant.kind + ":" + NormalizeRoleToken(grant.entity_name));
	++attached_;
	return true;
}

} // namespace Authmap
