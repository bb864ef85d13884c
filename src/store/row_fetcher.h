#ifndef AUTHMAP_SRC_STORE_ROW_FETCHER_H_
#define AUTHMAP_SRC_STORE_ROW_FETCHER_H_

#include <string>
#include <utility>
#include <vector>

#include "../common/configuration.h"
#include "../snapshot/identity_record.h"
#include "connector.h"

namespace Authmap {

inline constexpr char kSiteGrant[] = "site";
inline constexpr char kGroupGrant[] = "group";

/**
 * Runs the logical reads of one snapshot and maps untyped rows into
 * RawIdentityRow / RoleGrantRow at the boundary. Shape violations
 * (wrong column count, missing or non-integer ids) are QueryError.
 */
class RowFetcher {
public:
	RowFetcher(Connector& connector, QuerySet queries)
		: connector_(connector), queries_(std::move(queries)) {}

	std::vector<RawIdentityRow> FetchIdentities();

	// Site grants first, then group grants.
	std::vector<RoleGrantRow> FetchRoleGrants();

private:
	void FetchGrants(const std::string& sql, const char* default_kind, std::vector<RoleGrantRow>& out);

	Connector& connector_;
	QuerySet queries_;
};

} // namespace Authmap

#endif // AUTHMAP_SRC_STORE_ROW_FETCHER_H_
