#include "row_fetcher.h"

#include <glog/logging.h>

#include "absl/strings/numbers.h"

#include "../common/errors.h"

namespace Authmap {

namespace {

constexpr size_t kIdentityColumns = 6;
constexpr size_t kGrantColumns = 4;

IdentityId ParseId(const std::string& text, const char* what) {
	IdentityId id;
	if (!absl::SimpleAtoi(text, &id)) {
		throw QueryError(std::string(what) + " is not an integer: '" + text + "'");
	}
	return id;
}

} // namespace

std::vector<RawIdentityRow> RowFetcher::FetchIdentities() {
	std::vector<RawIdentityRow> rows;
	connector_.Query(queries_.identities, kIdentityColumns, [&rows](const Row& row) {
		if (!row[0]) {
			throw QueryError("identity row without an id");
		}
		RawIdentityRow r;
		r.id = ParseId(*row[0], "identity id");
		r.login = row[1];
		r.forename = row[2];
		r.surname = row[3];
		r.dn = row[4];
		r.credential = row[5];
		rows.push_back(std::move(r));
	});
	VLOG(1) << "Fetched " << rows.size() << " identity rows";
	return rows;
}

std::vector<RoleGrantRow> RowFetcher::FetchRoleGrants() {
	std::vector<RoleGrantRow> grants;
	FetchGrants(queries_.site_roles, kSiteGrant, grants);
	FetchGrants(queries_.group_roles, kGroupGrant, grants);
	VLOG(1) << "Fetched " << grants.size() << " role grant rows";
	return grants;
}

void RowFetcher::FetchGrants(const std::string& sql, const char* default_kind,
		std::vector<RoleGrantRow>& out) {
	connector_.Query(sql, kGrantColumns, [&out, default_kind](const Row& row) {
		RoleGrantRow g;
		g.kind = row[0] ? *row[0] : default_kind;
		if (row[1]) {
			g.identity_id = ParseId(*row[1], "grant identity id");
		}
		g.role_title = row[2].value_or("");
		g.entity_name = row[3].value_or("");
		out.push_back(std::move(g));
	});
}

} // namespace Authmap
