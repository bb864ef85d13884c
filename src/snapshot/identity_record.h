#ifndef AUTHMAP_SRC_SNAPSHOT_IDENTITY_RECORD_H_
#define AUTHMAP_SRC_SNAPSHOT_IDENTITY_RECORD_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

namespace Authmap {

using IdentityId = int64_t;

/// Credential value meaning "no usable credential".
inline constexpr char kLockSentinel[] = "*";

/// One identity row as the store delivered it. NULL columns are nullopt.
struct RawIdentityRow {
	IdentityId id = 0;
	std::optional<std::string> login;
	std::optional<std::string> forename;
	std::optional<std::string> surname;
	std::optional<std::string> dn;
	std::optional<std::string> credential;
};

/// One role grant row: (grantKind, identityId, roleTitle, entityName).
struct RoleGrantRow {
	std::string kind;
	// nullopt when the store had no identity for the grant.
	std::optional<IdentityId> identity_id;
	std::string role_title;
	std::string entity_name;
};

/// Role category -> "<kind>:<entity>" grants. Lists may hold duplicates
/// until the record is canonicalized.
using RoleMap = absl::btree_map<std::string, std::vector<std::string>>;

struct IdentityRecord {
	IdentityId id = 0;
	std::string login;
	std::string name;
	std::string dn;
	std::string credential;
	RoleMap roles;
};

/// Retained records keyed (and therefore ordered) by id.
using IdentityTable = absl::btree_map<IdentityId, IdentityRecord>;

} // namespace Authmap

#endif // AUTHMAP_SRC_SNAPSHOT_IDENTITY_RECORD_H_
