#ifndef AUTHMAP_SRC_SNAPSHOT_CANONICALIZER_H_
#define AUTHMAP_SRC_SNAPSHOT_CANONICALIZER_H_

#include <string>

#include "identity_record.h"

namespace Authmap {

/// One record as a single-line JSON object with sorted keys
/// (DN, ID, LOGIN, NAME, PASSWD, ROLES) and sorted, de-duplicated grants.
std::string SerializeRecord(const IdentityRecord& record);

/**
 * Renders the whole snapshot: a JSON array with one record per line,
 * records ordered by id, terminated by a newline. Identical record sets
 * give identical bytes whatever order their roles were collected in.
 */
std::string Canonicalize(const IdentityTable& identities);

} // namespace Authmap

#endif // AUTHMAP_SRC_SNAPSHOT_CANONICALIZER_H_
