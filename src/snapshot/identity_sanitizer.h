#ifndef AUTHMAP_SRC_SNAPSHOT_IDENTITY_SANITIZER_H_
#define AUTHMAP_SRC_SNAPSHOT_IDENTITY_SANITIZER_H_

#include <optional>

#include "identity_record.h"

namespace Authmap {

enum class DiscardReason {
	kNone,
	kUnsafe,
	kDeactivated,
};

const char* DiscardReasonName(DiscardReason reason);

struct SanitizeResult {
	std::optional<IdentityRecord> record;
	DiscardReason reason = DiscardReason::kNone;
	// Credential was empty and has been replaced by the lock sentinel.
	bool locked = false;

	bool kept() const { return record.has_value(); }
};

/**
 * Turns one raw identity row into a canonical IdentityRecord, or decides
 * to drop it. Never throws for bad data: a rejected row is an ordinary
 * result. With verbose set every discard and lockout is logged as a
 * warning.
 */
class IdentitySanitizer {
public:
	explicit IdentitySanitizer(bool verbose = false) : verbose_(verbose) {}

	SanitizeResult Sanitize(const RawIdentityRow& row) const;

private:
	void Report(const IdentityRecord& rec, const std::string& forename, const std::string& surname,
			const char* what) const;

	bool verbose_;
};

} // namespace Authmap

#endif // AUTHMAP_SRC_SNAPSHOT_IDENTITY_SANITIZER_H_
