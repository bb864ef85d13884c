#include "identity_sanitizer.h"

#include <glog/logging.h>

#include "absl/strings/escaping.h"

#include "validators.h"

namespace Authmap {

const char* DiscardReasonName(DiscardReason reason) {
	switch (reason) {
		case DiscardReason::kNone:
			return "none";
		case DiscardReason::kUnsafe:
			return "unsafe";
		case DiscardReason::kDeactivated:
			return "deactivated";
	}
	return "unknown";
}

SanitizeResult IdentitySanitizer::Sanitize(const RawIdentityRow& row) const {
	SanitizeResult result;

	const std::string forename = row.forename.value_or("");
	const std::string surname = row.surname.value_or("");

	IdentityRecord rec;
	rec.id = row.id;
	rec.login = NormalizeLogin(row.login.value_or(""));
	rec.dn = NormalizeDn(row.dn.value_or(""));
	rec.credential = row.credential.value_or("");
	rec.name = JoinName(forename, surname);

	if (HasControlCharacters(rec.dn) || HasControlCharacters(rec.login) ||
			HasControlCharacters(forename) || HasControlCharacters(surname) ||
			(!rec.dn.empty() && !IsWellFormedDn(rec.dn)) ||
			!IsValidLogin(rec.login)) {
		result.reason = DiscardReason::kUnsafe;
		Report(rec, forename, surname, "unsafe");
		return result;
	}

	if (!IsServiceAccount(rec.login, rec.dn, rec.credential) &&
			IsDeactivatedCredential(rec.credential)) {
		result.reason = DiscardReason::kDeactivated;
		Report(rec, forename, surname, "deactivated");
		return result;
	}

	if (rec.credential.empty()) {
		rec.credential = kLockSentinel;
		result.locked = true;
		Report(rec, forename, surname, "no credential, locking account");
	}

	result.record = std::move(rec);
	return result;
}

void IdentitySanitizer::Report(const IdentityRecord& rec, const std::string& forename,
		const std::string& surname, const char* what) const {
	LOG_IF(WARNING, verbose_) << "id=" << rec.id
		<< " login='" << absl::CHexEscape(rec.login)
		<< "' dn='" << absl::CHexEscape(rec.dn)
		<< "' forename='" << absl::CHexEscape(forename)
		<< "' surname='" << absl::CHexEscape(surname)
		<< "': " << what;
}

} // namespace Authmap
