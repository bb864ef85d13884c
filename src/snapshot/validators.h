#ifndef AUTHMAP_SRC_SNAPSHOT_VALIDATORS_H_
#define AUTHMAP_SRC_SNAPSHOT_VALIDATORS_H_

#include <string>

namespace Authmap {

// Normalization helpers.
std::string NormalizeLogin(const std::string& login);
// Trims, then clears digit-only and placeholder values.
std::string NormalizeDn(const std::string& dn);
std::string JoinName(const std::string& forename, const std::string& surname);
/// Lowercases and collapses every run of characters outside [a-z0-9]
/// into one '-'.
std::string NormalizeRoleToken(const std::string& token);

// Rules, one per check applied to identity rows.
bool HasControlCharacters(const std::string& value);
bool IsDigitsOnly(const std::string& value);
bool IsPlaceholderDn(const std::string& dn);
/// /(C|O|DC)=.../.../CN=<non-empty>
bool IsWellFormedDn(const std::string& dn);
/// Bare handle (optionally .nocern/.notcms), e-mail address, or empty.
bool IsValidLogin(const std::string& login);
/// '@' login, certificate DN and a lock-sentinel credential.
bool IsServiceAccount(const std::string& login, const std::string& dn, const std::string& credential);
bool IsDeactivatedCredential(const std::string& credential);

} // namespace Authmap

#endif // AUTHMAP_SRC_SNAPSHOT_VALIDATORS_H_
