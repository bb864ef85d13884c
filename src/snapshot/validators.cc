#include "validators.h"

#include <algorithm>

#include <re2/re2.h>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"

#include "identity_record.h"

namespace Authmap {

namespace {

// Byte-oriented like the columns they check. RE2 does not recurse, so
// field length is not bounded by the stack.
re2::RE2::Options ByteOptions() {
	re2::RE2::Options opts;
	opts.set_encoding(re2::RE2::Options::EncodingLatin1);
	return opts;
}

const re2::RE2& DnShape() {
	static const re2::RE2 rx(R"((?:/(?:C|O|DC)=[^/]+)+(?:/[^/]*)*/CN=[^/]+)", ByteOptions());
	return rx;
}

const re2::RE2& PlaceholderDn() {
	static const re2::RE2 rx(R"((?i)^(?:/CN=)?(?:unknown|none|n/a)\b)", ByteOptions());
	return rx;
}

const re2::RE2& LoginShape() {
	static const re2::RE2 rx(
		R"((?:[a-z0-9_]+(?:\.nocern|\.notcms)?|[a-z0-9_.%+-]+@(?:[a-z0-9-]+\.)+[a-z]{2,5}|))", ByteOptions());
	return rx;
}

} // namespace

std::string NormalizeLogin(const std::string& login) {
	return absl::AsciiStrToLower(absl::StripAsciiWhitespace(login));
}

std::string NormalizeDn(const std::string& dn) {
	std::string out(absl::StripAsciiWhitespace(dn));
	if (IsDigitsOnly(out) || IsPlaceholderDn(out)) {
		out.clear();
	}
	return out;
}

std::string JoinName(const std::string& forename, const std::string& surname) {
	if (forename.empty()) return surname;
	if (surname.empty()) return forename;
	return forename + " " + surname;
}

std::string NormalizeRoleToken(const std::string& token) {
	std::string out;
	out.reserve(token.size());
	bool in_run = false;
	for (char c : absl::AsciiStrToLower(token)) {
		if (absl::ascii_isdigit(c) || (c >= 'a' && c <= 'z')) {
			out += c;
			in_run = false;
		} else if (!in_run) {
			out += '-';
			in_run = true;
		}
	}
	return out;
}

bool HasControlCharacters(const std::string& value) {
	return std::any_of(value.begin(), value.end(),
		[](char c) { return static_cast<unsigned char>(c) < 0x20; });
}

bool IsDigitsOnly(const std::string& value) {
	return !value.empty() && std::all_of(value.begin(), value.end(),
		[](char c) { return absl::ascii_isdigit(c); });
}

bool IsPlaceholderDn(const std::string& dn) {
	return re2::RE2::PartialMatch(dn, PlaceholderDn());
}

bool IsWellFormedDn(const std::string& dn) {
	return re2::RE2::FullMatch(dn, DnShape());
}

bool IsValidLogin(const std::string& login) {
	return re2::RE2::FullMatch(login, LoginShape());
}

bool IsServiceAccount(const std::string& login, const std::string& dn, const std::string& credential) {
	return absl::StrContains(login, "@") && !dn.empty() && credential == kLockSentinel;
}

bool IsDeactivatedCredential(const std::string& credential) {
	return absl::StrContains(credential, kLockSentinel) || absl::StrContains(credential, "Removed");
}

} // namespace Authmap
