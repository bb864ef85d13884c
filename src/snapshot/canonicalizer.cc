#include "canonicalizer.h"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace Authmap {

namespace {

nlohmann::json RolesToJson(const RoleMap& roles) {
	nlohmann::json out = nlohmann::json::object();
	for (const auto& [category, grants] : roles) {
		std::vector<std::string> sorted(grants);
		std::sort(sorted.begin(), sorted.end());
		sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
		out[category] = std::move(sorted);
	}
	return out;
}

} // namespace

std::string SerializeRecord(const IdentityRecord& record) {
	// nlohmann::json objects are std::map backed, so keys come out sorted.
	nlohmann::json obj = {
		{"ID", record.id},
		{"LOGIN", record.login},
		{"NAME", record.name},
		{"DN", record.dn},
		{"PASSWD", record.credential},
		{"ROLES", RolesToJson(record.roles)},
	};
	// Invalid UTF-8 from the store is replaced rather than thrown on.
	return obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Canonicalize(const IdentityTable& identities) {
	std::string out = "[\n";
	bool first = true;
	for (const auto& [id, record] : identities) {
		if (!first) {
			out += ",\n";
		}
		out += SerializeRecord(record);
		first = false;
	}
	if (!first) {
		out += '\n';
	}
	out += "]\n";
	return out;
}

} // namespace Authmap
