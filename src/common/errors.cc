#include "errors.h"

#include <cstring>

namespace Authmap {

PublishError::PublishError(const std::string& what, int err)
	: Error(err ? what + ": " + std::strerror(err) : what), errno_(err) {}

std::string DescribeNested(const std::exception& e) {
	std::string out = e.what();
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception& inner) {
		out += ": " + DescribeNested(inner);
	} catch (...) {
		out += ": unknown error";
	}
	return out;
}

bool IsConnectionFailure(const std::exception& e) {
	if (dynamic_cast<const DatabaseConnectionError*>(&e) != nullptr) {
		return true;
	}
	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception& inner) {
		return IsConnectionFailure(inner);
	} catch (...) {
		return false;
	}
	return false;
}

} // namespace Authmap
