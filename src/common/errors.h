#ifndef AUTHMAP_SRC_COMMON_ERRORS_H_
#define AUTHMAP_SRC_COMMON_ERRORS_H_

#include <exception>
#include <stdexcept>
#include <string>

namespace Authmap {

/**
 * Root of every systemic failure. Per-record problems never use these;
 * they are reported through SanitizeResult / aggregator counters instead.
 */
class Error : public std::runtime_error {
public:
	explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Connection to the identity store could not be established.
// The only failure quiet mode is allowed to swallow.
class DatabaseConnectionError : public Error {
public:
	explicit DatabaseConnectionError(const std::string& what) : Error(what) {}
};

class QueryError : public Error {
public:
	explicit QueryError(const std::string& what) : Error(what) {}
};

class ConfigError : public Error {
public:
	explicit ConfigError(const std::string& what) : Error(what) {}
};

class PublishError : public Error {
public:
	PublishError(const std::string& what, int err);
	int error_code() const { return errno_; }

private:
	int errno_;
};

// Flattens a chain built with std::throw_with_nested into
// "outer: inner: innermost".
std::string DescribeNested(const std::exception& e);

// True when e, or anything nested inside it, is a DatabaseConnectionError.
bool IsConnectionFailure(const std::exception& e);

} // namespace Authmap

#endif // AUTHMAP_SRC_COMMON_ERRORS_H_
