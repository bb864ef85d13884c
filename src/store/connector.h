#ifndef AUTHMAP_SRC_STORE_CONNECTOR_H_
#define AUTHMAP_SRC_STORE_CONNECTOR_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../common/configuration.h"

namespace Authmap {

/// One result row; NULL columns are nullopt.
using Row = std::vector<std::optional<std::string>>;
using RowHandler = std::function<void(const Row&)>;

/**
 * Read-only access to the relational identity store.
 */
class Connector {
public:
	virtual ~Connector() = default;

	/// Opens the connection. Throws DatabaseConnectionError.
	virtual void Connect() = 0;

	/// Runs sql and hands every row to handler. Throws QueryError when the
	/// statement fails or a row does not have exactly `columns` columns.
	virtual void Query(const std::string& sql, size_t columns, const RowHandler& handler) = 0;
};

/// Builds the backend named by the profile; does not connect yet.
std::unique_ptr<Connector> MakeConnector(const DatabaseProfile& profile);

} // namespace Authmap

#endif // AUTHMAP_SRC_STORE_CONNECTOR_H_
