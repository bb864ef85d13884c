#ifndef AUTHMAP_SRC_STORE_PG_CONNECTOR_H_
#define AUTHMAP_SRC_STORE_PG_CONNECTOR_H_

#include <memory>
#include <string>

#include <libpq-fe.h>

#include "connector.h"

namespace Authmap {

class PgConnector : public Connector {
public:
	// conninfo is passed to PQconnectdb unchanged and never logged.
	explicit PgConnector(std::string conninfo);

	void Connect() override;
	void Query(const std::string& sql, size_t columns, const RowHandler& handler) override;

private:
	struct ConnDeleter {
		void operator()(PGconn* conn) const { PQfinish(conn); }
	};

	std::string conninfo_;
	std::unique_ptr<PGconn, ConnDeleter> conn_;
};

} // namespace Authmap

#endif // AUTHMAP_SRC_STORE_PG_CONNECTOR_H_
