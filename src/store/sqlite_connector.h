#ifndef AUTHMAP_SRC_STORE_SQLITE_CONNECTOR_H_
#define AUTHMAP_SRC_STORE_SQLITE_CONNECTOR_H_

#include <memory>
#include <string>

#include <sqlite3.h>

#include "connector.h"

namespace Authmap {

/**
 * Reads an SQLite database file. The file is opened read-only and must
 * already exist.
 */
class SqliteConnector : public Connector {
public:
	explicit SqliteConnector(std::string path);

	void Connect() override;
	void Query(const std::string& sql, size_t columns, const RowHandler& handler) override;

private:
	struct DbDeleter {
		void operator()(sqlite3* db) const { sqlite3_close(db); }
	};

	std::string path_;
	std::unique_ptr<sqlite3, DbDeleter> db_;
};

} // namespace Authmap

#endif // AUTHMAP_SRC_STORE_SQLITE_CONNECTOR_H_
