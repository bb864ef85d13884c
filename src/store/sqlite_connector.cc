#include "sqlite_connector.h"

#include <glog/logging.h>

#include "../common/errors.h"

namespace Authmap {

namespace {

struct StmtDeleter {
	void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

} // namespace

SqliteConnector::SqliteConnector(std::string path) : path_(std::move(path)) {}

void SqliteConnector::Connect() {
	sqlite3* raw = nullptr;
	int rc = sqlite3_open_v2(path_.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
	db_.reset(raw);
	if (rc != SQLITE_OK) {
		std::string msg = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
		db_.reset();
		throw DatabaseConnectionError("cannot open SQLite database " + path_ + ": " + msg);
	}
	sqlite3_busy_timeout(db_.get(), 5000);
	VLOG(1) << "Opened SQLite database " << path_;
}

void SqliteConnector::Query(const std::string& sql, size_t columns, const RowHandler& handler) {
	if (!db_) {
		throw QueryError("query issued before connecting");
	}

	sqlite3_stmt* raw = nullptr;
	if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
		throw QueryError(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db_.get()));
	}
	std::unique_ptr<sqlite3_stmt, StmtDeleter> st(raw);

	const int ncols = sqlite3_column_count(st.get());
	if (ncols < 0 || static_cast<size_t>(ncols) != columns) {
		throw QueryError("query returned " + std::to_string(ncols) + " columns, expected " +
				std::to_string(columns));
	}

	Row row(columns);
	size_t count = 0;
	int rc;
	while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
		for (int j = 0; j < ncols; ++j) {
			if (sqlite3_column_type(st.get(), j) == SQLITE_NULL) {
				row[j].reset();
				continue;
			}
			const unsigned char* text = sqlite3_column_text(st.get(), j);
			int bytes = sqlite3_column_bytes(st.get(), j);
			if (text == nullptr) {
				row[j].emplace();
			} else {
				row[j].emplace(reinterpret_cast<const char*>(text), static_cast<size_t>(bytes));
			}
		}
		handler(row);
		++count;
	}
	if (rc != SQLITE_DONE) {
		throw QueryError(std::string("SQLite step failed: ") + sqlite3_errmsg(db_.get()));
	}
	VLOG(2) << "SQLite query returned " << count << " rows";
}

} // namespace Authmap
