#include "pg_connector.h"

#include <glog/logging.h>

#include "../common/errors.h"

namespace Authmap {

namespace {

struct ResultDeleter {
	void operator()(PGresult* res) const { PQclear(res); }
};

std::string TrimmedError(PGconn* conn) {
	std::string msg = conn ? PQerrorMessage(conn) : "out of memory";
	while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) {
		msg.pop_back();
	}
	return msg;
}

} // namespace

PgConnector::PgConnector(std::string conninfo) : conninfo_(std::move(conninfo)) {}

void PgConnector::Connect() {
	conn_.reset(PQconnectdb(conninfo_.c_str()));
	if (!conn_ || PQstatus(conn_.get()) != CONNECTION_OK) {
		std::string msg = TrimmedError(conn_.get());
		conn_.reset();
		throw DatabaseConnectionError("PostgreSQL connection failed: " + msg);
	}
	VLOG(1) << "Connected to PostgreSQL server " << PQhost(conn_.get()) << " database " << PQdb(conn_.get());
}

void PgConnector::Query(const std::string& sql, size_t columns, const RowHandler& handler) {
	if (!conn_) {
		throw QueryError("query issued before connecting");
	}

	std::unique_ptr<PGresult, ResultDeleter> res(PQexec(conn_.get(), sql.c_str()));
	if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
		throw QueryError("PostgreSQL query failed: " + TrimmedError(conn_.get()));
	}

	const int nfields = PQnfields(res.get());
	if (nfields < 0 || static_cast<size_t>(nfields) != columns) {
		throw QueryError("query returned " + std::to_string(nfields) + " columns, expected " +
				std::to_string(columns));
	}

	const int ntuples = PQntuples(res.get());
	Row row(columns);
	for (int i = 0; i < ntuples; ++i) {
		for (int j = 0; j < nfields; ++j) {
			if (PQgetisnull(res.get(), i, j)) {
				row[j].reset();
			} else {
				row[j].emplace(PQgetvalue(res.get(), i, j), PQgetlength(res.get(), i, j));
			}
		}
		handler(row);
	}
	VLOG(2) << "PostgreSQL query returned " << ntuples << " rows";
}

} // namespace Authmap
