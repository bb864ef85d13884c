#include "connector.h"

#include <glog/logging.h>

#include "../common/errors.h"
#include "pg_connector.h"
#include "sqlite_connector.h"

namespace Authmap {

std::unique_ptr<Connector> MakeConnector(const DatabaseProfile& profile) {
	VLOG(1) << "Database profile " << profile.name << " uses backend " << BackendName(profile.backend);
	switch (profile.backend) {
		case Backend::kPostgreSQL:
			return std::make_unique<PgConnector>(profile.connection.get());
		case Backend::kSQLite:
			return std::make_unique<SqliteConnector>(profile.connection.get());
	}
	throw ConfigError("database '" + profile.name + "' has an unsupported backend");
}

} // namespace Authmap
