#include <string>
#include <cstdlib>
#include <iostream>
#include <optional>

// System includes
#include <signal.h>
#include <unistd.h>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "../common/configuration.h"
#include "../common/errors.h"
#include "../common/process_settings.h"
#include "../common/stdout_log_sink.h"
#include "../snapshot/pipeline.h"
#include "../store/connector.h"

namespace {

constexpr char kDefaultConfigPath[] = "/etc/authmap/authmap.yaml";

enum ExitCode {
	EC_SUCCESS = 0,
	EC_INVALID_ARGS = 1,
	EC_SNAPSHOT_FAILED = 2,
};

// A hung database call must not keep the job alive. Aborting lets the
// glog failure handler dump the stack of whatever was blocked.
void OnWatchdogExpired(int) {
	static const char msg[] = "authmap: watchdog timeout expired, aborting\n";
	ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
	(void)ignored;
	std::abort();
}

void ArmWatchdog(int seconds) {
	struct sigaction sa = {};
	sa.sa_handler = OnWatchdogExpired;
	sigemptyset(&sa.sa_mask);
	sigaction(SIGALRM, &sa, nullptr);
	alarm(static_cast<unsigned>(seconds));
}

std::string ResolveConfigPath(const cxxopts::ParseResult& arguments) {
	if (arguments.count("config")) {
		return arguments["config"].as<std::string>();
	}
	const char* env = std::getenv("AUTHMAP_CONFIG");
	return (env && env[0]) ? env : kDefaultConfigPath;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	// umask and friends are read exactly once, before any work.
	const Authmap::ProcessSettings settings = Authmap::ProcessSettings::Capture();

	cxxopts::Options options("authmap", "Publishes a sanitized identity and role snapshot");
	options.add_options()
		("d,db", "Database profile name from the configuration", cxxopts::value<std::string>())
		("o,out", "Snapshot file to maintain", cxxopts::value<std::string>())
		("c,config", "Configuration file (default: $AUTHMAP_CONFIG or /etc/authmap/authmap.yaml)",
		 cxxopts::value<std::string>())
		("v,verbose", "Report discarded records and publish decisions")
		("q,quiet", "Treat a failed database connection as a successful no-op")
		("watchdog", "Abort the run after this many seconds", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	std::optional<cxxopts::ParseResult> parsed;
	try {
		parsed.emplace(options.parse(argc, argv));
	} catch (const std::exception& e) {
		LOG(ERROR) << e.what();
		std::cerr << options.help() << std::endl;
		return EC_INVALID_ARGS;
	}
	const cxxopts::ParseResult& arguments = *parsed;

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EC_SUCCESS;
	}
	if (!arguments.count("db") || !arguments.count("out")) {
		LOG(ERROR) << "--db and --out are required";
		std::cerr << options.help() << std::endl;
		return EC_INVALID_ARGS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	const bool verbose = arguments.count("verbose") > 0;
	const bool quiet = arguments.count("quiet") > 0;

	static Authmap::StdoutLogSink progress_sink;
	if (verbose) {
		Authmap::RouteProgressToStdout(&progress_sink);
	}

	Authmap::Configuration& config = Authmap::Configuration::getInstance();
	const std::string config_path = ResolveConfigPath(arguments);
	if (!config.loadFromFile(config_path)) {
		LOG(ERROR) << "Failed to load configuration file " << config_path;
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Config validation error: " << error;
		}
		return EC_INVALID_ARGS;
	}

	Authmap::DatabaseProfile profile;
	try {
		profile = config.getDatabase(arguments["db"].as<std::string>());
	} catch (const Authmap::ConfigError& e) {
		LOG(ERROR) << e.what();
		return EC_INVALID_ARGS;
	}

	int watchdog = arguments.count("watchdog")
		? arguments["watchdog"].as<int>()
		: config.getWatchdogSeconds();
	if (watchdog < 1) {
		LOG(ERROR) << "Watchdog timeout must be at least 1 second";
		return EC_INVALID_ARGS;
	}
	ArmWatchdog(watchdog);

	Authmap::SnapshotOptions snapshot;
	snapshot.output_path = arguments["out"].as<std::string>();
	snapshot.verbose = verbose;

	try {
		auto connector = Authmap::MakeConnector(profile);
		Authmap::SnapshotStats stats = Authmap::RunSnapshot(*connector, profile.queries, snapshot, settings);
		alarm(0);
		LOG_IF(INFO, verbose) << "Snapshot " << snapshot.output_path << ": " << stats;
	} catch (const std::exception& e) {
		alarm(0);
		if (quiet && Authmap::IsConnectionFailure(e)) {
			VLOG(1) << "Ignoring connection failure in quiet mode: " << Authmap::DescribeNested(e);
			return EC_SUCCESS;
		}
		LOG(ERROR) << "Snapshot failed: " << Authmap::DescribeNested(e);
		return EC_SNAPSHOT_FAILED;
	}

	return EC_SUCCESS;
}
