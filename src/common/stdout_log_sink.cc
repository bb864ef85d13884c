#include "stdout_log_sink.h"

#include <cstdio>

namespace Authmap {

void StdoutLogSink::send(google::LogSeverity severity, const char* /*full_filename*/,
		const char* base_filename, int line, const struct ::tm* /*tm_time*/,
		const char* message, size_t message_len) {
	if (severity >= google::GLOG_ERROR) {
		return;
	}
	std::fprintf(stdout, "%c %s:%d] %.*s\n", google::GetLogSeverityName(severity)[0],
		base_filename, line, static_cast<int>(message_len), message);
	std::fflush(stdout);
}

void RouteProgressToStdout(StdoutLogSink* sink) {
	FLAGS_logtostderr = false;
	FLAGS_stderrthreshold = google::GLOG_ERROR;
	for (int s = google::GLOG_INFO; s < google::NUM_SEVERITIES; ++s) {
		google::SetLogDestination(static_cast<google::LogSeverity>(s), "");
	}
	google::AddLogSink(sink);
}

} // namespace Authmap
