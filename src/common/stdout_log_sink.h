#ifndef AUTHMAP_SRC_COMMON_STDOUT_LOG_SINK_H_
#define AUTHMAP_SRC_COMMON_STDOUT_LOG_SINK_H_

#include <cstddef>
#include <ctime>

#include <glog/logging.h>

namespace Authmap {

/**
 * Copies log lines below ERROR to standard output. Verbose runs use it
 * for progress and discard reports while errors stay on stderr.
 */
class StdoutLogSink : public google::LogSink {
public:
	void send(google::LogSeverity severity, const char* full_filename,
			const char* base_filename, int line, const struct ::tm* tm_time,
			const char* message, size_t message_len) override;
};

/// Registers `sink` and stops glog from echoing the same lines to stderr.
/// Messages at ERROR and above still reach stderr; no log files are written.
void RouteProgressToStdout(StdoutLogSink* sink);

} // namespace Authmap

#endif // AUTHMAP_SRC_COMMON_STDOUT_LOG_SINK_H_
