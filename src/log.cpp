#include "log.h"

namespace xiangqi {

static LogSink active_sink = nullptr;

void set_log_sink(LogSink sink) {
    active_sink = sink;
}

LogSink get_log_sink() {
    return active_sink;
}

void log_line(LogLevel level, const std::string &message) {
    if (active_sink) {
        active_sink(level, message);
    }
}

} // namespace xiangqi
