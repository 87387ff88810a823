#ifndef XIANGQI_LOG_H
#define XIANGQI_LOG_H

#include <sstream>
#include <string>

namespace xiangqi {

enum LogLevel { LOG_VERBOSE, LOG_INFO, LOG_WARNING, LOG_ERROR };

// Receives one formatted line per message. The GDExtension installs a sink
// that forwards to Godot's output; without one, messages are dropped.
typedef void (*LogSink)(LogLevel level, const std::string &message);

void set_log_sink(LogSink sink);
LogSink get_log_sink();

void log_line(LogLevel level, const std::string &message);

inline void append_log_parts(std::ostringstream &) {}

template <typename T, typename... Rest>
inline void append_log_parts(std::ostringstream &out, const T &first, const Rest &...rest) {
    out << first;
    append_log_parts(out, rest...);
}

// Same calling convention as UtilityFunctions::print: arguments are concatenated.
template <typename... Args>
inline void log_message(LogLevel level, const Args &...args) {
    if (!get_log_sink()) return;
    std::ostringstream out;
    append_log_parts(out, args...);
    log_line(level, out.str());
}

} // namespace xiangqi

#endif // XIANGQI_LOG_H
