#ifndef MSG_H
#define MSG_H 1

enum LogLevel {msg_debug, msg_verbose, msg_info, msg_warn, msg_error, msg_fatal, msg_silent};

void msg_set_loglevel(const LogLevel level);
LogLevel msg_get_loglevel();

void msg_printf(const LogLevel level, char const * const fmt, ...);

#endif
