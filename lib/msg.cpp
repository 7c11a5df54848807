//
// Log messages with a level threshold; everything goes to stderr
//
#include <cstdio>
#include <cstdarg>
#include "msg.h"

namespace {
  LogLevel log_level= msg_info;
}

void msg_set_loglevel(const LogLevel lv)
{
  log_level= lv;
}

LogLevel msg_get_loglevel()
{
  return log_level;
}

void msg_printf(const LogLevel msg_level, char const * const fmt, ...)
{
  if(msg_level < log_level)
    return;

  va_list argp;
  va_start(argp, fmt);
  vfprintf(stderr, fmt, argp);
  va_end(argp);

  fflush(stderr);
}
