#ifndef LOG_UTIL_H
#define LOG_UTIL_H

#include <string>

void set_quiet(bool quiet);

void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

#endif
