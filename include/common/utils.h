#pragma once

#include <string>

void log_error(const char *prefix, int err);                    // [Error] prefix strerror(err)
void log_info(const std::string &tag, const std::string &message); // [tag] message
