// src/util_log.hpp
#pragma once
#include <string>

// Thread-safe log line to stderr, also appended to the configured log file.
void safe_log(const std::string &s);

// Change the log file (default "capsum.err.log"); empty disables file output.
void set_log_file(const std::string &path);
