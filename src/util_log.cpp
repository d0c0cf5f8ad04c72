// src/util_log.cpp
#include "util_log.hpp"
#include <mutex>
#include <fstream>
#include <iostream>

static std::mutex g_log_mu_internal;
static std::string g_log_path = "capsum.err.log";

void set_log_file(const std::string &path) {
    std::lock_guard<std::mutex> lk(g_log_mu_internal);
    g_log_path = path;
}

void safe_log(const std::string &s) {
    std::lock_guard<std::mutex> lk(g_log_mu_internal);
    std::cerr << s << std::endl;
    if (g_log_path.empty()) return;
    std::ofstream f(g_log_path, std::ios::app);
    if (f) f << s << std::endl;
}
