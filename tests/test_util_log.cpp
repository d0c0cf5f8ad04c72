// tests/test_util_log.cpp
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <cstdio>
#include "../src/util_log.hpp"

int main() {
    std::string tmp = "test_util_log.log";
    std::remove(tmp.c_str());

    set_log_file(tmp);
    safe_log("first line");
    safe_log("second line");

    std::ifstream in(tmp);
    if (!in) {
        std::cerr << "util_log: log file not created\n";
        return 1;
    }
    std::stringstream buf;
    buf << in.rdbuf();
    in.close();
    if (buf.str() != "first line\nsecond line\n") {
        std::cerr << "util_log: unexpected file contents: " << buf.str() << "\n";
        return 2;
    }

    // disabled file output leaves the file untouched
    set_log_file("");
    safe_log("not written");
    std::ifstream again(tmp);
    std::stringstream buf2;
    buf2 << again.rdbuf();
    again.close();
    std::remove(tmp.c_str());
    if (buf2.str() != buf.str()) {
        std::cerr << "util_log: line written after file output was disabled\n";
        return 3;
    }

    std::cout << "test_util_log: OK\n";
    return 0;
}
