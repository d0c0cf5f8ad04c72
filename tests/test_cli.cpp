// tests/test_cli.cpp
// Drive run_cli with scripted input and check the responses.

#include <iostream>
#include <sstream>
#include <string>
#include <atomic>
#include "../src/cli.hpp"
#include "../src/util_log.hpp"

static bool contains(const std::string &hay, const std::string &needle) {
    return hay.find(needle) != std::string::npos;
}

int main() {
    set_log_file("");

    CappedMultiset ms(std::vector<uint64_t>{1, 2, 3, 4, 5});
    std::atomic<bool> term{false};
    std::istringstream in("SUM\nCAP 2\nSUM\nCAP bogus\nSTATS\nUNCAP\nSUM\nVALUES\nFROB\nQUIT\nSUM\n");
    std::ostringstream out;

    run_cli(ms, term, in, out);
    std::string s = out.str();

    if (!term.load()) {
        std::cerr << "cli: terminate flag not set after QUIT\n";
        return 1;
    }
    if (!contains(s, "sum: 15") || !contains(s, "sum: 9")) {
        std::cerr << "cli: missing sum output\n" << s;
        return 2;
    }
    if (!contains(s, "cap: 2") || !contains(s, "cap: none")) {
        std::cerr << "cli: missing cap output\n" << s;
        return 3;
    }
    if (!contains(s, "Invalid cap: bogus")) {
        std::cerr << "cli: bad cap not reported\n" << s;
        return 4;
    }
    if (!contains(s, "size: 5  total: 15  cap: 2  sum: 9")) {
        std::cerr << "cli: STATS line wrong\n" << s;
        return 5;
    }
    if (!contains(s, "CappedMultiset{values=[1, 2, 3, 4, 5], cap=none}")) {
        std::cerr << "cli: VALUES line wrong\n" << s;
        return 6;
    }
    if (!contains(s, "Unknown command")) {
        std::cerr << "cli: unknown command not reported\n" << s;
        return 7;
    }
    // the SUM after QUIT must not run
    size_t count = 0;
    for (size_t pos = s.find("sum: "); pos != std::string::npos; pos = s.find("sum: ", pos + 1)) ++count;
    if (count != 4) { // three SUM commands plus the STATS line
        std::cerr << "cli: expected 4 sum outputs got " << count << "\n";
        return 8;
    }
    if (ms.cap()) {
        std::cerr << "cli: cap should be cleared after UNCAP\n";
        return 9;
    }

    std::cout << "test_cli: OK\n";
    return 0;
}
