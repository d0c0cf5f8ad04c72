// src/cli.cpp
#include "cli.hpp"
#include "value_parser.hpp"
#include "util_log.hpp"
#include <sstream>
#include <string>

static void print_cap(std::ostream &out, const std::optional<uint64_t> &cap) {
    if (cap) out << *cap;
    else out << "none";
}

void run_cli(CappedMultiset &ms, std::atomic<bool> &terminate_flag,
             std::istream &in, std::ostream &out) {
    std::string cmd;
    out << "CapSum CLI ready. Commands: SUM | CAP <n|none> | UNCAP | STATS | VALUES | QUIT\n> " << std::flush;

    while (!terminate_flag.load() && std::getline(in, cmd)) {
        if (cmd.empty()) {
            out << "> " << std::flush;
            continue;
        }

        std::stringstream ss(cmd);
        std::string tok;
        ss >> tok;

        if (tok == "SUM") {
            out << "sum: " << ms.sum() << "\n";
        }
        else if (tok == "CAP") {
            std::string arg;
            if (!(ss >> arg)) {
                out << "Usage: CAP <n|none>\n";
            } else if (auto cap = parse_cap(arg)) {
                ms.set_cap(*cap);
                out << "cap: ";
                print_cap(out, ms.cap());
                out << "\n";
            } else {
                safe_log("cli: rejected cap argument '" + arg + "'");
                out << "Invalid cap: " << arg << " (expected non-negative integer or none)\n";
            }
        }
        else if (tok == "UNCAP") {
            ms.clear_cap();
            out << "cap: none\n";
        }
        else if (tok == "STATS") {
            out << "size: " << ms.size()
                << "  total: " << ms.total()
                << "  cap: ";
            print_cap(out, ms.cap());
            out << "  sum: " << ms.sum() << "\n";
        }
        else if (tok == "VALUES") {
            out << ms << "\n";
        }
        else if (tok == "QUIT" || tok == "EXIT") {
            terminate_flag.store(true);
            break;
        }
        else {
            safe_log("cli: unknown command '" + tok + "'");
            out << "Unknown command\n";
        }

        out << "> " << std::flush;
    }

    terminate_flag.store(true);
}
