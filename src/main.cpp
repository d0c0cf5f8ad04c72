// src/main.cpp
// CapSum driver: build a capped multiset from flags/file/stdin, then print the sum or run the CLI.

#include "capped_multiset.hpp"
#include "value_parser.hpp"
#include "cli.hpp"
#include "util_log.hpp"

#include <iostream>
#include <csignal>
#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

std::atomic<bool> g_terminate{false};

void handle_sigint(int) {
    g_terminate.store(true);
}

static void usage(std::ostream &os) {
    os << "Usage: capsum [--values \"1,2,3\"] [--file PATH] [--cap N|none] [--batch] [--log-file PATH]\n";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);

    std::string inline_values;
    bool have_inline = false;
    std::string file;
    std::optional<uint64_t> initial_cap;
    bool batch = false;

    // log destination first, so errors about earlier arguments land there too
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--log-file") set_log_file(argv[i + 1]);
    }

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--values" && i+1 < argc) { inline_values = argv[++i]; have_inline = true; }
        else if (a == "--file" && i+1 < argc) file = argv[++i];
        else if (a == "--cap" && i+1 < argc) {
            std::string arg = argv[++i];
            auto cap = parse_cap(arg);
            if (!cap) {
                safe_log("invalid --cap value: " + arg);
                usage(std::cerr);
                return 2;
            }
            initial_cap = *cap;
        }
        else if (a == "--batch") batch = true;
        else if (a == "--log-file" && i+1 < argc) ++i;
        else if (a == "--help" || a == "-h") { usage(std::cout); return 0; }
        else {
            safe_log("unknown or incomplete argument: " + a);
            usage(std::cerr);
            return 2;
        }
    }

    {
        std::ostringstream os;
        os << "Starting CapSum; file=" << (file.empty() ? "<none>" : file)
           << " inline=" << (have_inline ? "true" : "false")
           << " cap=";
        if (initial_cap) os << *initial_cap;
        else os << "none";
        os << " batch=" << (batch ? "true" : "false");
        safe_log(os.str());
    }

    std::vector<int64_t> raw;
    try {
        if (have_inline) {
            auto vals = parse_values(inline_values);
            if (!vals) {
                safe_log("malformed --values list: " + inline_values);
                return 1;
            }
            raw = std::move(*vals);
        }
        if (!file.empty()) {
            auto vals = read_values_file(file);
            raw.insert(raw.end(), vals.begin(), vals.end());
        }
        if (!have_inline && file.empty()) {
            std::string line;
            std::getline(std::cin, line);
            auto vals = parse_values(line);
            if (!vals) {
                safe_log("malformed value list on stdin");
                return 1;
            }
            raw = std::move(*vals);
        }
    } catch (const std::exception &e) {
        safe_log(std::string("reading values failed: ") + e.what());
        return 1;
    }

    std::unique_ptr<CappedMultiset> ms_ptr;
    try {
        ms_ptr = std::make_unique<CappedMultiset>(CappedMultiset::from_signed(raw));
    } catch (const InvalidInput &e) {
        safe_log(std::string("invalid input: ") + e.what());
        return 1;
    } catch (const std::bad_alloc &ba) {
        safe_log(std::string("CappedMultiset construction bad_alloc: ") + ba.what());
        return 1;
    }
    CappedMultiset &ms = *ms_ptr;
    ms.set_cap(initial_cap);
    safe_log("OK: multiset constructed with " + std::to_string(ms.size()) + " values");

    if (batch) {
        std::cout << ms.sum() << "\n";
        return 0;
    }

    try {
        run_cli(ms, g_terminate);
    } catch (const std::exception &e) {
        safe_log(std::string("CLI exception: ") + e.what());
        return 1;
    }

    safe_log("CapSum shutting down normally.");
    return 0;
}
