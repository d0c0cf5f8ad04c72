// src/value_parser.cpp
#include "value_parser.hpp"
#include <regex>
#include <sstream>
#include <fstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>

static const std::regex &int_token_re() {
    static const std::regex r(R"(^[+-]?\d+$)");
    return r;
}

std::optional<std::vector<int64_t>> parse_values(const std::string &line) {
    std::string s = line;
    std::replace(s.begin(), s.end(), ',', ' ');

    std::vector<int64_t> out;
    std::istringstream ss(s);
    std::string tok;
    while (ss >> tok) {
        if (!std::regex_match(tok, int_token_re())) return std::nullopt;
        try {
            out.push_back(static_cast<int64_t>(std::stoll(tok)));
        } catch (const std::out_of_range &) {
            return std::nullopt;
        }
    }
    return out;
}

std::optional<std::optional<uint64_t>> parse_cap(const std::string &token) {
    std::string t = token;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (t == "none" || t == "off") return std::optional<uint64_t>{};

    static const std::regex r(R"(^\+?\d+$)");
    if (!std::regex_match(t, r)) return std::nullopt;
    try {
        return std::optional<uint64_t>{static_cast<uint64_t>(std::stoull(t))};
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}

std::vector<int64_t> read_values_file(const std::string &path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("read_values_file: failed to open " + path);

    std::vector<int64_t> all;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;
        auto vals = parse_values(line);
        if (!vals) {
            throw std::runtime_error("read_values_file: " + path + ":" + std::to_string(lineno)
                                     + ": malformed value list");
        }
        all.insert(all.end(), vals->begin(), vals->end());
    }
    return all;
}
