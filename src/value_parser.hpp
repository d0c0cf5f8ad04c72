// src/value_parser.hpp
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

// Parse one line of integers separated by whitespace and/or commas.
// Returns nullopt on a malformed or out-of-range token; a blank line gives an empty vector.
// Negative numbers are accepted here and rejected by CappedMultiset::from_signed.
std::optional<std::vector<int64_t>> parse_values(const std::string &line);

// Parse a cap argument: "none"/"off" -> uncapped, non-negative integer -> capped.
// Outer nullopt means the token is not a valid cap.
std::optional<std::optional<uint64_t>> parse_cap(const std::string &token);

// Read every value in a file. Blank lines and lines starting with '#' are skipped.
// Throws std::runtime_error when the file cannot be opened or a line does not parse.
std::vector<int64_t> read_values_file(const std::string &path);
