// src/cli.hpp
#pragma once
#include <atomic>
#include <iostream>
#include "capped_multiset.hpp"

// Interactive command loop over one multiset. Returns on QUIT/EXIT, end of input,
// or once terminate_flag is set; terminate_flag is always set on return.
void run_cli(CappedMultiset &ms, std::atomic<bool> &terminate_flag,
             std::istream &in = std::cin, std::ostream &out = std::cout);
