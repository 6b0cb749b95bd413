#pragma once
#include <string>
#include <vector>

namespace herder::utils::string {

std::string str_err(int errnum);

std::string to_lower(std::string s);

// Splits a command-line fragment into words: whitespace separates, single or double
// quotes group, backslash escapes. Empty words are dropped.
// Throws std::invalid_argument on a dangling or unknown escape.
std::vector<std::string> split_args(const std::string &args);

std::string join(const std::vector<std::string> &parts, const std::string &sep = " ");

} // namespace herder::utils::string
