#include "string.hpp"
#include <algorithm>
#include <boost/tokenizer.hpp>
#include <cctype>
#include <stdexcept>
#include <string>
#include <system_error>

namespace herder::utils::string {

std::string str_err(int errnum)
{
    return std::system_category().message(errnum);
}


std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}


std::vector<std::string> split_args(const std::string &args)
{
    using separator = boost::escaped_list_separator<char>;
    using tokenizer = boost::tokenizer<separator>;

    std::vector<std::string> result;
    try {
        tokenizer tok(args, separator("\\", " \t\n", "\"'"));
        for (const auto &t: tok)
            // consecutive separators yield empty tokens
            if (!t.empty())
                result.push_back(t);
    } catch (const boost::escaped_list_error &e) {
        throw std::invalid_argument("Cannot split server arguments '" + args + "': " + e.what());
    }
    return result;
}


std::string join(const std::vector<std::string> &parts, const std::string &sep)
{
    std::string result;
    for (auto it = parts.begin(); it != parts.end();) {
        result += *it;
        if (++it != parts.end())
            result += sep;
    }
    return result;
}

} // namespace herder::utils::string
