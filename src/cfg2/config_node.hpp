#pragma once

#include <charconv>
#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace cfg2 {

enum class NodeType {
    ROOT, // the whole file
    SECTION, // [herder]
    VALUE // overlap = 30
};

// Parsed configuration, independent of the file format it came from
struct ConfigNode {
    std::string key;
    std::string value;
    std::vector<ConfigNode> children;
    NodeType type = NodeType::VALUE;

    bool isRoot() const { return type == NodeType::ROOT; }
    bool isSection() const { return type == NodeType::SECTION; }
    bool isValue() const { return type == NodeType::VALUE; }

    // nullptr when the key is absent; values have no children to search
    const ConfigNode *findChild(std::string_view childKey) const
    {
        if (isValue())
            throw std::logic_error(fmt::format("'{}' is a value, it has no key '{}'", key, childKey));

        for (const auto &child: children)
            if (child.key == childKey)
                return &child;

        return nullptr;
    }
};


namespace detail {

inline std::string_view trimmed(std::string_view s)
{
    constexpr std::string_view blanks = " \t\r\n";
    const auto first = s.find_first_not_of(blanks);
    if (first == std::string_view::npos)
        return {};
    return s.substr(first, s.find_last_not_of(blanks) - first + 1);
}

} // namespace detail


// Whole-value conversions: "30" is a number, "30s" and "" are not
template<typename T> T fromString(const std::string &str)
{
    if constexpr (std::is_same_v<T, std::string>) {
        return str;
    } else {
        static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>,
                      "fromString supports strings and integers");

        const std::string_view text = detail::trimmed(str);
        if (text.empty())
            throw std::invalid_argument("empty value where a number is expected");

        T value{};
        const char *end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec == std::errc::result_out_of_range)
            throw std::invalid_argument(fmt::format("'{}' is out of range", str));
        if (ec != std::errc())
            throw std::invalid_argument(fmt::format("'{}' is not a number", str));
        if (ptr != end)
            throw std::invalid_argument(fmt::format("'{}' has trailing characters after the number", str));

        return value;
    }
}

} // namespace cfg2
