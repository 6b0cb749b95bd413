#include "config.hpp"
#include "ini_reader.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_set>

namespace cfg2 {

template<> Config deserialize<Config>(const ConfigNode &node)
{
    if (!node.isRoot())
        throw std::invalid_argument("Config deserializer requires a root ConfigNode");

    Config config{};
    std::unordered_set<std::string> foundSections;

    for (const auto &child: node.children) {
        if (!child.isSection())
            throw std::invalid_argument("Global keys are not allowed in configuration; found key: '" + child.key + "'");

        if (!SectionRegistry::hasSection(child.key)) {
            // Log warning, but allow for forward-compatability
            spdlog::warn("Unknown configuration section '[{}]' ignored", child.key);
            continue;
        }

        if (!foundSections.insert(child.key).second)
            throw std::invalid_argument("Section '[" + child.key + "]' appears more than once");

        auto section = SectionRegistry::create(child.key, child);
        if (auto *generalSection = dynamic_cast<GeneralSection *>(section.get()))
            config.general = *generalSection;
        else if (auto *herderSection = dynamic_cast<HerderSection *>(section.get()))
            config.herder = *herderSection;
    }

    config.validate();

    return config;
}


Config loadConfig(const std::filesystem::path &config_file)
{
    ConfigNode root = parseIniFile(config_file);
    return parse<Config>(root);
}

} // namespace cfg2
