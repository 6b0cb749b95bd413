#include "ini_reader.hpp"
#include <SimpleIni.h>
#include <cerrno>
#include <fmt/core.h>
#include <stdexcept>
#include <system_error>

namespace cfg2 {

namespace {

// SimpleIni hands out names in hash order; nOrder is the position in the file
CSimpleIniA::TNamesDepend in_file_order(CSimpleIniA::TNamesDepend names)
{
    names.sort([](const auto &a, const auto &b) { return a.nOrder < b.nOrder; });
    return names;
}


ConfigNode values_of(const CSimpleIniA &ini, const char *section, ConfigNode node)
{
    CSimpleIniA::TNamesDepend keys;
    ini.GetAllKeys(section, keys);

    for (const auto &key: in_file_order(std::move(keys))) {
        const char *value = ini.GetValue(section, key.pItem, "");
        node.children.push_back(ConfigNode{key.pItem, value, {}, NodeType::VALUE});
    }

    return node;
}

} // namespace


ConfigNode parseIniFile(const std::filesystem::path &filename)
{
    CSimpleIniA ini;
    const SI_Error rc = ini.LoadFile(filename.c_str());
    if (rc == SI_FILE)
        throw std::runtime_error(fmt::format("Cannot read configuration file '{}': {}", filename.string(),
                                             std::error_code(errno, std::generic_category()).message()));
    if (rc < 0)
        throw std::runtime_error(fmt::format("Cannot parse configuration file '{}' (SimpleIni error {})",
                                             filename.string(), static_cast<int>(rc)));

    // keys above the first [section] become root values; deserialize<Config> rejects them
    ConfigNode root = values_of(ini, "", ConfigNode{"config", "", {}, NodeType::ROOT});

    CSimpleIniA::TNamesDepend sections;
    ini.GetAllSections(sections);

    for (const auto &section: in_file_order(std::move(sections))) {
        if (*section.pItem == '\0')
            continue;
        root.children.push_back(values_of(ini, section.pItem, ConfigNode{section.pItem, "", {}, NodeType::SECTION}));
    }

    return root;
}

} // namespace cfg2
