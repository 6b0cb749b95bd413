#include "section_registry.hpp"
#include <stdexcept>
#include <unordered_map>

namespace cfg2 {

namespace {
using Factories = std::unordered_map<std::string, SectionFactory>;

Factories &factories()
{
    static Factories f; // function-local static; thread-safe initialization
    return f;
}
} // namespace

void SectionRegistry::registerFactory(const std::string &sectionName, const SectionFactory &factory)
{
    auto &f = factories();
    if (f.find(sectionName) != f.end())
        throw std::runtime_error("Duplicate section factory registration: " + sectionName);
    f.emplace(sectionName, factory);
}

std::unique_ptr<BaseSection> SectionRegistry::create(const std::string &sectionName, const ConfigNode &node)
{
    auto &f = factories();
    auto it = f.find(sectionName);
    if (it != f.end())
        return it->second(node);
    throw std::runtime_error("Unknown section: " + sectionName);
}

bool SectionRegistry::hasSection(const std::string &sectionName)
{
    auto &f = factories();
    return f.find(sectionName) != f.end();
}

} // namespace cfg2
