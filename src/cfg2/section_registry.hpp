#pragma once

#include "config_node.hpp"
#include "deserializer.hpp"
#include <functional>
#include <memory>
#include <string>

namespace cfg2 {

// Base class for all sections
struct BaseSection {
    std::string sectionName;
    virtual ~BaseSection() = default;
};

using SectionFactory = std::function<std::unique_ptr<BaseSection>(const ConfigNode &)>;

// Maps "[name]" to the factory building its section struct
class SectionRegistry {
public:
    static void registerFactory(const std::string &sectionName, const SectionFactory &factory);
    static std::unique_ptr<BaseSection> create(const std::string &sectionName, const ConfigNode &node);
    static bool hasSection(const std::string &sectionName);
};

// Header-safe registration through an inline variable
#define REGISTER_SECTION(Type, SectionName, ...)                                                                       \
    static_assert(std::is_base_of_v<BaseSection, Type>, #Type " must inherit from BaseSection");                       \
    REGISTER_STRUCT(Type, __VA_ARGS__)                                                                                 \
    inline const bool Type##_registered = []() {                                                                       \
        SectionRegistry::registerFactory(SectionName, [](const ConfigNode &node) -> std::unique_ptr<BaseSection> {     \
            auto obj = std::make_unique<Type>(deserialize<Type>(node));                                                \
            obj->sectionName = node.key;                                                                               \
            return obj;                                                                                                \
        });                                                                                                            \
        return true;                                                                                                   \
    }();

} // namespace cfg2
