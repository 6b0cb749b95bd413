#pragma once

#include "config_node.hpp"
#include <tuple>
#include <type_traits>

namespace cfg2 {

template<typename T> T deserialize(const ConfigNode &);

template<typename T> struct is_deserializable_struct : std::false_type { };

// Binds an INI key to a member of a section struct
template<typename Class, typename Field> struct FieldDesc {
    std::string name;
    Field Class::*ptr;
};

template<typename Class, typename Field> FieldDesc<Class, Field> field(std::string name, Field Class::*ptr)
{
    return {std::move(name), ptr};
}


// Fills a default-constructed T from the keys of a section node. Keys that are
// missing keep the member initializer; conversion errors are reported as
// "[section] key: reason". validate() runs last.
template<typename T, typename... Fields> class Deserializer {
public:
    explicit Deserializer(Fields... f)
        : fields_(std::move(f)...)
    { }

    T operator()(const ConfigNode &section) const
    {
        T result{};
        std::apply([&](const auto &...desc) { (assign(result, section, desc), ...); }, fields_);
        result.validate();
        return result;
    }

private:
    template<typename Field> static void assign(T &target, const ConfigNode &section, const FieldDesc<T, Field> &desc)
    {
        const ConfigNode *node = section.findChild(desc.name);
        if (node == nullptr)
            return;

        try {
            target.*desc.ptr = fromString<Field>(node->value);
        } catch (const std::invalid_argument &e) {
            throw std::invalid_argument(fmt::format("[{}] {}: {}", section.key, desc.name, e.what()));
        }
    }

    std::tuple<Fields...> fields_;
};

template<typename T, typename... Fields> Deserializer<T, Fields...> make_deserializer(Fields... fields)
{
    return Deserializer<T, Fields...>(std::move(fields)...);
}


#define REGISTER_STRUCT(Type, ...)                                                                                     \
    template<> struct is_deserializable_struct<Type> : std::true_type { };                                             \
    template<> inline Type deserialize<Type>(const ConfigNode &node)                                                   \
    {                                                                                                                  \
        return make_deserializer<Type>(__VA_ARGS__)(node);                                                             \
    }

template<typename T> T parse(const ConfigNode &node)
{
    static_assert(is_deserializable_struct<T>::value, "no deserializer registered for this type");
    return deserialize<T>(node);
}

} // namespace cfg2
