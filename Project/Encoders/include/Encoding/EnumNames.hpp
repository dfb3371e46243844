#pragma once

#include <initializer_list>
#include <mutex>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Logging.hpp"

namespace Encoders {

// Process-wide table of enumerator names. Enums are written as their symbolic name
// when no encoder is registered for them, which needs the names recorded here first,
// normally through ENCODERS_REGISTER_ENUM.
class ENCODERS_API EnumNames
{
public:
    using Table = std::unordered_map<long long, std::string>;

    template <typename E>
    static bool Register(std::initializer_list<std::pair<E, const char*>> entries)
    {
        static_assert(std::is_enum<E>::value, "EnumNames::Register expects an enum type");
        Table table;
        for (const auto& entry : entries) table[ToKey(entry.first)] = entry.second;
        Store(std::type_index(typeid(E)), std::move(table));
        return true;
    }

    // names is the stringized enumerator list, e.g. "Color::Red, Color::Green".
    // Qualifiers are dropped so only the enumerator itself is kept.
    template <typename E>
    static bool RegisterList(const char* names, std::initializer_list<E> values)
    {
        static_assert(std::is_enum<E>::value, "EnumNames::RegisterList expects an enum type");
        std::vector<std::string> split = SplitNames(names);
        if (split.size() != values.size()) return false;

        Table table;
        size_t index = 0;
        for (E value : values) table[ToKey(value)] = split[index++];
        Store(std::type_index(typeid(E)), std::move(table));
        return true;
    }

    template <typename E>
    static bool Find(E value, std::string& out)
    {
        return Find(std::type_index(typeid(E)), ToKey(value), out);
    }

    static bool Find(std::type_index type, long long value, std::string& out);
    static bool IsRegistered(std::type_index type);

    template <typename E>
    static long long ToKey(E value)
    {
        return static_cast<long long>(static_cast<typename std::underlying_type<E>::type>(value));
    }

private:
    static void Store(std::type_index type, Table table);
    static std::vector<std::string> SplitNames(const char* names);

    // Registry helpers returning TU-local statics
    static std::unordered_map<std::type_index, Table>& enum_name_lookup();
    static std::mutex& enum_registry_mutex();
};

}

#define ENCODERS_ENUM_CONCAT_IMPL(a, b) a##b
#define ENCODERS_ENUM_CONCAT(a, b) ENCODERS_ENUM_CONCAT_IMPL(a, b)

// Records the symbolic names of the listed enumerators. Use at namespace scope:
//   ENCODERS_REGISTER_ENUM(Color, Color::Red, Color::Green);
#define ENCODERS_REGISTER_ENUM(TYPE, ...) \
  [[maybe_unused]] static const bool ENCODERS_ENUM_CONCAT(s_encodersEnumRegistered_, __LINE__) = \
    ::Encoders::EnumNames::RegisterList<TYPE>(#__VA_ARGS__, { __VA_ARGS__ })
