#include "pch.h"
#include "Encoding/EnumNames.hpp"

namespace Encoders {

std::unordered_map<std::type_index, EnumNames::Table>& EnumNames::enum_name_lookup()
{
    static std::unordered_map<std::type_index, Table> s_map;
    return s_map;
}

std::mutex& EnumNames::enum_registry_mutex()
{
    static std::mutex s_mutex;
    return s_mutex;
}

void EnumNames::Store(std::type_index type, Table table)
{
    std::lock_guard<std::mutex> lock(enum_registry_mutex());
    enum_name_lookup()[type] = std::move(table);
}

bool EnumNames::Find(std::type_index type, long long value, std::string& out)
{
    std::lock_guard<std::mutex> lock(enum_registry_mutex());
    auto tableIt = enum_name_lookup().find(type);
    if (tableIt == enum_name_lookup().end()) return false;

    auto nameIt = tableIt->second.find(value);
    if (nameIt == tableIt->second.end()) return false;

    out = nameIt->second;
    return true;
}

bool EnumNames::IsRegistered(std::type_index type)
{
    std::lock_guard<std::mutex> lock(enum_registry_mutex());
    return enum_name_lookup().count(type) != 0;
}

std::vector<std::string> EnumNames::SplitNames(const char* names)
{
    std::vector<std::string> out;
    if (!names) return out;

    std::stringstream ss(names);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        size_t first = item.find_first_not_of(" \t\r\n");
        size_t last = item.find_last_not_of(" \t\r\n");
        if (first == std::string::npos) continue;
        item = item.substr(first, last - first + 1);

        size_t scope = item.rfind("::");
        if (scope != std::string::npos) item = item.substr(scope + 2);
        out.push_back(item);
    }
    return out;
}

}
