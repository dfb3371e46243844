#include "pch.h"
#include "Encoding/TypeName.hpp"

#include <boost/core/demangle.hpp>

namespace Encoders {

std::string TypeName(const std::type_info& type)
{
    // Itanium names are mangled; MSVC names are readable but prefixed with "class "/"struct "
    std::string name = boost::core::demangle(type.name());
    if (name.find("struct ") == 0) {
        name = name.substr(7);
    }
    else if (name.find("class ") == 0) {
        name = name.substr(6);
    }
    return name;
}

}
