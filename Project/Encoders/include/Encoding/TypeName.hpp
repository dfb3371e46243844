#pragma once

#include <string>
#include <typeinfo>

#include "Logging.hpp"

namespace Encoders {

// Human-readable name of a type, used in error messages.
ENCODERS_API std::string TypeName(const std::type_info& type);

template <typename T>
std::string TypeName() { return TypeName(typeid(T)); }

}
