#include "pch.h"
#include "Encoding/EncoderRegistry.hpp"

namespace Encoders {

const EncoderRegistry::Encoder* EncoderRegistry::FindObjectEncoder(const std::type_info& type) const
{
    auto it = m_objectEncoders.find(std::type_index(type));
    return it != m_objectEncoders.end() ? &it->second : nullptr;
}

const EncoderRegistry::Encoder* EncoderRegistry::FindValueEncoder(const std::type_info& type) const
{
    auto it = m_valueEncoders.find(std::type_index(type));
    return it != m_valueEncoders.end() ? &it->second : nullptr;
}

}
