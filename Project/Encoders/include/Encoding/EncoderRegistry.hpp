#pragma once

#include <functional>
#include <stdexcept>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

#include "Logging.hpp"
#include "Encoding/JsonValueObjectEncoderContext.hpp"
#include "Encoding/TypeName.hpp"

namespace Encoders {

// Lookup tables from a concrete type to its encoder. Typed encoders are erased to
// take a pointer to the complete object; the context only calls them for objects
// whose dynamic type is exactly the registered one. The tables are not modified
// while a document is being encoded.
class ENCODERS_API EncoderRegistry
{
public:
    using Encoder = std::function<void(const void*, JsonValueObjectEncoderContext&)>;

    template <typename T>
    EncoderRegistry& RegisterObjectEncoder(ObjectEncoder<T> encoder)
    {
        static_assert(!std::is_reference_v<T> && !std::is_const_v<T>, "register encoders for the plain type");
        if (!encoder) throw std::invalid_argument("Null object encoder for type " + TypeName<T>());

        std::type_index type(typeid(T));
        if (m_objectEncoders.count(type) != 0)
            ENCODERS_LOG_DEBUG("Replacing object encoder for type " + TypeName<T>());

        m_objectEncoders[type] = [encoder = std::move(encoder)](const void* object, JsonValueObjectEncoderContext& context)
        {
            encoder(*static_cast<const T*>(object), context);
        };
        return *this;
    }

    template <typename T>
    EncoderRegistry& RegisterValueEncoder(ValueEncoder<T> encoder)
    {
        static_assert(!std::is_reference_v<T> && !std::is_const_v<T>, "register encoders for the plain type");
        if (!encoder) throw std::invalid_argument("Null value encoder for type " + TypeName<T>());

        std::type_index type(typeid(T));
        if (m_valueEncoders.count(type) != 0)
            ENCODERS_LOG_DEBUG("Replacing value encoder for type " + TypeName<T>());

        m_valueEncoders[type] = [encoder = std::move(encoder)](const void* object, JsonValueObjectEncoderContext& context)
        {
            ValueEncoderContext valueContext(context);
            encoder(*static_cast<const T*>(object), valueContext);
        };
        return *this;
    }

    template <typename T>
    bool RemoveObjectEncoder() { return m_objectEncoders.erase(std::type_index(typeid(T))) != 0; }

    template <typename T>
    bool RemoveValueEncoder() { return m_valueEncoders.erase(std::type_index(typeid(T))) != 0; }

    // null when nothing is registered for the type
    const Encoder* FindObjectEncoder(const std::type_info& type) const;
    const Encoder* FindValueEncoder(const std::type_info& type) const;

    size_t ObjectEncoderCount() const { return m_objectEncoders.size(); }
    size_t ValueEncoderCount() const { return m_valueEncoders.size(); }

private:
    std::unordered_map<std::type_index, Encoder> m_objectEncoders;
    std::unordered_map<std::type_index, Encoder> m_valueEncoders;
};

}
