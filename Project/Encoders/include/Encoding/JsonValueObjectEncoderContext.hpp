#pragma once
/*********************************************************************************
* @File         JsonValueObjectEncoderContext.hpp
* @Brief        Recursive, registry-driven object-to-JSON encoder context:
*                  - Fluent Add(name, value) / Add(value) overloads writing through a
*                    JsonWriter.
*                  - Built-in handling for null, numbers, booleans, strings, byte
*                    sequences (as Base64), arrays, containers and string-keyed maps.
*                  - Everything else is dispatched on its concrete runtime type through
*                    the object-encoder table, then the value-encoder table, then the
*                    registered enumerator names.
*
* Usage notes:
*    - One context encodes one document; call Close() once the top-level Add returns,
*      also when it threw. DataEncoder does this for you.
*    - Object graphs must be acyclic. Set EncoderSettings::maxDepth to turn runaway
*      recursion into an EncodingException.
*********************************************************************************/
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <typeinfo>
#include <variant>
#include <vector>

#include "Logging.hpp"
#include "Encoding/EncoderTraits.hpp"
#include "Encoding/EncodingException.hpp"
#include "Encoding/EnumNames.hpp"
#include "Encoding/JsonWriter.hpp"
#include "Encoding/TypeName.hpp"

namespace Encoders {

class EncoderRegistry;
struct EncoderSettings;
class JsonValueObjectEncoderContext;
class ValueEncoderContext;

using ObjectEncoderContext = JsonValueObjectEncoderContext;

// Writes the fields of a T into the object the context has opened for it.
template <typename T>
using ObjectEncoder = std::function<void(const T&, ObjectEncoderContext&)>;

// Writes a T as one bare JSON value.
template <typename T>
using ValueEncoder = std::function<void(const T&, ValueEncoderContext&)>;

class ENCODERS_API JsonValueObjectEncoderContext
{
public:
    JsonValueObjectEncoderContext(std::ostream& out, const EncoderRegistry& registry);
    JsonValueObjectEncoderContext(std::ostream& out, const EncoderRegistry& registry, const EncoderSettings& settings);

    JsonValueObjectEncoderContext(const JsonValueObjectEncoderContext&) = delete;
    JsonValueObjectEncoderContext& operator=(const JsonValueObjectEncoderContext&) = delete;

    // Writes a field name into the open object, then the value.
    template <typename T>
    JsonValueObjectEncoderContext& Add(const std::string& name, const T& value)
    {
        if (m_ignoreNullValues && Traits::IsNull(value)) return *this;
        WriteName(name);
        return Add(value);
    }

    JsonValueObjectEncoderContext& Add(std::nullptr_t);
    JsonValueObjectEncoderContext& Add(const std::string& value);
    JsonValueObjectEncoderContext& Add(const char* value);
    JsonValueObjectEncoderContext& Add(double value);
    JsonValueObjectEncoderContext& Add(int value);
    JsonValueObjectEncoderContext& Add(std::int64_t value);
    JsonValueObjectEncoderContext& Add(bool value);
    JsonValueObjectEncoderContext& Add(const std::vector<std::uint8_t>& bytes);

    // Any other value. The order of the checks is significant: numbers and byte
    // sequences before generic arrays, containers and maps before the registries,
    // enumerator names only after both registries missed.
    template <typename T>
    JsonValueObjectEncoderContext& Add(const T& value)
    {
        if constexpr (Traits::is_null_type<T>::value)
        {
            m_writer.NullValue();
        }
        else if constexpr (Traits::is_pointer_like<T>::value)
        {
            if (!value) m_writer.NullValue();
            else Add(*value);
        }
        else if constexpr (Traits::is_optional<T>::value)
        {
            if (!value.has_value()) m_writer.NullValue();
            else Add(*value);
        }
        else if constexpr (Traits::is_variant<T>::value)
        {
            if (value.valueless_by_exception()) m_writer.NullValue();
            else std::visit([this](const auto& alternative) { Add(alternative); }, value);
        }
        else if constexpr (Traits::is_number<T>::value)
        {
            AddNumber(value);
        }
        else if constexpr (std::is_same_v<T, bool>)
        {
            m_writer.Value(value);
        }
        else if constexpr (Traits::is_string_like<T>::value)
        {
            AddString(value);
        }
        else if constexpr (Traits::is_byte_sequence<T>::value)
        {
            // Byte sequences are not mapped to an array, but to a Base64 string.
            AddBytes(reinterpret_cast<const std::uint8_t*>(std::data(value)), std::size(value));
        }
        else if constexpr (Traits::is_fixed_array<T>::value || Traits::is_container<T>::value)
        {
            OpenArray();
            for (const auto& item : value)
            {
                Add(item);
            }
            CloseArray();
        }
        else if constexpr (Traits::is_mapping<T>::value)
        {
            AddMapping(value);
        }
        else
        {
            AddObject(value);
        }
        return *this;
    }

    // Flushes the underlying writer. Safe to call more than once.
    void Close();

    bool IsClosed() const { return m_closed; }

private:
    template <typename N>
    void AddNumber(N value)
    {
        if constexpr (std::is_floating_point_v<N>)
            AddDouble(static_cast<double>(value));
        else if constexpr (std::is_signed_v<N>)
            m_writer.Value(static_cast<std::int64_t>(value));
        else
            m_writer.Value(static_cast<std::uint64_t>(value));
    }

    template <typename S>
    void AddString(const S& value)
    {
        if constexpr (std::is_pointer_v<S>)
        {
            if (value == nullptr) { m_writer.NullValue(); return; }
        }
        WriteString(std::string(value));
    }

    template <typename M>
    void AddMapping(const M& map)
    {
        OpenObject();
        for (const auto& entry : map)
        {
            Add(StringKey(entry.first), entry.second);
        }
        CloseObject();
    }

    template <typename K>
    static std::string StringKey(const K& key)
    {
        if constexpr (Traits::is_string_like<K>::value)
        {
            if constexpr (std::is_pointer_v<K>)
            {
                if (key == nullptr)
                    throw EncodingException(NonStringKeyMessage("null", TypeName<K>()));
            }
            return std::string(key);
        }
        else if constexpr (Traits::is_variant<K>::value)
        {
            try
            {
                if (key.valueless_by_exception()) throw std::bad_variant_access();
                return std::visit([](const auto& alternative) -> std::string {
                    using A = std::decay_t<decltype(alternative)>;
                    if constexpr (Traits::is_string_like<A>::value) return std::string(alternative);
                    else throw std::bad_variant_access();
                }, key);
            }
            catch (const std::bad_variant_access&)
            {
                std::string text = "<valueless>";
                std::string type = TypeName<K>();
                if (!key.valueless_by_exception())
                {
                    text = std::visit([](const auto& alternative) { return DescribeKey(alternative); }, key);
                    type = std::visit([](const auto& alternative) { return TypeName(typeid(alternative)); }, key);
                }
                throw EncodingException(NonStringKeyMessage(text, type), std::current_exception());
            }
        }
        else
        {
            throw EncodingException(NonStringKeyMessage(DescribeKey(key), TypeName<K>()),
                std::make_exception_ptr(std::bad_cast()));
        }
    }

    template <typename K>
    static std::string DescribeKey(const K& key)
    {
        if constexpr (Traits::is_streamable<K>::value && !std::is_enum_v<K>)
        {
            std::ostringstream ss;
            if constexpr (std::is_same_v<K, bool>) ss << std::boolalpha;
            if constexpr (Traits::is_byte_element<K>::value && !std::is_same_v<K, std::byte>) ss << static_cast<int>(key);
            else ss << key;
            return ss.str();
        }
        else if constexpr (std::is_enum_v<K>)
        {
            std::string name;
            if (EnumNames::Find(key, name)) return name;
            return std::to_string(EnumNames::ToKey(key));
        }
        else
        {
            return "<unprintable>";
        }
    }

    template <typename T>
    void AddObject(const T& value)
    {
        // typeid of a polymorphic glvalue yields its dynamic type; the encoders are
        // handed the complete object so they can cast back to that type.
        const std::type_info& type = typeid(value);
        const void* object = nullptr;
        if constexpr (std::is_polymorphic_v<T>)
            object = dynamic_cast<const void*>(std::addressof(value));
        else
            object = static_cast<const void*>(std::addressof(value));

        if (EncodeWithObjectEncoder(type, object)) return;
        if (EncodeWithValueEncoder(type, object)) return;

        // Process enum last if it does not have a custom encoder registered.
        if constexpr (std::is_enum_v<T>)
        {
            std::string name;
            if (EnumNames::Find(value, name))
            {
                WriteString(name);
                return;
            }
        }

        throw EncodingException("Couldn't find encoder for type " + TypeName(type));
    }

    static std::string NonStringKeyMessage(const std::string& key, const std::string& type);

    // Malformed UTF-8 becomes an EncodingException
    void WriteName(const std::string& name);
    void WriteString(const std::string& value);
    void AddDouble(double value);
    void AddBytes(const std::uint8_t* data, size_t size);
    void OpenObject();
    void CloseObject();
    void OpenArray();
    void CloseArray();
    void CheckDepth();
    bool EncodeWithObjectEncoder(const std::type_info& type, const void* object);
    bool EncodeWithValueEncoder(const std::type_info& type, const void* object);

    JsonWriter m_writer;
    const EncoderRegistry& m_registry;
    bool m_ignoreNullValues = false;
    size_t m_maxDepth = 0;
    bool m_closed = false;
};

// The view of the context a ValueEncoder gets: bare values only, no field names.
class ENCODERS_API ValueEncoderContext
{
public:
    explicit ValueEncoderContext(JsonValueObjectEncoderContext& context) : m_context(context) {}

    template <typename T>
    ValueEncoderContext& Add(const T& value)
    {
        m_context.Add(value);
        return *this;
    }

private:
    JsonValueObjectEncoderContext& m_context;
};

}
