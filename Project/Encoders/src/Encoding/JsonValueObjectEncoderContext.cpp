#include "pch.h"
#include "Encoding/JsonValueObjectEncoderContext.hpp"
#include "Encoding/Base64.hpp"
#include "Encoding/EncoderRegistry.hpp"
#include "Settings/EncoderSettings.hpp"

namespace Encoders {

JsonValueObjectEncoderContext::JsonValueObjectEncoderContext(std::ostream& out, const EncoderRegistry& registry)
    : m_writer(out)
    , m_registry(registry)
{
}

JsonValueObjectEncoderContext::JsonValueObjectEncoderContext(std::ostream& out, const EncoderRegistry& registry, const EncoderSettings& settings)
    : m_writer(out)
    , m_registry(registry)
    , m_ignoreNullValues(settings.ignoreNullValues)
    , m_maxDepth(settings.maxDepth)
{
}

#pragma region Bare values
JsonValueObjectEncoderContext& JsonValueObjectEncoderContext::Add(std::nullptr_t)
{
    m_writer.NullValue();
    return *this;
}

JsonValueObjectEncoderContext& JsonValueObjectEncoderContext::Add(const std::string& value)
{
    WriteString(value);
    return *this;
}

JsonValueObjectEncoderContext& JsonValueObjectEncoderContext::Add(const char* value)
{
    AddString(value);
    return *this;
}

JsonValueObjectEncoderContext& JsonValueObjectEncoderContext::Add(double value)
{
    AddDouble(value);
    return *this;
}

JsonValueObjectEncoderContext& JsonValueObjectEncoderContext::Add(int value)
{
    m_writer.Value(static_cast<std::int64_t>(value));
    return *this;
}

JsonValueObjectEncoderContext& JsonValueObjectEncoderContext::Add(std::int64_t value)
{
    m_writer.Value(value);
    return *this;
}

JsonValueObjectEncoderContext& JsonValueObjectEncoderContext::Add(bool value)
{
    m_writer.Value(value);
    return *this;
}

JsonValueObjectEncoderContext& JsonValueObjectEncoderContext::Add(const std::vector<std::uint8_t>& bytes)
{
    AddBytes(bytes.data(), bytes.size());
    return *this;
}
#pragma endregion

void JsonValueObjectEncoderContext::Close()
{
    if (m_closed) return;
    m_closed = true;
    m_writer.Flush();
}

std::string JsonValueObjectEncoderContext::NonStringKeyMessage(const std::string& key, const std::string& type)
{
    return "Only string keys are currently supported in maps, got " + key + " of type " + type + " instead.";
}

void JsonValueObjectEncoderContext::WriteName(const std::string& name)
{
    try
    {
        m_writer.Name(name);
    }
    catch (const std::invalid_argument&)
    {
        throw EncodingException("Field name is not valid UTF-8", std::current_exception());
    }
}

void JsonValueObjectEncoderContext::WriteString(const std::string& value)
{
    try
    {
        m_writer.Value(value);
    }
    catch (const std::invalid_argument&)
    {
        throw EncodingException("String is not valid UTF-8", std::current_exception());
    }
}

void JsonValueObjectEncoderContext::AddDouble(double value)
{
    if (!std::isfinite(value))
    {
        std::ostringstream ss;
        ss << "Numeric values must be finite, but was " << value;
        throw EncodingException(ss.str());
    }
    m_writer.Value(value);
}

void JsonValueObjectEncoderContext::AddBytes(const std::uint8_t* data, size_t size)
{
    m_writer.Value(Base64_Encode(data, size));
}

void JsonValueObjectEncoderContext::CheckDepth()
{
    if (m_maxDepth != 0 && m_writer.Depth() >= m_maxDepth)
    {
        throw EncodingException("Maximum nesting depth of " + std::to_string(m_maxDepth) +
            " exceeded, the object graph may contain a cycle");
    }
}

void JsonValueObjectEncoderContext::OpenObject()
{
    CheckDepth();
    m_writer.BeginObject();
}

void JsonValueObjectEncoderContext::CloseObject()
{
    m_writer.EndObject();
}

void JsonValueObjectEncoderContext::OpenArray()
{
    CheckDepth();
    m_writer.BeginArray();
}

void JsonValueObjectEncoderContext::CloseArray()
{
    m_writer.EndArray();
}

bool JsonValueObjectEncoderContext::EncodeWithObjectEncoder(const std::type_info& type, const void* object)
{
    const EncoderRegistry::Encoder* encoder = m_registry.FindObjectEncoder(type);
    if (!encoder) return false;

    OpenObject();
    (*encoder)(object, *this);
    CloseObject();
    return true;
}

bool JsonValueObjectEncoderContext::EncodeWithValueEncoder(const std::type_info& type, const void* object)
{
    const EncoderRegistry::Encoder* encoder = m_registry.FindValueEncoder(type);
    if (!encoder) return false;

    (*encoder)(object, *this);
    return true;
}

}
