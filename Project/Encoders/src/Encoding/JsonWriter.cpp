#include "pch.h"
#include "Encoding/JsonWriter.hpp"

namespace Encoders {

JsonWriter::JsonWriter(std::ostream& out)
    : m_out(out)
    , m_stream(out)
    , m_writer(m_stream)
{
}

void JsonWriter::BeforeValue()
{
    if (m_complete)
        throw std::logic_error("JSON must have only one top-level value");
    if (InObject() && !m_pendingName)
        throw std::logic_error("Nesting problem: a value inside an object must be preceded by a name");
    m_pendingName = false;
}

void JsonWriter::AfterValue()
{
    if (m_scopes.empty()) m_complete = true;
    CheckStream();
}

void JsonWriter::Check(bool ok, const char* what)
{
    if (!ok) throw std::logic_error(std::string("JSON writer rejected ") + what);
}

// With kWriteValidateEncodingFlag, Key/String only fail on malformed UTF-8
void JsonWriter::CheckEncoding(bool ok, const char* what)
{
    if (!ok) throw std::invalid_argument(std::string(what) + " is not valid UTF-8");
}

void JsonWriter::CheckStream()
{
    if (m_out.bad() || m_out.fail())
        throw std::ios_base::failure("Failed to write JSON to the output stream");
}

JsonWriter& JsonWriter::BeginObject()
{
    BeforeValue();
    Check(m_writer.StartObject(), "StartObject");
    m_scopes.push_back(Scope::Object);
    CheckStream();
    return *this;
}

JsonWriter& JsonWriter::EndObject()
{
    if (!InObject())
        throw std::logic_error("Nesting problem: EndObject without an open object");
    if (m_pendingName)
        throw std::logic_error("Dangling name: EndObject called after Name without a value");
    Check(m_writer.EndObject(), "EndObject");
    m_scopes.pop_back();
    AfterValue();
    return *this;
}

JsonWriter& JsonWriter::BeginArray()
{
    BeforeValue();
    Check(m_writer.StartArray(), "StartArray");
    m_scopes.push_back(Scope::Array);
    CheckStream();
    return *this;
}

JsonWriter& JsonWriter::EndArray()
{
    if (m_scopes.empty() || m_scopes.back() != Scope::Array)
        throw std::logic_error("Nesting problem: EndArray without an open array");
    Check(m_writer.EndArray(), "EndArray");
    m_scopes.pop_back();
    AfterValue();
    return *this;
}

JsonWriter& JsonWriter::Name(const std::string& name)
{
    if (!InObject())
        throw std::logic_error("Name '" + name + "' written outside of a JSON object");
    if (m_pendingName)
        throw std::logic_error("Name '" + name + "' written while another name is waiting for its value");
    CheckEncoding(m_writer.Key(name.c_str(), static_cast<rapidjson::SizeType>(name.size()), true), "Name");
    m_pendingName = true;
    CheckStream();
    return *this;
}

JsonWriter& JsonWriter::Value(const std::string& value)
{
    BeforeValue();
    CheckEncoding(m_writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), true), "String");
    AfterValue();
    return *this;
}

JsonWriter& JsonWriter::Value(std::int64_t value)
{
    BeforeValue();
    Check(m_writer.Int64(value), "Int64");
    AfterValue();
    return *this;
}

JsonWriter& JsonWriter::Value(std::uint64_t value)
{
    BeforeValue();
    Check(m_writer.Uint64(value), "Uint64");
    AfterValue();
    return *this;
}

JsonWriter& JsonWriter::Value(double value)
{
    if (!std::isfinite(value))
        throw std::invalid_argument("Numeric values must be finite");
    BeforeValue();
    Check(m_writer.Double(value), "Double");
    AfterValue();
    return *this;
}

JsonWriter& JsonWriter::Value(bool value)
{
    BeforeValue();
    Check(m_writer.Bool(value), "Bool");
    AfterValue();
    return *this;
}

JsonWriter& JsonWriter::NullValue()
{
    BeforeValue();
    Check(m_writer.Null(), "Null");
    AfterValue();
    return *this;
}

void JsonWriter::Flush()
{
    m_stream.Flush();
    CheckStream();
}

}
