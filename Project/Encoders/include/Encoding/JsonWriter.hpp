#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include "Logging.hpp"

namespace Encoders {

// Streaming JSON token writer on top of rapidjson::Writer. Keeps track of the open
// composites so that misuse (a name outside an object, a value where a name is
// expected, a second top-level value) is reported as std::logic_error instead of
// tripping rapidjson's internal assertions. Names and strings must be valid UTF-8,
// anything else is rejected with std::invalid_argument. Write failures of the
// underlying stream are reported as std::ios_base::failure.
class ENCODERS_API JsonWriter
{
public:
    explicit JsonWriter(std::ostream& out);

    // non-copyable, the writer cursor belongs to one document
    JsonWriter(const JsonWriter&) = delete;
    JsonWriter& operator=(const JsonWriter&) = delete;

    JsonWriter& BeginObject();
    JsonWriter& EndObject();
    JsonWriter& BeginArray();
    JsonWriter& EndArray();

    JsonWriter& Name(const std::string& name);

    JsonWriter& Value(const std::string& value);
    JsonWriter& Value(std::int64_t value);
    JsonWriter& Value(std::uint64_t value);
    JsonWriter& Value(double value);
    JsonWriter& Value(bool value);
    JsonWriter& NullValue();

    void Flush();

    // true while the innermost open composite is an object
    bool InObject() const { return !m_scopes.empty() && m_scopes.back() == Scope::Object; }
    // number of composites currently open
    size_t Depth() const { return m_scopes.size(); }
    // true once a complete top-level value has been written
    bool IsComplete() const { return m_complete; }

private:
    enum class Scope { Object, Array };

    void BeforeValue();
    void AfterValue();
    void Check(bool ok, const char* what);
    void CheckEncoding(bool ok, const char* what);
    void CheckStream();

    using Writer = rapidjson::Writer<rapidjson::OStreamWrapper, rapidjson::UTF8<>, rapidjson::UTF8<>,
        rapidjson::CrtAllocator, rapidjson::kWriteValidateEncodingFlag>;

    std::ostream& m_out;
    rapidjson::OStreamWrapper m_stream;
    Writer m_writer;
    std::vector<Scope> m_scopes;
    bool m_pendingName = false;
    bool m_complete = false;
};

}
