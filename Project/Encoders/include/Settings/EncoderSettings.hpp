#pragma once

#include <cstddef>
#include <string>

#include "Logging.hpp"

namespace Encoders {

// Options shared by every document a DataEncoder writes. Persisted as a small JSON
// object, e.g.
//   { "ignoreNullValues": true, "maxDepth": 64, "logLevel": "warn" }
struct ENCODERS_API EncoderSettings
{
    // Skip Add(name, value) entirely when the value is null-like
    bool ignoreNullValues = false;

    // Maximum number of nested objects/arrays, 0 = unlimited
    size_t maxDepth = 0;

    EncodersLogging::LogLevel logLevel = EncodersLogging::LogLevel::Info;

    // Load settings from JSON text/file. Members that are present and well-typed
    // overwrite the ones in out; returns false (and logs why) on any problem.
    static bool LoadFromString(const std::string& json, EncoderSettings& out);
    static bool LoadFromFile(const std::string& filePath, EncoderSettings& out);

    std::string ToJson() const;
    bool SaveToFile(const std::string& filePath) const;
};

}
