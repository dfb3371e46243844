#include "pch.h"
#include "Settings/EncoderSettings.hpp"
#include "Logging.hpp"

#include "rapidjson/document.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/error/en.h"

namespace Encoders {

static const char* LogLevelName(EncodersLogging::LogLevel level)
{
    switch (level)
    {
    case EncodersLogging::LogLevel::Trace:    return "trace";
    case EncodersLogging::LogLevel::Debug:    return "debug";
    case EncodersLogging::LogLevel::Info:     return "info";
    case EncodersLogging::LogLevel::Warn:     return "warn";
    case EncodersLogging::LogLevel::Error:    return "error";
    case EncodersLogging::LogLevel::Critical: return "critical";
    }
    return "info";
}

bool EncoderSettings::LoadFromString(const std::string& json, EncoderSettings& out)
{
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());

    if (doc.HasParseError()) {
        ENCODERS_PRINT(std::string("[EncoderSettings] Failed to parse settings: ") +
            rapidjson::GetParseError_En(doc.GetParseError()) + " at offset " + std::to_string(doc.GetErrorOffset()),
            EncodersLogging::LogLevel::Warn);
        return false;
    }
    if (!doc.IsObject()) {
        ENCODERS_PRINT("[EncoderSettings] Settings root must be a JSON object", EncodersLogging::LogLevel::Warn);
        return false;
    }

    bool ok = true;

    if (doc.HasMember("ignoreNullValues")) {
        if (doc["ignoreNullValues"].IsBool()) {
            out.ignoreNullValues = doc["ignoreNullValues"].GetBool();
        }
        else {
            ENCODERS_PRINT("[EncoderSettings] 'ignoreNullValues' must be a boolean, keeping current value", EncodersLogging::LogLevel::Warn);
            ok = false;
        }
    }

    if (doc.HasMember("maxDepth")) {
        if (doc["maxDepth"].IsUint64()) {
            out.maxDepth = static_cast<size_t>(doc["maxDepth"].GetUint64());
        }
        else {
            ENCODERS_PRINT("[EncoderSettings] 'maxDepth' must be a non-negative integer, keeping current value", EncodersLogging::LogLevel::Warn);
            ok = false;
        }
    }

    if (doc.HasMember("logLevel")) {
        EncodersLogging::LogLevel level;
        if (doc["logLevel"].IsString() && EncodersLogging::ParseLogLevel(doc["logLevel"].GetString(), level)) {
            out.logLevel = level;
        }
        else {
            ENCODERS_PRINT("[EncoderSettings] 'logLevel' must be one of trace/debug/info/warn/error/critical, keeping current value", EncodersLogging::LogLevel::Warn);
            ok = false;
        }
    }

    return ok;
}

bool EncoderSettings::LoadFromFile(const std::string& filePath, EncoderSettings& out)
{
    namespace fs = std::filesystem;

    // Check if file exists (avoid exception overhead)
    if (!fs::exists(filePath)) {
        ENCODERS_PRINT("[EncoderSettings] No settings file at " + filePath + ", using current values", EncodersLogging::LogLevel::Info);
        return false;
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        ENCODERS_PRINT("[EncoderSettings] Failed to open settings file: " + filePath, EncodersLogging::LogLevel::Warn);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    bool ok = LoadFromString(buffer.str(), out);
    if (ok) {
        ENCODERS_PRINT("[EncoderSettings] Loaded settings from " + filePath, EncodersLogging::LogLevel::Info);
    }
    return ok;
}

std::string EncoderSettings::ToJson() const
{
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("ignoreNullValues");
    writer.Bool(ignoreNullValues);
    writer.Key("maxDepth");
    writer.Uint64(static_cast<uint64_t>(maxDepth));
    writer.Key("logLevel");
    writer.String(LogLevelName(logLevel));
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

bool EncoderSettings::SaveToFile(const std::string& filePath) const
{
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path parent = fs::path(filePath).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            ENCODERS_PRINT("[EncoderSettings] Failed to create directory " + parent.string() + ": " + ec.message(), EncodersLogging::LogLevel::Error);
            return false;
        }
    }

    std::ofstream file(filePath, std::ios::trunc);
    if (!file.is_open()) {
        ENCODERS_PRINT("[EncoderSettings] Failed to open settings file for writing: " + filePath, EncodersLogging::LogLevel::Error);
        return false;
    }

    file << ToJson();
    file.close();
    if (file.fail()) {
        ENCODERS_PRINT("[EncoderSettings] Failed to write settings file: " + filePath, EncodersLogging::LogLevel::Error);
        return false;
    }

    ENCODERS_PRINT("[EncoderSettings] Saved settings to " + filePath, EncodersLogging::LogLevel::Info);
    return true;
}

}
