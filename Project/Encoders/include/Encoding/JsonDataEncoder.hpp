#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>

#include "Logging.hpp"
#include "Encoding/EncoderRegistry.hpp"
#include "Encoding/EncodingException.hpp"
#include "Encoding/JsonValueObjectEncoderContext.hpp"
#include "Settings/EncoderSettings.hpp"

namespace Encoders {

// Immutable JSON encoder produced by JsonDataEncoderBuilder. Every Encode call gets
// its own context, so one DataEncoder may serve several threads.
class ENCODERS_API DataEncoder
{
public:
    DataEncoder(std::shared_ptr<const EncoderRegistry> registry, const EncoderSettings& settings);

    // Writes value as one JSON document to out. Any exception leaves a truncated
    // document behind; callers must discard it.
    template <typename T>
    void Encode(const T& value, std::ostream& out) const
    {
        JsonValueObjectEncoderContext context(out, *m_registry, m_settings);
        try
        {
            context.Add(value);
        }
        catch (const EncodingException& ex)
        {
            ENCODERS_LOG_ERROR(std::string("Failed to encode ") + TypeName<T>() + ": " + ex.what());
            CloseAfterFailure(context);
            throw;
        }
        catch (const std::exception& ex)
        {
            ENCODERS_LOG_ERROR(std::string("Failed to write ") + TypeName<T>() + " as JSON: " + ex.what());
            CloseAfterFailure(context);
            throw;
        }
        catch (...)
        {
            CloseAfterFailure(context);
            throw;
        }
        context.Close();
    }

    template <typename T>
    std::string Encode(const T& value) const
    {
        std::ostringstream out;
        Encode(value, out);
        return out.str();
    }

    const EncoderSettings& GetSettings() const { return m_settings; }

private:
    // Close() flushes, which throws again on a broken stream; the original error wins.
    static void CloseAfterFailure(JsonValueObjectEncoderContext& context);

    std::shared_ptr<const EncoderRegistry> m_registry;
    EncoderSettings m_settings;
};

// Collects encoders and options, then builds a DataEncoder holding a snapshot of them.
// Registering an object encoder for a type drops any value encoder for the same type
// and the other way around.
class ENCODERS_API JsonDataEncoderBuilder
{
public:
    using Configurator = std::function<void(JsonDataEncoderBuilder&)>;

    // Starts with a value encoder for std::chrono::system_clock::time_point.
    JsonDataEncoderBuilder();

    template <typename T>
    JsonDataEncoderBuilder& RegisterObjectEncoder(ObjectEncoder<T> encoder)
    {
        m_registry.RegisterObjectEncoder<T>(std::move(encoder));
        m_registry.RemoveValueEncoder<T>();
        return *this;
    }

    template <typename T>
    JsonDataEncoderBuilder& RegisterValueEncoder(ValueEncoder<T> encoder)
    {
        m_registry.RegisterValueEncoder<T>(std::move(encoder));
        m_registry.RemoveObjectEncoder<T>();
        return *this;
    }

    // Lets a generated or hand-written configurator register a batch of encoders.
    JsonDataEncoderBuilder& ConfigureWith(const Configurator& configurator);

    JsonDataEncoderBuilder& IgnoreNullValues(bool ignore);
    JsonDataEncoderBuilder& MaxDepth(size_t depth);

    // Takes over ignoreNullValues/maxDepth and applies the log level.
    JsonDataEncoderBuilder& ApplySettings(const EncoderSettings& settings);

    DataEncoder Build() const;

private:
    EncoderRegistry m_registry;
    EncoderSettings m_settings;
};

}
