#include "pch.h"
#include "Encoding/JsonDataEncoder.hpp"
#include "Encoding/Timestamp.hpp"

namespace Encoders {

DataEncoder::DataEncoder(std::shared_ptr<const EncoderRegistry> registry, const EncoderSettings& settings)
    : m_registry(std::move(registry))
    , m_settings(settings)
{
    if (!m_registry) throw std::invalid_argument("DataEncoder requires an encoder registry");
}

void DataEncoder::CloseAfterFailure(JsonValueObjectEncoderContext& context)
{
    try
    {
        context.Close();
    }
    catch (const std::ios_base::failure& ex)
    {
        ENCODERS_LOG_WARN(std::string("Output stream could not be flushed after a failed encode: ") + ex.what());
    }
}

JsonDataEncoderBuilder::JsonDataEncoderBuilder()
{
    RegisterValueEncoder<std::chrono::system_clock::time_point>(&EncodeTimestamp);
}

JsonDataEncoderBuilder& JsonDataEncoderBuilder::ConfigureWith(const Configurator& configurator)
{
    if (!configurator) throw std::invalid_argument("Null encoder configurator");
    configurator(*this);
    return *this;
}

JsonDataEncoderBuilder& JsonDataEncoderBuilder::IgnoreNullValues(bool ignore)
{
    m_settings.ignoreNullValues = ignore;
    return *this;
}

JsonDataEncoderBuilder& JsonDataEncoderBuilder::MaxDepth(size_t depth)
{
    m_settings.maxDepth = depth;
    return *this;
}

JsonDataEncoderBuilder& JsonDataEncoderBuilder::ApplySettings(const EncoderSettings& settings)
{
    m_settings = settings;
    EncodersLogging::SetLevel(settings.logLevel);
    return *this;
}

DataEncoder JsonDataEncoderBuilder::Build() const
{
    ENCODERS_LOG_DEBUG("Building JSON data encoder with " + std::to_string(m_registry.ObjectEncoderCount()) +
        " object encoders and " + std::to_string(m_registry.ValueEncoderCount()) + " value encoders");
    return DataEncoder(std::make_shared<const EncoderRegistry>(m_registry), m_settings);
}

}
