#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <map>
#include <optional>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

#include "Logging.hpp"
#include "Encoding/JsonDataEncoder.hpp"
#include "Encoding/Timestamp.hpp"

using namespace Encoders;
using ::testing::HasSubstr;

namespace {

enum class CampaignState { Draft, Running, Finished };

struct ClientInfo
{
    std::string appId;
    std::string platformVersion;
};

struct Campaign
{
    std::string id;
    int priority = 0;
    CampaignState state = CampaignState::Draft;
    std::vector<std::string> triggers;
    std::map<std::string, std::string> data;
    std::optional<std::chrono::system_clock::time_point> expires;
    std::vector<std::uint8_t> payload;
};

struct FetchRequest
{
    std::string projectNumber;
    ClientInfo client;
    std::vector<Campaign> alreadySeen;
};

std::chrono::system_clock::time_point MakeTime(int y, unsigned m, unsigned d, int hh, int mm, int ss, int ms)
{
    using namespace std::chrono;
    return sys_days{ year{ y } / m / d } + hours{ hh } + minutes{ mm } + seconds{ ss } + milliseconds{ ms };
}

void RegisterFetchEncoders(JsonDataEncoderBuilder& builder)
{
    builder.RegisterObjectEncoder<ClientInfo>([](const ClientInfo& c, ObjectEncoderContext& ctx) {
        ctx.Add("appId", c.appId).Add("platformVersion", c.platformVersion);
    });
    builder.RegisterObjectEncoder<Campaign>([](const Campaign& c, ObjectEncoderContext& ctx) {
        ctx.Add("id", c.id)
            .Add("priority", c.priority)
            .Add("state", c.state)
            .Add("triggers", c.triggers)
            .Add("data", c.data)
            .Add("expires", c.expires)
            .Add("payload", c.payload);
    });
    builder.RegisterObjectEncoder<FetchRequest>([](const FetchRequest& r, ObjectEncoderContext& ctx) {
        ctx.Add("projectNumber", r.projectNumber)
            .Add("client", r.client)
            .Add("alreadySeen", r.alreadySeen);
    });
}

}

ENCODERS_REGISTER_ENUM(CampaignState, CampaignState::Draft, CampaignState::Running, CampaignState::Finished);

TEST(TimestampTest, FormatsUtcWithMilliseconds)
{
    EXPECT_EQ(FormatTimestamp(MakeTime(2019, 3, 14, 9, 26, 53, 589)), "2019-03-14T09:26:53.589Z");
    EXPECT_EQ(FormatTimestamp(std::chrono::system_clock::time_point{}), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(FormatTimestamp(std::chrono::system_clock::time_point{} - std::chrono::milliseconds{ 1 }), "1969-12-31T23:59:59.999Z");
}

TEST(TimestampTest, YearsWithoutFourDigitsFail)
{
    using namespace std::chrono;

    EXPECT_EQ(FormatTimestamp(sys_time<milliseconds>{ sys_days{ year{ 0 } / 1 / 1 } }), "0000-01-01T00:00:00.000Z");
    EXPECT_EQ(FormatTimestamp(sys_time<milliseconds>{ sys_days{ year{ 9999 } / 12 / 31 } } + hours{ 23 } + minutes{ 59 } + seconds{ 59 } + milliseconds{ 999 }),
        "9999-12-31T23:59:59.999Z");

    EXPECT_THROW(FormatTimestamp(sys_time<milliseconds>{ sys_days{ year{ 10000 } / 1 / 1 } }), EncodingException);
    EXPECT_THROW(FormatTimestamp(sys_time<milliseconds>{ sys_days{ year{ -1 } / 12 / 31 } }), EncodingException);
}

TEST(JsonDataEncoderTest, EncodesObjectGraph)
{
    JsonDataEncoderBuilder builder;
    builder.ConfigureWith(&RegisterFetchEncoders);
    DataEncoder encoder = builder.Build();

    Campaign campaign;
    campaign.id = "c-42";
    campaign.priority = 3;
    campaign.state = CampaignState::Running;
    campaign.triggers = { "app_launch", "on_foreground" };
    campaign.data = { { "color", "blue" } };
    campaign.expires = MakeTime(2020, 1, 2, 3, 4, 5, 6);
    campaign.payload = { 'h', 'i' };

    FetchRequest request{ "1234", { "app", "29" }, { campaign } };

    EXPECT_EQ(encoder.Encode(request),
        R"({"projectNumber":"1234","client":{"appId":"app","platformVersion":"29"},)"
        R"("alreadySeen":[{"id":"c-42","priority":3,"state":"Running","triggers":["app_launch","on_foreground"],)"
        R"("data":{"color":"blue"},"expires":"2020-01-02T03:04:05.006Z","payload":"aGk="}]})");
}

TEST(JsonDataEncoderTest, EncodesToStream)
{
    DataEncoder encoder = JsonDataEncoderBuilder().Build();

    std::ostringstream out;
    encoder.Encode(std::vector<int>{ 1, 2 }, out);
    EXPECT_EQ(out.str(), "[1,2]");
}

TEST(JsonDataEncoderTest, IgnoreNullValuesDropsEmptyFields)
{
    JsonDataEncoderBuilder builder;
    builder.ConfigureWith(&RegisterFetchEncoders).IgnoreNullValues(true);

    Campaign campaign;
    campaign.id = "c-1";
    std::string json = builder.Build().Encode(campaign);
    EXPECT_EQ(json.find("expires"), std::string::npos);

    builder.IgnoreNullValues(false);
    json = builder.Build().Encode(campaign);
    EXPECT_THAT(json, HasSubstr(R"("expires":null)"));
}

TEST(JsonDataEncoderTest, RegisteringOneKindReplacesTheOther)
{
    JsonDataEncoderBuilder builder;
    builder.RegisterObjectEncoder<ClientInfo>([](const ClientInfo& c, ObjectEncoderContext& ctx) {
        ctx.Add("appId", c.appId);
    });
    builder.RegisterValueEncoder<ClientInfo>([](const ClientInfo& c, ValueEncoderContext& ctx) {
        ctx.Add(c.appId + "/" + c.platformVersion);
    });
    EXPECT_EQ(builder.Build().Encode(ClientInfo{ "app", "29" }), "\"app/29\"");

    builder.RegisterObjectEncoder<ClientInfo>([](const ClientInfo& c, ObjectEncoderContext& ctx) {
        ctx.Add("appId", c.appId);
    });
    EXPECT_EQ(builder.Build().Encode(ClientInfo{ "app", "29" }), R"({"appId":"app"})");
}

TEST(JsonDataEncoderTest, BuiltEncoderIsASnapshot)
{
    JsonDataEncoderBuilder builder;
    DataEncoder before = builder.Build();

    builder.RegisterValueEncoder<ClientInfo>([](const ClientInfo& c, ValueEncoderContext& ctx) {
        ctx.Add(c.appId);
    });

    EXPECT_THROW(before.Encode(ClientInfo{ "app", "29" }), EncodingException);
    EXPECT_EQ(builder.Build().Encode(ClientInfo{ "app", "29" }), "\"app\"");
}

TEST(JsonDataEncoderTest, DefaultTimestampEncoderCanBeReplaced)
{
    auto when = MakeTime(2021, 6, 1, 0, 0, 0, 0);

    JsonDataEncoderBuilder builder;
    EXPECT_EQ(builder.Build().Encode(when), "\"2021-06-01T00:00:00.000Z\"");

    builder.RegisterValueEncoder<std::chrono::system_clock::time_point>(
        [](const std::chrono::system_clock::time_point& t, ValueEncoderContext& ctx) {
            ctx.Add(static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count()));
        });
    EXPECT_EQ(builder.Build().Encode(when), "1622505600");
}

TEST(JsonDataEncoderTest, FailureIsLoggedAndRethrown)
{
    ASSERT_TRUE(EncodersLogging::Initialize());
    EncodersLogging::SetLevel(EncodersLogging::LogLevel::Trace);
    EncodersLogging::GetLogQueue().Clear();

    DataEncoder encoder = JsonDataEncoderBuilder().Build();

    std::ostringstream out;
    EXPECT_THROW(encoder.Encode(std::vector<ClientInfo>{ { "app", "29" } }, out), EncodingException);
    EXPECT_EQ(out.str(), "[");

    bool found = false;
    EncodersLogging::LogMessage message;
    while (EncodersLogging::GetLogQueue().TryPop(message))
    {
        if (message.level == EncodersLogging::LogLevel::Error && message.text.find("Failed to encode") != std::string::npos)
        {
            EXPECT_THAT(message.text, HasSubstr("ClientInfo"));
            found = true;
        }
    }
    EXPECT_TRUE(found);

    EncodersLogging::Shutdown();
}

TEST(JsonDataEncoderTest, StreamFailureIsLoggedAndRethrown)
{
    struct FailingBuffer : std::streambuf
    {
        int overflow(int) override { return traits_type::eof(); }
    };

    ASSERT_TRUE(EncodersLogging::Initialize());
    EncodersLogging::GetLogQueue().Clear();

    DataEncoder encoder = JsonDataEncoderBuilder().Build();

    FailingBuffer buffer;
    std::ostream out(&buffer);
    EXPECT_THROW(encoder.Encode(std::vector<int>{ 1, 2 }, out), std::ios_base::failure);

    bool found = false;
    EncodersLogging::LogMessage message;
    while (EncodersLogging::GetLogQueue().TryPop(message))
    {
        if (message.level == EncodersLogging::LogLevel::Error && message.text.find("Failed to write") != std::string::npos)
            found = true;
    }
    EXPECT_TRUE(found);

    EncodersLogging::Shutdown();
}

TEST(JsonDataEncoderTest, MaxDepthFromBuilder)
{
    DataEncoder encoder = JsonDataEncoderBuilder().MaxDepth(1).Build();
    EXPECT_EQ(encoder.Encode(std::vector<int>{ 1 }), "[1]");
    EXPECT_THROW(encoder.Encode(std::vector<std::vector<int>>{ { 1 } }), EncodingException);
}
