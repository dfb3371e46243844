#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "Encoding/EncoderRegistry.hpp"
#include "Encoding/EnumNames.hpp"

using namespace Encoders;

namespace {

struct Banner
{
    std::string title;
};

enum class Trigger { AppLaunch, OnForeground, Unknown };
enum class Placement { Top, Bottom };

}

ENCODERS_REGISTER_ENUM(Trigger, Trigger::AppLaunch, Trigger::OnForeground);

TEST(EncoderRegistryTest, EmptyRegistryFindsNothing)
{
    EncoderRegistry registry;
    EXPECT_EQ(registry.FindObjectEncoder(typeid(Banner)), nullptr);
    EXPECT_EQ(registry.FindValueEncoder(typeid(Banner)), nullptr);
    EXPECT_EQ(registry.ObjectEncoderCount(), 0u);
    EXPECT_EQ(registry.ValueEncoderCount(), 0u);
}

TEST(EncoderRegistryTest, RegistersAndRemovesEncoders)
{
    EncoderRegistry registry;
    registry.RegisterObjectEncoder<Banner>([](const Banner& b, ObjectEncoderContext& ctx) {
        ctx.Add("title", b.title);
    });
    registry.RegisterValueEncoder<Banner>([](const Banner& b, ValueEncoderContext& ctx) {
        ctx.Add(b.title);
    });

    EXPECT_NE(registry.FindObjectEncoder(typeid(Banner)), nullptr);
    EXPECT_NE(registry.FindValueEncoder(typeid(Banner)), nullptr);

    EXPECT_TRUE(registry.RemoveObjectEncoder<Banner>());
    EXPECT_FALSE(registry.RemoveObjectEncoder<Banner>());
    EXPECT_EQ(registry.FindObjectEncoder(typeid(Banner)), nullptr);
    EXPECT_EQ(registry.ValueEncoderCount(), 1u);
}

TEST(EncoderRegistryTest, ErasedEncoderReceivesTypedObject)
{
    EncoderRegistry registry;
    registry.RegisterValueEncoder<Banner>([](const Banner& b, ValueEncoderContext& ctx) {
        ctx.Add("banner:" + b.title);
    });

    Banner banner{ "Sale" };
    std::ostringstream out;
    JsonValueObjectEncoderContext context(out, registry);

    const EncoderRegistry::Encoder* encoder = registry.FindValueEncoder(typeid(Banner));
    ASSERT_NE(encoder, nullptr);
    (*encoder)(&banner, context);
    context.Close();

    EXPECT_EQ(out.str(), "\"banner:Sale\"");
}

TEST(EncoderRegistryTest, NullEncoderIsRejected)
{
    EncoderRegistry registry;
    EXPECT_THROW(registry.RegisterObjectEncoder<Banner>(ObjectEncoder<Banner>()), std::invalid_argument);
    EXPECT_THROW(registry.RegisterValueEncoder<Banner>(ValueEncoder<Banner>()), std::invalid_argument);
}

TEST(EnumNamesTest, MacroRecordsUnqualifiedNames)
{
    std::string name;
    ASSERT_TRUE(EnumNames::Find(Trigger::OnForeground, name));
    EXPECT_EQ(name, "OnForeground");
    EXPECT_TRUE(EnumNames::IsRegistered(typeid(Trigger)));

    // only the listed enumerators are named
    EXPECT_FALSE(EnumNames::Find(Trigger::Unknown, name));
}

TEST(EnumNamesTest, ExplicitRegistration)
{
    EXPECT_FALSE(EnumNames::IsRegistered(typeid(Placement)));
    EXPECT_TRUE(EnumNames::Register<Placement>({ { Placement::Top, "TOP" }, { Placement::Bottom, "BOTTOM" } }));

    std::string name;
    ASSERT_TRUE(EnumNames::Find(Placement::Bottom, name));
    EXPECT_EQ(name, "BOTTOM");
}

TEST(EnumNamesTest, MismatchedNameListIsRejected)
{
    EXPECT_FALSE(EnumNames::RegisterList<Placement>("Top", { Placement::Top, Placement::Bottom }));
}
