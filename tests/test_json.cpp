#include <gtest/gtest.h>
#include <hwident/json.hpp>

namespace hwident {
namespace {

// ==================== JSON rendering ====================

TEST(JsonTest, ResultShape) {
    IdentifierResult result;
    result.identifiers[keys::SYSTEM_UUID] = "123e4567-e89b-12d3-a456-426614174000";
    result.identifiers[keys::MANUFACTURER] = "Dell Inc.";
    result.containerized = true;

    auto j = json::to_json(result);

    ASSERT_TRUE(j.contains("identifiers"));
    ASSERT_TRUE(j.contains("fallback"));
    ASSERT_TRUE(j.contains("containerized"));
    EXPECT_EQ(j["identifiers"]["system_uuid"], "123e4567-e89b-12d3-a456-426614174000");
    EXPECT_EQ(j["identifiers"]["manufacturer"], "Dell Inc.");
    EXPECT_TRUE(j["fallback"].is_object());
    EXPECT_TRUE(j["fallback"].empty());
    EXPECT_TRUE(j["containerized"].get<bool>());
}

TEST(JsonTest, EmptyMappingsRenderAsObjects) {
    auto j = json::to_json(IdentifierResult{});

    EXPECT_TRUE(j["identifiers"].is_object());
    EXPECT_EQ(j["identifiers"].dump(), "{}");
    EXPECT_FALSE(j["containerized"].get<bool>());
}

TEST(JsonTest, FallbackKeptSeparate) {
    IdentifierResult result;
    result.fallback[keys::HOSTNAME] = "build-host-01";

    auto j = json::to_json(result);

    EXPECT_FALSE(j["identifiers"].contains("hostname"));
    EXPECT_EQ(j["fallback"]["hostname"], "build-host-01");
}

TEST(JsonTest, ValuesAreEscaped) {
    Identifiers ids{{keys::PRODUCT_NAME, "Model \"X\"\\1"}};

    auto text = json::identifiers_to_json(ids).dump();
    auto parsed = nlohmann::json::parse(text);

    EXPECT_EQ(parsed["product_name"], "Model \"X\"\\1");
}

}  // namespace
}  // namespace hwident
