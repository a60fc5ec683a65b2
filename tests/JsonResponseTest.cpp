#include "resilink/util/JsonResponse.hpp"

#include <gtest/gtest.h>

using namespace resilink;

TEST(JsonResponseTest, SuccessWrapsData) {
    auto envelope = util::makeEnvelope(200, boost::json::parse(R"({"pending":1})"), "/api/queue/stats");
    EXPECT_TRUE(envelope.at("success").as_bool());
    EXPECT_EQ(envelope.at("path").as_string(), "/api/queue/stats");
    EXPECT_EQ(envelope.at("data").as_object().at("pending").as_int64(), 1);
    EXPECT_FALSE(envelope.contains("error"));
}

TEST(JsonResponseTest, ErrorLiftsMessageAndKeepsDetails) {
    auto envelope = util::makeEnvelope(404, boost::json::parse(R"({"message":"gone","provider":"x"})"), "/p");
    EXPECT_FALSE(envelope.at("success").as_bool());
    const auto& error = envelope.at("error").as_object();
    EXPECT_EQ(error.at("message").as_string(), "gone");
    EXPECT_EQ(error.at("details").as_object().at("provider").as_string(), "x");
    EXPECT_FALSE(envelope.contains("data"));
}

TEST(JsonResponseTest, TimestampIsUtcWithMillis) {
    const auto epoch = std::chrono::system_clock::time_point{} + std::chrono::milliseconds(1445412470250);
    EXPECT_EQ(util::formatIsoTimestamp(epoch), "2015-10-21T07:27:50.250Z");
}
