#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "session_event.h"

using json = nlohmann::json;

TEST(SessionEventTest, PartialCarriesTranscriptAndSegments) {
    SessionEvent event = SessionEvent::make(EventType::PARTIAL);
    event.text = "world";
    event.transcript = "hello world";
    event.seq = 4;
    RecognizedSegment segment;
    segment.start_ms = 1200;
    segment.end_ms = 1800;
    segment.text = "world";
    event.segments.push_back(segment);

    json j = json::parse(event.to_json());
    EXPECT_EQ(j["type"], "partial");
    EXPECT_EQ(j["text"], "world");
    EXPECT_EQ(j["is_final"], false);
    EXPECT_EQ(j["seq"], 4);
    EXPECT_EQ(j["transcript"], "hello world");
    ASSERT_EQ(j["segments"].size(), 1u);
    EXPECT_EQ(j["segments"][0]["start_ms"], 1200);
    // 置信度未知时不输出
    EXPECT_FALSE(j["segments"][0].contains("confidence"));
}

TEST(SessionEventTest, FinalIsMarkedFinal) {
    SessionEvent event = SessionEvent::make(EventType::FINAL);
    json j = json::parse(event.to_json());
    EXPECT_EQ(j["type"], "final");
    EXPECT_EQ(j["is_final"], true);
    EXPECT_TRUE(j["segments"].is_array());
}

TEST(SessionEventTest, ErrorCarriesCode) {
    json j = json::parse(SessionEvent::error(ErrorCode::BUFFER_OVERFLOW, "buffer full").to_json());
    EXPECT_EQ(j["type"], "error");
    EXPECT_EQ(j["code"], "overflow");
    EXPECT_EQ(j["message"], "buffer full");
}

TEST(SessionEventTest, ControlEventsHaveOnlyType) {
    json ended = json::parse(SessionEvent::make(EventType::SESSION_ENDED).to_json());
    EXPECT_EQ(ended.size(), 1u);
    EXPECT_EQ(ended["type"], "session_ended");

    json pong = json::parse(SessionEvent::make(EventType::PONG).to_json());
    EXPECT_EQ(pong["type"], "pong");
}

TEST(SessionEventTest, ErrorCodeNames) {
    EXPECT_STREQ(to_string(ErrorCode::FORMAT_ERROR), "format_error");
    EXPECT_STREQ(to_string(ErrorCode::RECOGNIZER_ERROR), "recognizer_error");
    EXPECT_STREQ(to_string(ErrorCode::PROTOCOL_ERROR), "protocol_error");
}
