// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include <beacon/event/event_builder.hpp>
#include <beacon/pii/pii_redactor.hpp>

#include "mock_http_transport.hpp"

namespace beacon {
namespace {

using ::testing::Contains;
using ::testing::Each;
using ::testing::Key;
using ::testing::MatchesRegex;
using ::testing::Not;
using ::testing::Pair;

class EventBuilderTest : public ::testing::Test {
protected:
    std::shared_ptr<TelemetryConfig> config_ = test::make_test_config();
    std::shared_ptr<PiiRedactor> redactor_ = std::make_shared<PiiRedactor>(config_);
    EventBuilder builder_{config_, redactor_};
};

TEST_F(EventBuilderTest, BaseEventEnvelope) {
    TelemetryEvent event = builder_.base_event();

    EXPECT_EQ(event.name, "Microsoft.ApplicationInsights.Event");
    EXPECT_EQ(event.instrumentation_key, "00000000-1111-2222-3333-444444444444");
    EXPECT_THAT(event.timestamp, MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}\\.[0-9]{7}Z"));
    EXPECT_EQ(event.base_type, EventBaseType::EventData);
    EXPECT_EQ(event.base_data.ver, 2);

    EXPECT_THAT(event.tags, Contains(Pair("ai.internal.sdkVersion", "2.0.1.33027")));
    EXPECT_THAT(event.tags, Contains(Key("ai.application.ver")));
    EXPECT_THAT(
        event.tags.at("ai.session.id"),
        MatchesRegex("[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}"));

    std::string hashed_user = redactor_->redact(current_username());
    EXPECT_EQ(event.tags.at("ai.user.id"), hashed_user);
    EXPECT_THAT(event.base_data.properties, Contains(Pair("Username", hashed_user)));
    EXPECT_THAT(event.base_data.properties, Contains(Key("DayOfWeek")));
}

TEST_F(EventBuilderTest, BaseEventsAreIndependentCopies) {
    TelemetryEvent first = builder_.base_event();
    TelemetryEvent second = builder_.base_event();
    EXPECT_EQ(first, second);

    first.base_data.properties["Mutated"] = "yes";
    first.tags["ai.session.id"] = "changed";
    TelemetryEvent third = builder_.base_event();
    EXPECT_EQ(third, second);
    EXPECT_THAT(third.base_data.properties, Not(Contains(Key("Mutated"))));
}

TEST_F(EventBuilderTest, ConcurrentFirstCallsShareOneIdentity) {
    constexpr size_t kThreads = 16;
    EventBuilder fresh(config_, redactor_);
    std::vector<std::string> session_ids(kThreads);
    std::vector<std::string> timestamps(kThreads);

    std::vector<std::thread> threads;
    for (size_t i = 0; i < kThreads; i++) {
        threads.emplace_back([&, i]() {
            TelemetryEvent event = fresh.base_event();
            session_ids[i] = event.tags.at("ai.session.id");
            timestamps[i] = event.timestamp;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_THAT(session_ids, Each(session_ids.front()));
    EXPECT_THAT(timestamps, Each(timestamps.front()));
    EXPECT_EQ(fresh.base_event().tags.at("ai.session.id"), session_ids.front());
}

TEST_F(EventBuilderTest, SessionIsFixedPerBuilder) {
    EventBuilder other(config_, redactor_);
    EXPECT_EQ(
        builder_.base_event().tags.at("ai.session.id"), builder_.custom_event("X").tags.at("ai.session.id"));
    EXPECT_NE(builder_.base_event().tags.at("ai.session.id"), other.base_event().tags.at("ai.session.id"));
}

TEST_F(EventBuilderTest, CustomEventWithoutMetrics) {
    TelemetryEvent event = builder_.custom_event("X", {{"A", "B"}}, {});

    EXPECT_EQ(event.base_data.name, "X");
    EXPECT_EQ(event.base_data.properties.at("A"), "B");
    EXPECT_FALSE(event.base_data.measurements.has_value());

    nlohmann::json j = event;
    EXPECT_FALSE(j["data"]["baseData"].contains("measurements"));
    EXPECT_FALSE(j["data"]["baseData"].contains("exceptions"));
    EXPECT_EQ(j["data"]["baseType"], "EventData");
}

TEST_F(EventBuilderTest, CustomEventWithMetrics) {
    TelemetryEvent event = builder_.custom_event("X", {}, {{"M", 1.5}});

    ASSERT_TRUE(event.base_data.measurements.has_value());
    EXPECT_DOUBLE_EQ(event.base_data.measurements->at("M"), 1.5);

    nlohmann::json j = event;
    EXPECT_DOUBLE_EQ(j["data"]["baseData"]["measurements"]["M"].get<double>(), 1.5);
}

TEST_F(EventBuilderTest, CallerPropertiesOverwriteDefaults) {
    TelemetryEvent event = builder_.custom_event("X", {{"DayOfWeek", "Caturday"}});
    EXPECT_EQ(event.base_data.properties.at("DayOfWeek"), "Caturday");
    EXPECT_NE(builder_.base_event().base_data.properties.at("DayOfWeek"), "Caturday");
}

TEST_F(EventBuilderTest, ExceptionEvent) {
    ExceptionInfo info{
        .type_name = "std::runtime_error", .message = "disk full", .hresult = 28, .stack = "frame0\nframe1"};
    TelemetryEvent event = builder_.exception_event(info, "IO", {{"Module", "storage"}});

    EXPECT_EQ(event.base_type, EventBaseType::ExceptionData);
    EXPECT_EQ(event.base_data.handled_at, "UserCode");
    EXPECT_FALSE(event.base_data.name.has_value());
    EXPECT_EQ(event.base_data.properties.at("ErrorBucket"), "IO");
    EXPECT_EQ(event.base_data.properties.at("Message"), "disk full");
    EXPECT_EQ(event.base_data.properties.at("HResult"), "0x0000001C");
    EXPECT_EQ(event.base_data.properties.at("Module"), "storage");

    ASSERT_EQ(event.base_data.exceptions.size(), 1u);
    const ExceptionRecord& record = event.base_data.exceptions.front();
    EXPECT_EQ(record.id, 0);
    EXPECT_EQ(record.outer_id, 0);
    EXPECT_EQ(record.type_name, "std::runtime_error");
    EXPECT_TRUE(record.has_full_stack);

    nlohmann::json j = event;
    EXPECT_EQ(j["data"]["baseType"], "ExceptionData");
    EXPECT_EQ(j["data"]["baseData"]["handledAt"], "UserCode");
    EXPECT_EQ(j["data"]["baseData"]["exceptions"][0]["typeName"], "std::runtime_error");
    EXPECT_EQ(j.get<TelemetryEvent>(), event);
}

TEST_F(EventBuilderTest, BlankErrorBucketIsOmitted) {
    TelemetryEvent event = builder_.exception_event(ExceptionInfo{.type_name = "E", .message = "m"}, "  ");
    EXPECT_THAT(event.base_data.properties, Not(Contains(Key("ErrorBucket"))));
    EXPECT_EQ(event.base_data.properties.at("HResult"), "0x80131500");
    EXPECT_FALSE(event.base_data.exceptions.front().has_full_stack);
}

TEST_F(EventBuilderTest, MissingKeyFailsAndIsRetried) {
    config_->set(ConfigKey::ApplicationInsightsKey, "");
    EXPECT_THROW(builder_.base_event(), std::runtime_error);

    config_->set(ConfigKey::ApplicationInsightsKey, "late-key");
    EXPECT_EQ(builder_.base_event().instrumentation_key, "late-key");
}

TEST(ExceptionInfoTest, FromException) {
    ExceptionInfo generic = ExceptionInfo::from_exception(std::invalid_argument("bad arg"));
    EXPECT_EQ(generic.type_name, "std::invalid_argument");
    EXPECT_EQ(generic.message, "bad arg");
    EXPECT_EQ(generic.hresult, kGenericExceptionHResult);

    ExceptionInfo system = ExceptionInfo::from_exception(
        std::system_error(std::make_error_code(std::errc::permission_denied), "open"));
    EXPECT_EQ(system.hresult, static_cast<int>(std::errc::permission_denied));

    ExceptionInfo unknown = ExceptionInfo::from_exception_ptr(std::make_exception_ptr(42));
    EXPECT_EQ(unknown.type_name, "<unknown>");
}

TEST(TimestampTest, FormatsUtcWithTicks) {
    // 2021-01-01T00:00:00Z was a Friday
    auto time = std::chrono::system_clock::time_point(std::chrono::seconds(1609459200)) +
                std::chrono::microseconds(123456);
    EXPECT_EQ(format_utc_timestamp(time), "2021-01-01T00:00:00.1234560Z");
    EXPECT_EQ(utc_day_of_week(time), "Friday");
}

}  // namespace
}  // namespace beacon
