// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>

#include <stdexcept>

#include <nlohmann/json.hpp>

#include <beacon/delivery/delivery_error.hpp>

#include "mock_http_transport.hpp"

namespace beacon {
namespace {

using ::testing::Optional;

TEST(DeliveryErrorTest, SerializationOmitsAbsentFields) {
    DeliveryError error{.message = "boom", .status_code = 500};
    nlohmann::json j = nlohmann::json::parse(serialize_delivery_error(error));

    EXPECT_EQ(j["message"], "boom");
    EXPECT_EQ(j["statusCode"], 500);
    EXPECT_FALSE(j.contains("statusDescription"));
    EXPECT_FALSE(j.contains("innerMessage"));
    EXPECT_FALSE(j.contains("rawContent"));
    EXPECT_FALSE(j.contains("requestId"));
}

TEST(DeliveryErrorTest, SerializedFormIsRestored) {
    DeliveryError error{
        .message = "Response status code does not indicate success: 403 (Forbidden).",
        .status_code = 403,
        .status_description = "Forbidden",
        .inner_message = R"({"message":"Bad credentials"})",
        .raw_response_body = R"({"message":"Bad credentials"})",
        .request_id = "abc|123",
    };
    EXPECT_EQ(deserialize_delivery_error(serialize_delivery_error(error)), error);
}

TEST(DeliveryErrorTest, NonJsonPayloadBecomesMessage) {
    DeliveryError error = deserialize_delivery_error("connection reset by peer");
    EXPECT_EQ(error.message, "connection reset by peer");
    EXPECT_FALSE(error.status_code.has_value());

    EXPECT_EQ(deserialize_delivery_error("[1,2]").message, "[1,2]");
}

TEST(TransportFailureTest, ExposesResponseFields) {
    HttpResponse response = test::make_response(
        429, "Too Many Requests", R"({"message":"slow down"})", {{"x-request-id", "req-7"}});
    TransportFailure failure = test::make_status_failure(response);

    EXPECT_THAT(failure.status_code(), Optional(429));
    EXPECT_THAT(failure.status_description(), Optional(std::string("Too Many Requests")));
    EXPECT_THAT(failure.error_details(), Optional(std::string(R"({"message":"slow down"})")));
    EXPECT_EQ(failure.read_response_body(), R"({"message":"slow down"})");
    EXPECT_THAT(failure.request_id(), Optional(std::string("req-7")));
}

TEST(TransportFailureTest, RequestIdHeaderPrecedence) {
    HttpResponse response =
        test::make_response(500, "Internal Server Error", "", {{"X-Ms-Request-Id", "ms"}, {"Request-Id", "primary"}});
    EXPECT_THAT(test::make_status_failure(response).request_id(), Optional(std::string("primary")));
}

TEST(TransportFailureTest, MissingResponse) {
    TransportFailure failure("POST https://example.invalid/v2/track failed: Connection");

    EXPECT_FALSE(failure.status_code().has_value());
    EXPECT_FALSE(failure.error_details().has_value());
    EXPECT_FALSE(failure.request_id().has_value());
    EXPECT_THROW(failure.read_response_body(), std::runtime_error);

    // Body read failure must not prevent extraction
    DeliveryError error = extract_delivery_error(failure);
    EXPECT_EQ(error.message, "POST https://example.invalid/v2/track failed: Connection");
    EXPECT_FALSE(error.raw_response_body.has_value());
}

TEST(TransportFailureTest, EmptyBodyHasNoErrorDetails) {
    TransportFailure failure = test::make_status_failure(test::make_response(503, "Service Unavailable"));
    DeliveryError error = extract_delivery_error(failure);

    EXPECT_FALSE(error.inner_message.has_value());
    EXPECT_THAT(error.raw_response_body, Optional(std::string("")));
    EXPECT_THAT(error.status_code, Optional(503));
}

TEST(TransportFailureTest, BodyIsExtractedOnce) {
    TransportFailure failure =
        test::make_status_failure(test::make_response(400, "Bad Request", R"({"message":"invalid"})"));
    DeliveryError error = extract_delivery_error(failure);

    EXPECT_THAT(error.inner_message, Optional(std::string(R"({"message":"invalid"})")));
    EXPECT_FALSE(error.raw_response_body.has_value());
}

TEST(TransportFailureTest, InvalidUtf8IsReplaced) {
    TransportFailure failure =
        test::make_status_failure(test::make_response(502, "Bad Gateway", "<html>Fehler: Gr\xFC\xDF" "e</html>"));
    DeliveryError error = extract_delivery_error(failure);

    EXPECT_THAT(error.inner_message, Optional(std::string("<html>Fehler: Gr\uFFFD\uFFFDe</html>")));

    std::string serialized;
    ASSERT_NO_THROW(serialized = serialize_delivery_error(error));
    EXPECT_EQ(deserialize_delivery_error(serialized), error);
}

TEST(DeliveryErrorTest, SerializationToleratesInvalidUtf8) {
    DeliveryError error{.message = "j\xF6rg"};
    std::string serialized;
    ASSERT_NO_THROW(serialized = serialize_delivery_error(error));
    EXPECT_EQ(deserialize_delivery_error(serialized).message, "j\uFFFDrg");
}

}  // namespace
}  // namespace beacon
