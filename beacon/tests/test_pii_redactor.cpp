// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>

#include <memory>
#include <string>

#include <beacon/config/telemetry_config.hpp>
#include <beacon/pii/pii_redactor.hpp>

namespace beacon {
namespace {

using ::testing::MatchesRegex;

constexpr auto kEmptySha512 =
    "CF83E1357EEFB8BDF1542850D66D8007D620E4050B5715DC83F4A921D36CE9CE"
    "47D0D13C5D85F2B0FF8318D2877EEC2F63B931BD47417A81A538327AF927DA3E";
constexpr auto kAbcSha512 =
    "DDAF35A193617ABACC417349AE20413112E6FA4E89A97EA20A9EEEE64B55D39A"
    "2192992A274FC1A836BA3C23A3FEEBBD454D4423643CE80E2A9AC94FA54CA49F";

TEST(Sha512HexTest, KnownDigests) {
    EXPECT_EQ(sha512_hex(""), kEmptySha512);
    EXPECT_EQ(sha512_hex("abc"), kAbcSha512);
}

TEST(PiiRedactorTest, HashesWhenProtectionEnabled) {
    auto config = std::make_shared<TelemetryConfig>();
    PiiRedactor redactor(config);

    std::string hashed = redactor.redact("alice");
    EXPECT_EQ(hashed.size(), 128u);
    EXPECT_THAT(hashed, MatchesRegex("[0-9A-F]+"));
    EXPECT_EQ(hashed, redactor.redact("alice"));
    EXPECT_NE(hashed, redactor.redact("bob"));
    EXPECT_EQ(redactor.redact(std::string_view("abc")), kAbcSha512);
}

TEST(PiiRedactorTest, EmptyAndNullInputsAreHashedAsEmpty) {
    PiiRedactor redactor(std::make_shared<TelemetryConfig>());
    EXPECT_EQ(redactor.redact(""), kEmptySha512);
    EXPECT_EQ(redactor.redact(static_cast<const char*>(nullptr)), kEmptySha512);
}

TEST(PiiRedactorTest, PassThroughWhenProtectionDisabled) {
    auto config = std::make_shared<TelemetryConfig>(TelemetrySettings{.disable_pii_protection = true});
    PiiRedactor redactor(config);

    EXPECT_EQ(redactor.redact("alice"), "alice");
    EXPECT_EQ(redactor.redact(""), "");
    EXPECT_EQ(redactor.redact(static_cast<const char*>(nullptr)), "");
}

TEST(PiiRedactorTest, FlagIsReadOnEveryCall) {
    auto config = std::make_shared<TelemetryConfig>();
    PiiRedactor redactor(config);

    EXPECT_EQ(redactor.redact("abc"), kAbcSha512);
    config->set(ConfigKey::DisablePiiProtection, true);
    EXPECT_EQ(redactor.redact("abc"), "abc");
}

}  // namespace
}  // namespace beacon
