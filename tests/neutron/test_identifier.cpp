// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "neutron/identifier.h"
#include "neutron/logging.h"

using neutron::ClassifyIdentifier;
using neutron::ConvertIdentifierToKey;
using neutron::ConvertKeystoneIdToKey;
using neutron::ConvertUuidToKey;
using neutron::IdentifierShape;
using neutron::IsValidIdentifier;

namespace {

constexpr char kUuid[] = "2fac9cb4-0b4f-4b94-9c84-3ef8eaf4b2c5";
constexpr char kKeystoneId[] = "2fac9cb40b4f4b949c843ef8eaf4b2c5";
constexpr char kKey[] = "2fac9cb40b4fb949c843ef8eaf4b2c5";

bool IsHex(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace

class IdentifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
        auto logger = std::make_shared<spdlog::logger>("identifier_test", sink_);
        logger->set_level(spdlog::level::trace);
        logger->set_pattern("[%l] %v");
        neutron::SetLogger(logger);
    }

    void TearDown() override {
        neutron::SetLogger(nullptr);
    }

    bool Logged(std::string_view needle) const {
        for (const auto& line : sink_->last_formatted()) {
            if (line.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

TEST_F(IdentifierTest, CanonicalUuidIsValid) {
    EXPECT_TRUE(IsValidIdentifier(kUuid));
    EXPECT_TRUE(IsValidIdentifier("123e4567-e89b-12d3-a456-426614174000"));
    EXPECT_TRUE(IsValidIdentifier("00000000-0000-0000-0000-000000000000"));
    EXPECT_TRUE(IsValidIdentifier("FFFFFFFF-FFFF-FFFF-FFFF-FFFFFFFFFFFF"));
    EXPECT_TRUE(IsValidIdentifier("2FAC9CB4-0b4f-4B94-9c84-3EF8eaf4b2c5"));
}

TEST_F(IdentifierTest, MisplacedHyphenIsInvalid) {
    EXPECT_FALSE(IsValidIdentifier("2fac9cb40-b4f-4b94-9c84-3ef8eaf4b2c5"));
    EXPECT_FALSE(IsValidIdentifier("2fac9cb4-0b4f4-b94-9c84-3ef8eaf4b2c5"));
    EXPECT_FALSE(IsValidIdentifier("2fac9cb4-0b4f-4b94-9c843-ef8eaf4b2c5"));
    EXPECT_FALSE(IsValidIdentifier("2fac9cb4-0b4f-4b94-9c84-3ef8eaf4b2c-"));
}

TEST_F(IdentifierTest, NonHexUuidIsInvalid) {
    EXPECT_FALSE(IsValidIdentifier("2fac9cb4-0b4f-4b94-9c84-3ef8eaf4b2cg"));
    EXPECT_FALSE(IsValidIdentifier("zfac9cb4-0b4f-4b94-9c84-3ef8eaf4b2c5"));
    EXPECT_TRUE(Logged("[error] Invalid UUID - zfac9cb4-0b4f-4b94-9c84-3ef8eaf4b2c5"));
}

TEST_F(IdentifierTest, ThirtySixCharactersWithoutHyphensIsInvalid) {
    EXPECT_FALSE(IsValidIdentifier("2fac9cb40b4f4b949c843ef8eaf4b2c5abcd"));
}

TEST_F(IdentifierTest, AnyStringUpToThirtyTwoCharactersIsValid) {
    for (size_t len = 1; len <= neutron::kKeystoneIdLen; ++len) {
        EXPECT_TRUE(IsValidIdentifier(std::string(len, '#'))) << "length " << len;
    }
    EXPECT_TRUE(IsValidIdentifier("not a uuid at all"));
    EXPECT_TRUE(IsValidIdentifier("-"));
}

TEST_F(IdentifierTest, OtherLengthsAreInvalid) {
    EXPECT_FALSE(IsValidIdentifier(std::nullopt));
    EXPECT_FALSE(IsValidIdentifier(""));
    for (size_t len : {33, 34, 35, 37, 40, 64}) {
        EXPECT_FALSE(IsValidIdentifier(std::string(len, 'a'))) << "length " << len;
    }
}

TEST_F(IdentifierTest, ValidatorTracesIdAndLength) {
    IsValidIdentifier("tenant");
    EXPECT_TRUE(Logged("[trace] id - tenant, length - 6"));
}

TEST_F(IdentifierTest, ClassifiesByShape) {
    EXPECT_EQ(ClassifyIdentifier(kUuid), IdentifierShape::kUuid);
    EXPECT_EQ(ClassifyIdentifier(kKeystoneId), IdentifierShape::kKeystone);
    EXPECT_EQ(ClassifyIdentifier("net-1"), IdentifierShape::kShort);
    EXPECT_EQ(ClassifyIdentifier(std::string(31, 'k')), IdentifierShape::kShort);
    EXPECT_EQ(ClassifyIdentifier(std::nullopt), IdentifierShape::kInvalid);
    EXPECT_EQ(ClassifyIdentifier(""), IdentifierShape::kInvalid);
    EXPECT_EQ(ClassifyIdentifier(std::string(40, 'a')), IdentifierShape::kInvalid);
    EXPECT_EQ(neutron::IdentifierShapeName(IdentifierShape::kKeystone), "keystone");
}

TEST_F(IdentifierTest, UuidKeyDropsHyphensAndVersionDigit) {
    auto key = ConvertUuidToKey(kUuid);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, kKey);
}

TEST_F(IdentifierTest, UuidKeyKeepsCase) {
    auto key = ConvertIdentifierToKey("2FAC9CB4-0B4F-4B94-9C84-3EF8EAF4B2C5");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, "2FAC9CB40B4FB949C843EF8EAF4B2C5");
}

TEST_F(IdentifierTest, UuidKeysAreThirtyOneHexCharacters) {
    const char* uuids[] = {
        "123e4567-e89b-12d3-a456-426614174000",
        "00000000-0000-0000-0000-000000000000",
        "ffffffff-ffff-ffff-ffff-ffffffffffff",
        "f47ac10b-58cc-4372-a567-0e02b2c3d479",
        "6ba7b810-9dad-11d1-80b4-00c04fd430c8",
    };
    for (const char* uuid : uuids) {
        auto key = ConvertIdentifierToKey(uuid);
        ASSERT_TRUE(key.has_value()) << uuid;
        EXPECT_EQ(key->size(), 31u) << uuid;
        EXPECT_TRUE(IsHex(*key)) << *key;
    }
}

TEST_F(IdentifierTest, ShortUuidStringHasNoKey) {
    EXPECT_FALSE(ConvertUuidToKey("abc-def").has_value());
}

TEST_F(IdentifierTest, KeystoneIdConvertsLikeItsUuid) {
    auto key = ConvertKeystoneIdToKey(kKeystoneId);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, kKey);
    EXPECT_EQ(ConvertIdentifierToKey(kKeystoneId), ConvertIdentifierToKey(kUuid));
}

TEST_F(IdentifierTest, NonUuidKeystoneIdIsValidButHasNoKey) {
    constexpr char kTenant[] = "tenant-not-hex-but-32-characters";
    EXPECT_TRUE(IsValidIdentifier(kTenant));
    EXPECT_FALSE(ConvertIdentifierToKey(kTenant).has_value());
    EXPECT_TRUE(Logged("[error] Invalid object ID - tenant-not-hex-but-32-characters"));

    constexpr char kAlmostHex[] = "2fac9cb40b4f4b949c843ef8eaf4b2cz";
    EXPECT_TRUE(IsValidIdentifier(kAlmostHex));
    EXPECT_FALSE(ConvertIdentifierToKey(kAlmostHex).has_value());
}

TEST_F(IdentifierTest, TooShortKeystoneIdHasNoKey) {
    EXPECT_FALSE(ConvertKeystoneIdToKey("2fac9cb40b4f4b949c843ef8eaf4b2c").has_value());
    EXPECT_TRUE(Logged("[error] Invalid UUID - 2fac9cb40b4f4b949c843ef8eaf4b2c"));
}

TEST_F(IdentifierTest, ShortIdentifierIsItsOwnKey) {
    EXPECT_EQ(ConvertIdentifierToKey("abcdefghij"), "abcdefghij");
    EXPECT_EQ(ConvertIdentifierToKey("x"), "x");
    const std::string thirty_one(31, 'n');
    EXPECT_EQ(ConvertIdentifierToKey(thirty_one), thirty_one);
}

TEST_F(IdentifierTest, InvalidIdentifierHasNoKey) {
    EXPECT_FALSE(ConvertIdentifierToKey(std::nullopt).has_value());
    EXPECT_FALSE(ConvertIdentifierToKey("").has_value());
    EXPECT_FALSE(ConvertIdentifierToKey(std::string(40, 'a')).has_value());
    EXPECT_FALSE(ConvertIdentifierToKey("2fac9cb40-b4f-4b94-9c84-3ef8eaf4b2c5").has_value());
}

TEST_F(IdentifierTest, ConversionLeavesInputUntouched) {
    const std::string id = kUuid;
    auto key = ConvertIdentifierToKey(id);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(id, kUuid);
}
