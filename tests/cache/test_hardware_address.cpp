/*
 * test_hardware_address.cpp - Tests for HardwareAddress parsing
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "cache/hardware_address.hpp"
#include "core/exception.hpp"

#include <sstream>
#include <unordered_set>

using beacon::cache::HardwareAddress;

class HardwareAddressTest : public ::testing::Test {};

// ============================================================================
// Parsing Tests
// ============================================================================

TEST_F(HardwareAddressTest, ParsesColonSeparated) {
    auto address = HardwareAddress::parse("aa:bb:cc:dd:ee:ff");
    HardwareAddress::Bytes expected{0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};
    EXPECT_EQ(address.bytes(), expected);
}

TEST_F(HardwareAddressTest, ParsesDashSeparatedUpperCase) {
    auto address = HardwareAddress::parse("AA-BB-CC-DD-EE-01");
    EXPECT_EQ(address.toString(), "aa:bb:cc:dd:ee:01");
}

TEST_F(HardwareAddressTest, CaseInsensitiveKeysAreEqual) {
    EXPECT_EQ(HardwareAddress::parse("AA:BB:CC:DD:EE:01"),
              HardwareAddress::parse("aa:bb:cc:dd:ee:01"));
    EXPECT_EQ(HardwareAddress::parse("aa-bb-cc-dd-ee-01"),
              HardwareAddress::parse("aa:bb:cc:dd:ee:01"));
}

TEST_F(HardwareAddressTest, RejectsNonHexDigits) {
    EXPECT_THROW(HardwareAddress::parse("zz:zz:zz:zz:zz:zz"),
                 beacon::ValidationError);
}

TEST_F(HardwareAddressTest, RejectsWrongLength) {
    EXPECT_THROW(HardwareAddress::parse("aa:bb:cc"), beacon::ValidationError);
    EXPECT_THROW(HardwareAddress::parse(""), beacon::ValidationError);
    EXPECT_THROW(HardwareAddress::parse("aa:bb:cc:dd:ee:ff:00"),
                 beacon::ValidationError);
}

TEST_F(HardwareAddressTest, RejectsMixedSeparators) {
    EXPECT_THROW(HardwareAddress::parse("aa:bb-cc:dd:ee:ff"),
                 beacon::MalformedAddressError);
}

TEST_F(HardwareAddressTest, RejectsMissingSeparators) {
    EXPECT_THROW(HardwareAddress::parse("aabbccddeeff00000"),
                 beacon::MalformedAddressError);
}

TEST_F(HardwareAddressTest, TryParseDoesNotThrow) {
    HardwareAddress out;
    EXPECT_FALSE(HardwareAddress::tryParse("not-a-mac", out));
    EXPECT_TRUE(HardwareAddress::tryParse("01:02:03:04:05:06", out));
    EXPECT_EQ(out.toUint64(), 0x010203040506ULL);
}

// ============================================================================
// Formatting and Hashing Tests
// ============================================================================

TEST_F(HardwareAddressTest, StreamsCanonicalForm) {
    std::ostringstream os;
    os << HardwareAddress::parse("0A-0B-0C-0D-0E-0F");
    EXPECT_EQ(os.str(), "0a:0b:0c:0d:0e:0f");
}

TEST_F(HardwareAddressTest, UsableAsHashKey) {
    std::unordered_set<HardwareAddress> keys;
    keys.insert(HardwareAddress::parse("aa:bb:cc:dd:ee:01"));
    keys.insert(HardwareAddress::parse("AA:BB:CC:DD:EE:01"));
    keys.insert(HardwareAddress::parse("aa:bb:cc:dd:ee:02"));
    EXPECT_EQ(keys.size(), 2u);
}
