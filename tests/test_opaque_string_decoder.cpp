/**
 * @file test_opaque_string_decoder.cpp
 * @brief Unit tests for opaque unique string segmentation
 */

#include <gtest/gtest.h>
#include <uvci/opaque_string_decoder.h>

using namespace uvci;

TEST(OpaqueStringDecoderTest, SwedishIdentifierAndIssuance) {
    auto segments = decodeOpaqueString("V12916227TFJJ");
    EXPECT_EQ(segments.id, "V12916227");
    EXPECT_EQ(segments.issuance, "TFJJ");
    EXPECT_FALSE(segments.empty());
}

TEST(OpaqueStringDecoderTest, DigitsOnly) {
    auto segments = decodeOpaqueString("37512422923");
    EXPECT_EQ(segments.id, "37512422923");
    EXPECT_TRUE(segments.issuance.empty());
}

TEST(OpaqueStringDecoderTest, IssuanceMayContainDigits) {
    auto segments = decodeOpaqueString("V123AB45");
    EXPECT_EQ(segments.id, "V123");
    EXPECT_EQ(segments.issuance, "AB45");
}

TEST(OpaqueStringDecoderTest, NoLeadingDigitRun) {
    EXPECT_TRUE(decodeOpaqueString("ABCDEF").empty());
    EXPECT_TRUE(decodeOpaqueString("V").empty());
    EXPECT_TRUE(decodeOpaqueString("VV123").empty());
    EXPECT_TRUE(decodeOpaqueString("-123").empty());
    EXPECT_TRUE(decodeOpaqueString("").empty());
}

TEST(OpaqueStringDecoderTest, SegmentsConcatenateToInput) {
    for (const std::string opaque : {"V12916227TFJJ", "V1", "0TFJJ", "X99999999ZZZZ"}) {
        auto segments = decodeOpaqueString(opaque);
        EXPECT_EQ(segments.id + segments.issuance, opaque);
    }
}
