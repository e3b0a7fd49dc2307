/**
 * @file test_uvci_parser.cpp
 * @brief End-to-end tests for the UvciParser facade
 */

#include <gtest/gtest.h>
#include <uvci/uvci_parser.h>
#include <string>
#include <vector>

using namespace uvci;

class UvciParserTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        auto loaded = VaccinationStatisticsTable::loadFromCsv(
            std::string(UVCI_TEST_DATA_DIR) + "/se_vaccination_weekly.csv");
        ASSERT_TRUE(loaded.has_value());
        table_ = std::make_shared<const VaccinationStatisticsTable>(std::move(*loaded));
    }

    static void TearDownTestSuite() {
        table_.reset();
    }

    UvciRecord parseOk(const UvciParser& parser, const std::string& raw) {
        auto result = parser.parse(raw);
        EXPECT_TRUE(result.ok()) << raw << ": " << result.message;
        EXPECT_EQ(result.error, ParseError::NONE);
        return result.record.value_or(UvciRecord{});
    }

    static std::shared_ptr<const VaccinationStatisticsTable> table_;
};

std::shared_ptr<const VaccinationStatisticsTable> UvciParserTest::table_;

// ============================================================================
// Schema options
// ============================================================================

TEST_F(UvciParserTest, OpaqueSwedishCertificate) {
    UvciParser parser(table_);
    auto record = parseOk(parser, "URN:UVCI:01:SE:EHM/V12916227TFJJ#Q");

    EXPECT_EQ(record.version, 1u);
    EXPECT_EQ(record.country, "SE");
    EXPECT_EQ(record.schemaOptionNumber(), 3);
    EXPECT_EQ(record.schemaOptionDesc(), "opaque unique string");
    EXPECT_EQ(record.issuingEntity, "EHM");
    EXPECT_TRUE(record.vaccineId.empty());
    EXPECT_EQ(record.opaqueUniqueString, "V12916227TFJJ");
    EXPECT_EQ(record.opaqueId, "V12916227");
    EXPECT_EQ(record.opaqueIssuance, "TFJJ");
    EXPECT_EQ(record.opaqueVaccinationMonth, 8u);
    EXPECT_EQ(record.opaqueVaccinationYear, 2021u);
    ASSERT_TRUE(record.checksum.has_value());
    EXPECT_EQ(*record.checksum, 'Q');
    EXPECT_EQ(record.checksumVerification, ChecksumVerification::VERIFIED);
}

TEST_F(UvciParserTest, IdentifierWithSemantics) {
    UvciParser parser(table_);
    auto record = parseOk(parser, "URN:UVCI:01:SE:EHM/C878/123456789ABC#B");

    EXPECT_EQ(record.schemaOption, SchemaOption::IDENTIFIER_WITH_SEMANTICS);
    EXPECT_EQ(record.schemaOptionDesc(), "identifier with semantics");
    EXPECT_EQ(record.vaccineId, "C878");
    EXPECT_EQ(record.opaqueUniqueString, "123456789ABC");
    EXPECT_TRUE(record.opaqueId.empty());
    EXPECT_TRUE(record.opaqueIssuance.empty());
    EXPECT_EQ(record.opaqueVaccinationMonth, 0u);
    EXPECT_EQ(record.opaqueVaccinationYear, 0u);
    EXPECT_EQ(record.checksumVerification, ChecksumVerification::VERIFIED);
}

TEST_F(UvciParserTest, VaccineCodeWithEmptyUniqueStringIsNotEstimated) {
    UvciParser parser(table_);
    auto record = parseOk(parser, "URN:UVCI:01:SE:EHM/C878/");

    EXPECT_EQ(record.schemaOption, SchemaOption::IDENTIFIER_WITH_SEMANTICS);
    EXPECT_EQ(record.vaccineId, "C878");
    EXPECT_TRUE(record.opaqueUniqueString.empty());
    EXPECT_TRUE(record.opaqueId.empty());
    EXPECT_EQ(record.opaqueVaccinationMonth, 0u);
    EXPECT_EQ(record.opaqueVaccinationYear, 0u);
}

TEST_F(UvciParserTest, SemanticPayload) {
    UvciParser parser(table_);
    auto record = parseOk(parser, "URN:UVCI:01:DE:RKI/DE1234ABCDEF#/");

    EXPECT_EQ(record.schemaOption, SchemaOption::SEMANTICS);
    EXPECT_EQ(record.schemaOptionDesc(), "semantics");
    EXPECT_EQ(record.issuingEntity, "RKI");
    EXPECT_EQ(record.vaccineId, "DE1234");
    EXPECT_TRUE(record.opaqueUniqueString.empty());
    EXPECT_TRUE(record.opaqueId.empty());
    EXPECT_EQ(record.checksumVerification, ChecksumVerification::VERIFIED);
}

// ============================================================================
// Check character
// ============================================================================

TEST_F(UvciParserTest, NoChecksumSuffix) {
    UvciParser parser(table_);
    auto record = parseOk(parser, "URN:UVCI:01:SE:EHM/V12916227TFJJ");

    EXPECT_FALSE(record.checksum.has_value());
    EXPECT_EQ(record.checksumVerification, ChecksumVerification::NOT_APPLICABLE);
    EXPECT_EQ(record.opaqueVaccinationMonth, 8u);
}

TEST_F(UvciParserTest, PublishedSwedishCertificatesVerify) {
    UvciParser parser(table_);
    const std::vector<std::string> valid = {
        "URN:UVCI:01:SE:EHM/V12907267LAJW#E",
        "URN:UVCI:01:SE:EHM/V12920064NYOH#4",
        "URN:UVCI:01:SE:EHM/V12939008LSVR#F",
        "URN:UVCI:01:SE:EHM/V12956472WRGE#7",
        "URN:UVCI:01:SE:EHM/V12982924YQMV#T",
        "URN:UVCI:01:SE:EHM/V12997980ASMG#1",
        "URN:UVCI:01:SE:EHM/V12998404MNQF#6",
    };
    for (const auto& raw : valid) {
        auto record = parseOk(parser, raw);
        EXPECT_EQ(record.checksumVerification, ChecksumVerification::VERIFIED) << raw;
    }
}

TEST_F(UvciParserTest, AlteredCertificatesMismatch) {
    UvciParser parser(table_);
    const std::vector<std::string> altered = {
        "URN:UVCI:01:SE:EHM/V12916227TFJJ#R",
        "URN:UVCI:01:SE:EHM/V12916227TFJK#Q",
        "URN:UVCI:01:SE:EHM/V12961227TFJJ#Q",
        "URN:UVCI:01:SE:EHN/V12916227TFJJ#Q",
        "URN:UVCI:02:SE:EHM/V12916227TFJJ#Q",
    };
    for (const auto& raw : altered) {
        auto record = parseOk(parser, raw);
        EXPECT_EQ(record.checksumVerification, ChecksumVerification::MISMATCHED) << raw;
        EXPECT_TRUE(record.checksum.has_value()) << raw;
    }
}

TEST_F(UvciParserTest, LowercaseInputVerifies) {
    UvciParser parser(table_);
    auto record = parseOk(parser, "urn:uvci:01:se:ehm/v12916227tfjj#q");
    EXPECT_EQ(record.opaqueUniqueString, "V12916227TFJJ");
    EXPECT_EQ(*record.checksum, 'Q');
    EXPECT_EQ(record.checksumVerification, ChecksumVerification::VERIFIED);
}

TEST_F(UvciParserTest, InvalidCheckCharacter) {
    UvciParser parser(table_);
    for (const std::string raw : {"URN:UVCI:01:SE:EHM/V12916227TFJJ#*",
                                  "URN:UVCI:01:SE:EHM/V12916227TFJJ#QQ",
                                  "URN:UVCI:01:SE:EHM/V12916227TFJJ#",
                                  "URN:UVCI:01:SE:EHM/V12916227TFJJ#-"}) {
        auto result = parser.parse(raw);
        EXPECT_FALSE(result.ok()) << raw;
        EXPECT_EQ(result.error, ParseError::INVALID_CHECKSUM_CHARACTER) << raw;
        EXPECT_FALSE(result.message.empty()) << raw;
    }
}

TEST_F(UvciParserTest, Iso7064Algorithm) {
    ParserOptions options;
    options.checksumAlgorithm = ChecksumAlgorithm::ISO7064_MOD_37_36;
    UvciParser parser(table_, options);

    EXPECT_EQ(parseOk(parser, "URN:UVCI:01:SE:EHM/V12916227TFJJ#F").checksumVerification,
              ChecksumVerification::VERIFIED);
    EXPECT_EQ(parseOk(parser, "URN:UVCI:01:SE:EHM/V12916227TFJJ#Q").checksumVerification,
              ChecksumVerification::MISMATCHED);
    EXPECT_EQ(parseOk(parser, "URN:UVCI:01:SE:EHM/V00000004AAAA#*").checksumVerification,
              ChecksumVerification::VERIFIED);

    auto result = parser.parse("URN:UVCI:01:SE:EHM/V12916227TFJJ#/");
    EXPECT_EQ(result.error, ParseError::INVALID_CHECKSUM_CHARACTER);
}

// ============================================================================
// Malformed input
// ============================================================================

TEST_F(UvciParserTest, MissingSeparatorIsMalformed) {
    UvciParser parser(table_);
    auto result = parser.parse("URN:UVCI:01:SE:123456789ABC#B");
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.record.has_value());
    EXPECT_EQ(result.error, ParseError::MALFORMED_STRUCTURE);
}

TEST_F(UvciParserTest, GarbageIsMalformed) {
    UvciParser parser(table_);
    for (const std::string raw : {"", "a", "URN:UVCI:", "::::::::::", "//////////",
                                  "URN:UVCI:01:SE:EHM/", "URN:UVCI:1:SE:EHM/V1"}) {
        EXPECT_EQ(parser.parse(raw).error, ParseError::MALFORMED_STRUCTURE) << raw;
    }
}

// ============================================================================
// Date estimation
// ============================================================================

TEST_F(UvciParserTest, UnsupportedCountrySkipsEstimation) {
    UvciParser parser(table_);
    auto record = parseOk(parser, "URN:UVCI:01:FR:DGS/V12916227TFJJ");

    EXPECT_EQ(record.opaqueId, "V12916227");
    EXPECT_EQ(record.opaqueIssuance, "TFJJ");
    EXPECT_EQ(record.opaqueVaccinationMonth, 0u);
    EXPECT_EQ(record.opaqueVaccinationYear, 0u);
}

TEST_F(UvciParserTest, ConfiguredEstimationCountry) {
    ParserOptions options;
    options.estimationCountry = "FR";
    UvciParser parser(table_, options);

    EXPECT_EQ(parseOk(parser, "URN:UVCI:01:FR:DGS/V12916227TFJJ").opaqueVaccinationMonth, 8u);
    EXPECT_EQ(parseOk(parser, "URN:UVCI:01:SE:EHM/V12916227TFJJ#Q").opaqueVaccinationMonth, 0u);
}

TEST_F(UvciParserTest, WithoutStatisticsTable) {
    UvciParser parser;
    auto record = parseOk(parser, "URN:UVCI:01:SE:EHM/V12916227TFJJ#Q");

    EXPECT_EQ(record.opaqueId, "V12916227");
    EXPECT_EQ(record.opaqueVaccinationMonth, 0u);
    EXPECT_EQ(record.opaqueVaccinationYear, 0u);
    EXPECT_EQ(record.checksumVerification, ChecksumVerification::VERIFIED);
}

TEST_F(UvciParserTest, OpaqueWithoutDigitRun) {
    UvciParser parser(table_);
    auto record = parseOk(parser, "URN:UVCI:01:SE:EHM/ABCDEF");

    EXPECT_EQ(record.schemaOption, SchemaOption::OPAQUE_UNIQUE_STRING);
    EXPECT_EQ(record.opaqueUniqueString, "ABCDEF");
    EXPECT_TRUE(record.opaqueId.empty());
    EXPECT_TRUE(record.opaqueIssuance.empty());
    EXPECT_EQ(record.opaqueVaccinationMonth, 0u);
}

// ============================================================================
// Batch
// ============================================================================

TEST_F(UvciParserTest, BatchPreservesInputOrder) {
    UvciParser parser(table_);

    std::vector<std::string> inputs;
    for (int i = 0; i < 50; ++i) {
        inputs.push_back("URN:UVCI:01:SE:EHM/V" + std::to_string(12900000 + i) + "ABCD");
        inputs.push_back("not a uvci " + std::to_string(i));
    }

    auto sequential = parser.parseBatch(inputs, 1);
    auto parallel = parser.parseBatch(inputs, 4);
    ASSERT_EQ(sequential.size(), inputs.size());
    ASSERT_EQ(parallel.size(), inputs.size());

    for (size_t i = 0; i < inputs.size(); ++i) {
        ASSERT_EQ(parallel[i].ok(), sequential[i].ok()) << i;
        EXPECT_EQ(parallel[i].ok(), i % 2 == 0) << i;
        if (parallel[i].ok()) {
            EXPECT_EQ(parallel[i].record->opaqueId, sequential[i].record->opaqueId);
            EXPECT_EQ(parallel[i].record->opaqueId,
                      "V" + std::to_string(12900000 + static_cast<int>(i / 2)));
        } else {
            EXPECT_EQ(parallel[i].error, ParseError::MALFORMED_STRUCTURE);
        }
    }
}

TEST_F(UvciParserTest, BatchEdgeCases) {
    UvciParser parser(table_);
    EXPECT_TRUE(parser.parseBatch({}, 8).empty());

    auto single = parser.parseBatch({"URN:UVCI:01:SE:EHM/V12916227TFJJ#Q"}, 8);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_TRUE(single[0].ok());

    auto more = parser.parseBatch({"01:SE:EHM/V1", "01:SE:EHM/V2", "01:SE:EHM/V3"}, 64);
    ASSERT_EQ(more.size(), 3u);
    EXPECT_EQ(more[2].record->opaqueId, "V3");
}
