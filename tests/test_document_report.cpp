/**
 * @file test_document_report.cpp
 * @brief Unit tests for per-input validation reports
 */

#include <gtest/gtest.h>
#include <brdocs/cnpj.h>
#include <brdocs/cpf.h>
#include <brdocs/document_report.h>

#include <string>
#include <vector>

using namespace brdocs;

class DocumentReportTest : public ::testing::Test {
protected:
    const std::vector<std::string> mixedBatch = {
        "09.358.105/0001-91", "123.456.789-09", "1/0001-36",
    };
};

// ============================================================================
// Format styles
// ============================================================================

TEST_F(DocumentReportTest, SupportedStylesPerType) {
    EXPECT_TRUE(Cpf::supportsFormatStyle("G"));
    EXPECT_TRUE(Cpf::supportsFormatStyle("s"));
    EXPECT_FALSE(Cpf::supportsFormatStyle("BS"));

    EXPECT_TRUE(Cnpj::supportsFormatStyle("BS"));
    EXPECT_TRUE(Cnpj::supportsFormatStyle("bs"));
    EXPECT_FALSE(Cnpj::supportsFormatStyle("X"));
}

TEST_F(DocumentReportTest, KnownFormatStyle) {
    EXPECT_TRUE(isKnownFormatStyle("G"));
    EXPECT_TRUE(isKnownFormatStyle("BS"));
    EXPECT_FALSE(isKnownFormatStyle("X"));
    EXPECT_FALSE(isKnownFormatStyle(""));
}

// ============================================================================
// describeDocument
// ============================================================================

TEST_F(DocumentReportTest, Describe_ValidCpf) {
    DocumentReport report = describeDocument("12345678909", DocumentType::Unknown);
    EXPECT_TRUE(report.detection.valid);
    EXPECT_EQ(report.detection.type, DocumentType::Cpf);
    ASSERT_TRUE(report.formatted.has_value());
    EXPECT_EQ(*report.formatted, "123.456.789-09");
    EXPECT_EQ(report.formatError, ErrorKind::None);
}

TEST_F(DocumentReportTest, Describe_Invalid) {
    DocumentReport report = describeDocument("21.552.200/0001-28", DocumentType::Unknown);
    EXPECT_FALSE(report.detection.valid);
    EXPECT_EQ(report.detection.error, ErrorKind::ChecksumMismatch);
    EXPECT_FALSE(report.formatted.has_value());
}

TEST_F(DocumentReportTest, Describe_HintPicksFormattedType) {
    DocumentReport asCnpj = describeDocument("00970938900", DocumentType::Cnpj, "B");
    ASSERT_TRUE(asCnpj.formatted.has_value());
    EXPECT_EQ(*asCnpj.formatted, "00000970938900");

    DocumentReport asCpf = describeDocument("00970938900", DocumentType::Cpf, "B");
    ASSERT_TRUE(asCpf.formatted.has_value());
    EXPECT_EQ(*asCpf.formatted, "00970938900");
}

TEST_F(DocumentReportTest, Describe_StyleNotSupportedByCpf) {
    DocumentReport report = describeDocument("123.456.789-09", DocumentType::Unknown, "BS");
    EXPECT_TRUE(report.detection.valid);
    EXPECT_EQ(report.detection.type, DocumentType::Cpf);
    EXPECT_FALSE(report.formatted.has_value());
    EXPECT_EQ(report.formatError, ErrorKind::UnknownFormatStyle);
}

// ============================================================================
// describeDocuments
// ============================================================================

TEST_F(DocumentReportTest, Batch_RootOnlyStyleReportsEveryInput) {
    auto reports = describeDocuments(mixedBatch, DocumentType::Unknown, "BS");

    ASSERT_EQ(reports.size(), 3u);

    EXPECT_EQ(reports[0].input, "09.358.105/0001-91");
    ASSERT_TRUE(reports[0].formatted.has_value());
    EXPECT_EQ(*reports[0].formatted, "09358105");

    EXPECT_EQ(reports[1].input, "123.456.789-09");
    EXPECT_EQ(reports[1].detection.type, DocumentType::Cpf);
    EXPECT_EQ(reports[1].formatError, ErrorKind::UnknownFormatStyle);

    EXPECT_EQ(reports[2].input, "1/0001-36");
    ASSERT_TRUE(reports[2].formatted.has_value());
    EXPECT_EQ(*reports[2].formatted, "00000001");

    // The documents themselves are all valid
    EXPECT_TRUE(allValid(reports));
}

TEST_F(DocumentReportTest, Batch_AllValidFalseWhenAnyInvalid) {
    auto reports = describeDocuments({"123.456.789-09", "abc"}, DocumentType::Unknown);
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_FALSE(allValid(reports));
}

TEST_F(DocumentReportTest, Batch_Empty) {
    EXPECT_TRUE(describeDocuments({}, DocumentType::Unknown).empty());
    EXPECT_TRUE(allValid({}));
}
