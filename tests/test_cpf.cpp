/**
 * @file test_cpf.cpp
 * @brief Unit tests for the Cpf value object
 */

#include <gtest/gtest.h>
#include <brdocs/cpf.h>
#include <brdocs/exceptions.h>

#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

using namespace brdocs;

class CpfTest : public ::testing::Test {
protected:
    const std::vector<std::string> validCpfs = {
        "123.456.789-09", "12345678909",
        "987.654.321-00", "98765432100",
        "111.222.333-96", "11122233396",
        "999.888.777-14", "99988877714",
        "716.735.161-06", "71673516106",
        "000.000.000-00", "00000000000",
        "12345.67890",
    };

    const std::vector<std::string> invalidCpfs = {
        "123.456.789-00", "12345678900", "716.735.161-69",
        "123456789012", "", "   ", "abc.def.ghi-jk",
        "12.345.678-90a", ".-", "123/456.789-09",
    };
};

// ============================================================================
// Validation
// ============================================================================

TEST_F(CpfTest, IsValid_KnownValid) {
    for (const auto& cpf : validCpfs) {
        EXPECT_TRUE(Cpf::isValid(cpf)) << cpf;
    }
}

TEST_F(CpfTest, IsValid_KnownInvalid) {
    for (const auto& cpf : invalidCpfs) {
        EXPECT_FALSE(Cpf::isValid(cpf)) << cpf;
    }
}

TEST_F(CpfTest, IsValid_Number) {
    EXPECT_TRUE(Cpf::isValid(12345678909LL));
    EXPECT_TRUE(Cpf::isValid(0LL));
    EXPECT_TRUE(Cpf::isValid(191LL));
    EXPECT_FALSE(Cpf::isValid(12345678900LL));
    EXPECT_FALSE(Cpf::isValid(-12345678909LL));
    EXPECT_FALSE(Cpf::isValid(100000000000LL));
}

TEST_F(CpfTest, IsValid_InputLongerThanCapRejected) {
    EXPECT_FALSE(Cpf::isValid("123.456.789-09......."));
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(CpfTest, Parse_Punctuated) {
    Cpf cpf = Cpf::parse("123.456.789-09");
    EXPECT_EQ(cpf.toInt64(), 12345678909LL);
    EXPECT_EQ(cpf.baseDigits(), 123456789LL);
    EXPECT_EQ(cpf.checkDigits(), 9);
}

TEST_F(CpfTest, Parse_PunctuationInvariant) {
    EXPECT_EQ(Cpf::parse("123.456.789-09"), Cpf::parse("12345678909"));
    EXPECT_EQ(Cpf::parse("1.2.3.4.5.6.7.8.9-09"), Cpf::parse("12345678909"));
    EXPECT_EQ(Cpf::parse("191"), Cpf::parse("000.000.001-91"));
}

TEST_F(CpfTest, Parse_Number) {
    EXPECT_EQ(Cpf::parse(71673516106LL).toString(), "716.735.161-06");
}

TEST_F(CpfTest, Parse_InvalidThrowsWithKind) {
    try {
        Cpf::parse("123.456.789-00");
        FAIL() << "Expected BadCpfException";
    } catch (const BadCpfException& e) {
        EXPECT_EQ(e.getSourceType(), DocumentType::Cpf);
        EXPECT_EQ(e.getErrorKind(), ErrorKind::ChecksumMismatch);
        ASSERT_TRUE(e.getInvalidDocument().has_value());
        EXPECT_EQ(*e.getInvalidDocument(), "123.456.789-00");
        EXPECT_STREQ(e.what(), "Invalid CPF: '123.456.789-00'.");
    }
}

TEST_F(CpfTest, Parse_NumberOutOfRangeThrows) {
    try {
        Cpf::parse(-1LL);
        FAIL() << "Expected BadCpfException";
    } catch (const BadCpfException& e) {
        EXPECT_EQ(e.getErrorKind(), ErrorKind::OutOfRange);
        EXPECT_EQ(*e.getInvalidDocument(), "-1");
    }
}

TEST_F(CpfTest, TryParse) {
    auto cpf = Cpf::tryParse("987.654.321-00");
    ASSERT_TRUE(cpf.has_value());
    EXPECT_EQ(cpf->toInt64(), 98765432100LL);

    EXPECT_FALSE(Cpf::tryParse("987.654.321-01").has_value());
    EXPECT_FALSE(Cpf::tryParse("").has_value());
    EXPECT_FALSE(Cpf::tryParse(-5LL).has_value());
    EXPECT_TRUE(Cpf::tryParse(98765432100LL).has_value());
}

TEST_F(CpfTest, Inspect_ReportsErrorKind) {
    EXPECT_EQ(Cpf::inspect("").error, ErrorKind::NullOrEmptyInput);
    EXPECT_EQ(Cpf::inspect("123456789012345678901").error, ErrorKind::InputTooLong);
    EXPECT_EQ(Cpf::inspect("abc").error, ErrorKind::InvalidCharacter);
    EXPECT_EQ(Cpf::inspect("123456789012").error, ErrorKind::WrongValidCharacterCount);
    EXPECT_EQ(Cpf::inspect("12345678900").error, ErrorKind::ChecksumMismatch);
    EXPECT_EQ(Cpf::inspect(100000000000LL).error, ErrorKind::OutOfRange);

    auto ok = Cpf::inspect("12345678909");
    EXPECT_TRUE(ok);
    EXPECT_EQ(ok.error, ErrorKind::None);
}

// ============================================================================
// Creation
// ============================================================================

TEST_F(CpfTest, Create_AppendsCheckDigits) {
    EXPECT_EQ(Cpf::create(123456789LL).toString(), "123.456.789-09");
    EXPECT_EQ(Cpf::create(0LL), Cpf::empty());
    EXPECT_EQ(Cpf::create(999999999LL).toString("B"), "99999999999");
}

TEST_F(CpfTest, Create_FromText) {
    EXPECT_EQ(Cpf::create("123.456.789").toString(), "123.456.789-09");
    EXPECT_EQ(Cpf::create("716735161").toInt64(), 71673516106LL);
}

TEST_F(CpfTest, Create_OutOfRange) {
    EXPECT_THROW(Cpf::create(-1LL), std::out_of_range);
    EXPECT_THROW(Cpf::create(1000000000LL), std::out_of_range);
    EXPECT_THROW(Cpf::create("1234567890"), std::out_of_range);
}

TEST_F(CpfTest, Create_FromBadText) {
    EXPECT_THROW(Cpf::create("12a"), BadCpfException);
    EXPECT_THROW(Cpf::create(""), BadCpfException);
}

TEST_F(CpfTest, ComputeCheckDigits) {
    EXPECT_EQ(Cpf::computeCheckDigits(123456789LL), 9);
    EXPECT_EQ(Cpf::computeCheckDigits(111222333LL), 96);
    EXPECT_THROW(Cpf::computeCheckDigits(-1LL), std::out_of_range);
    EXPECT_THROW(Cpf::computeCheckDigits(1000000000LL), std::out_of_range);
}

TEST_F(CpfTest, Create_RandomBasesAlwaysValidate) {
    std::mt19937 rng(20260301);
    std::uniform_int_distribution<int64_t> base(0, 999999999);

    for (int i = 0; i < 1000; i++) {
        Cpf cpf = Cpf::create(base(rng));
        EXPECT_TRUE(Cpf::isValid(cpf.toString("G"))) << cpf;
        EXPECT_TRUE(Cpf::isValid(cpf.toString("B"))) << cpf;
        EXPECT_TRUE(Cpf::isValid(cpf.toString("S"))) << cpf;
        EXPECT_EQ(Cpf::parse(cpf.toString("G")), cpf);
    }
}

// ============================================================================
// Formatting
// ============================================================================

TEST_F(CpfTest, Format_Styles) {
    Cpf cpf = Cpf::parse("01234567890");
    EXPECT_EQ(cpf.toString("S"), "1234567890");
    EXPECT_EQ(cpf.toString("B"), "01234567890");
    EXPECT_EQ(cpf.toString("G"), "012.345.678-90");
    EXPECT_EQ(cpf.toString(), "012.345.678-90");
}

TEST_F(CpfTest, Format_StyleIsCaseInsensitive) {
    Cpf cpf = Cpf::parse("12345678909");
    EXPECT_EQ(cpf.toString("g"), "123.456.789-09");
    EXPECT_EQ(cpf.toString("b"), "12345678909");
    EXPECT_EQ(cpf.toString("s"), "12345678909");
}

TEST_F(CpfTest, Format_UnknownStyleThrows) {
    Cpf cpf = Cpf::parse("12345678909");
    EXPECT_THROW((void)cpf.toString("BS"), std::out_of_range);
    EXPECT_THROW((void)cpf.toString("X"), std::out_of_range);
    EXPECT_THROW((void)cpf.toString(""), std::out_of_range);
}

TEST_F(CpfTest, Format_StreamUsesGeneralStyle) {
    std::ostringstream oss;
    oss << Cpf::parse("98765432100");
    EXPECT_EQ(oss.str(), "987.654.321-00");
}

// ============================================================================
// Value semantics
// ============================================================================

TEST_F(CpfTest, Empty_IsAllZeros) {
    EXPECT_EQ(Cpf::empty().toInt64(), 0);
    EXPECT_EQ(Cpf::empty().toString(), "000.000.000-00");
    EXPECT_EQ(Cpf::empty().toString("S"), "0");
    EXPECT_TRUE(Cpf::isValid(Cpf::empty().toString()));
}

TEST_F(CpfTest, Ordering) {
    Cpf low = Cpf::parse("000.000.001-91");
    Cpf high = Cpf::parse("123.456.789-09");
    EXPECT_TRUE(low < high);
    EXPECT_FALSE(high < low);
    EXPECT_LT(low.compare(high), 0);
    EXPECT_GT(high.compare(low), 0);
    EXPECT_EQ(low.compare(low), 0);
    EXPECT_NE(low, high);
}

TEST_F(CpfTest, Hash_EqualValuesCollapse) {
    std::unordered_set<Cpf> set;
    set.insert(Cpf::parse("123.456.789-09"));
    set.insert(Cpf::parse("12345678909"));
    set.insert(Cpf::parse(12345678909LL));
    set.insert(Cpf::parse("98765432100"));
    EXPECT_EQ(set.size(), 2u);
}
