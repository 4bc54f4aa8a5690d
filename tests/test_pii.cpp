#include <gtest/gtest.h>
#include "intel/ThreatIntel.hpp"
#include "privacy/PIIMasker.hpp"
#include "privacy/PIIPatternMatcher.hpp"
#include "privacy/PIIValidators.hpp"
#include <algorithm>

using namespace filesentry;

namespace {

std::shared_ptr<const ScanContent> Content(const std::string& text) {
    FileMetadata metadata;
    metadata.file_id = "pii-file";
    metadata.file_name = "records.txt";
    return ScanContent::Create(std::vector<uint8_t>(text.begin(), text.end()), metadata, 256 * 1024);
}

std::vector<PIIFinding> OfType(const std::vector<PIIFinding>& findings, PIIType type) {
    std::vector<PIIFinding> out;
    std::copy_if(findings.begin(), findings.end(), std::back_inserter(out),
                 [type](const PIIFinding& f) { return f.type == type; });
    return out;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Validators
// ═══════════════════════════════════════════════════════════════════

TEST(PIIValidatorTest, LuhnChecksum) {
    EXPECT_TRUE(pii::PassesLuhn("4111111111111111"));
    EXPECT_TRUE(pii::PassesLuhn("5555555555554444"));
    EXPECT_FALSE(pii::PassesLuhn("4111111111111112"));
    EXPECT_FALSE(pii::PassesLuhn(""));
    EXPECT_FALSE(pii::PassesLuhn("41x1"));
}

TEST(PIIValidatorTest, CreditCardRejectsRepeatedDigitsAndBadLength) {
    EXPECT_TRUE(pii::IsValidCreditCard("4111 1111 1111 1111"));
    EXPECT_FALSE(pii::IsValidCreditCard("0000000000000000"));
    EXPECT_FALSE(pii::IsValidCreditCard("411111111111"));
}

TEST(PIIValidatorTest, SsnRules) {
    EXPECT_TRUE(pii::IsValidSSN("123-45-6789"));
    EXPECT_TRUE(pii::IsValidSSN("123456789"));
    EXPECT_FALSE(pii::IsValidSSN("000-12-3456"));
    EXPECT_FALSE(pii::IsValidSSN("666-12-3456"));
    EXPECT_FALSE(pii::IsValidSSN("912-12-3456"));
    EXPECT_FALSE(pii::IsValidSSN("123-00-4567"));
    EXPECT_FALSE(pii::IsValidSSN("123-45-0000"));
    EXPECT_FALSE(pii::IsValidSSN("555-55-5555"));
    EXPECT_FALSE(pii::IsValidSSN("12-345-678"));
}

TEST(PIIValidatorTest, PhoneRules) {
    EXPECT_TRUE(pii::IsValidPhone("555-234-5678"));
    EXPECT_TRUE(pii::IsValidPhone("+1 555 234 5678"));
    EXPECT_FALSE(pii::IsValidPhone("123-456-7890"));
    EXPECT_FALSE(pii::IsValidPhone("555-123-4567"));
    EXPECT_FALSE(pii::IsValidPhone("411-234-5678"));
    EXPECT_FALSE(pii::IsValidPhone("000-000-0000"));
}

TEST(PIIValidatorTest, EmailRules) {
    EXPECT_TRUE(pii::IsValidEmail("alice@corp.io"));
    EXPECT_FALSE(pii::IsValidEmail("user@example.com"));
    EXPECT_FALSE(pii::IsValidEmail("Test@Test.com"));
    EXPECT_FALSE(pii::IsValidEmail("a@b@c.io"));
    EXPECT_FALSE(pii::IsValidEmail("@corp.io"));
    EXPECT_FALSE(pii::IsValidEmail("alice@.io"));
}

TEST(PIIValidatorTest, Ipv4Rules) {
    EXPECT_TRUE(pii::IsValidIPv4("203.0.113.7"));
    EXPECT_FALSE(pii::IsValidIPv4("127.0.0.1"));
    EXPECT_FALSE(pii::IsValidIPv4("256.1.1.1"));
    EXPECT_FALSE(pii::IsValidIPv4("1.2.3"));
    EXPECT_FALSE(pii::IsValidIPv4("1.2.3.4.5"));
}

TEST(PIIValidatorTest, BankAccountRules) {
    EXPECT_TRUE(pii::IsValidBankAccount("123456789012"));
    EXPECT_FALSE(pii::IsValidBankAccount("11111111"));
    EXPECT_FALSE(pii::IsValidBankAccount("1234567"));
}

// ═══════════════════════════════════════════════════════════════════
// Masking
// ═══════════════════════════════════════════════════════════════════

TEST(PIIMaskerTest, MasksPreserveLengthAndShape) {
    EXPECT_EQ(MaskPII(PIIType::SSN, "123-45-6789"), "***-**-6789");
    EXPECT_EQ(MaskPII(PIIType::CREDIT_CARD, "4111111111111111"), "************1111");
    EXPECT_EQ(MaskPII(PIIType::PHONE, "555-234-5678"), "***-***-****");
    EXPECT_EQ(MaskPII(PIIType::EMAIL, "alice@corp.io"), "a****@corp.io");
    EXPECT_EQ(MaskPII(PIIType::BANK_ACCOUNT, "123456789012"), "********9012");
    EXPECT_EQ(MaskPII(PIIType::PASSPORT, "A1234567"), "********");
}

TEST(PIIMaskerTest, ShortValuesAreFullyMasked) {
    EXPECT_EQ(MaskPII(PIIType::BANK_ACCOUNT, "1234"), "****");
    EXPECT_EQ(MaskPII(PIIType::EMAIL, "@corp.io"), "********");
}

// ═══════════════════════════════════════════════════════════════════
// Pattern matcher
// ═══════════════════════════════════════════════════════════════════

class PIIPatternMatcherTest : public ::testing::Test {
protected:
    PIIPatternMatcher matcher_{DefaultThreatIntel().pii_patterns};
    CancellationToken token_;
};

TEST_F(PIIPatternMatcherTest, FindsSsnWithKeywordBoost) {
    auto findings = matcher_.Scan(*Content("ssn: 123-45-6789"), token_);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].type, PIIType::SSN);
    EXPECT_EQ(findings[0].masked_value, "***-**-6789");
    EXPECT_EQ(findings[0].confidence, 100u);
    EXPECT_EQ(findings[0].severity, Severity::CRITICAL);
    EXPECT_EQ(findings[0].location.offset, 5u);
    EXPECT_EQ(findings[0].location.length, 11u);
    EXPECT_EQ(findings[0].pattern_id, "ssn_us");
}

TEST_F(PIIPatternMatcherTest, ValidCardIsAcceptedInvalidCardIsNot) {
    auto valid = OfType(matcher_.Scan(*Content("card 4111111111111111"), token_), PIIType::CREDIT_CARD);
    ASSERT_EQ(valid.size(), 1u);
    EXPECT_EQ(valid[0].masked_value, "************1111");

    auto invalid = OfType(matcher_.Scan(*Content("card 4111111111111112"), token_), PIIType::CREDIT_CARD);
    EXPECT_TRUE(invalid.empty());
}

TEST_F(PIIPatternMatcherTest, CardNumberIsNotAlsoReportedAsBankAccount) {
    auto findings = matcher_.Scan(*Content("card 4111111111111111"), token_);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].type, PIIType::CREDIT_CARD);

    // A digit run that fails the card checks is still a candidate account number.
    auto other = matcher_.Scan(*Content("card 4111111111111112"), token_);
    ASSERT_EQ(OfType(other, PIIType::BANK_ACCOUNT).size(), 1u);
    EXPECT_EQ(OfType(other, PIIType::BANK_ACCOUNT)[0].masked_value, "************1112");
}

TEST_F(PIIPatternMatcherTest, ContextNeverCarriesRawValues) {
    std::string text = "Reach me at 555-234-5678 or alice@corp.io, ssn 123-45-6789.";
    auto findings = matcher_.Scan(*Content(text), token_);

    ASSERT_EQ(OfType(findings, PIIType::PHONE).size(), 1u);
    ASSERT_EQ(OfType(findings, PIIType::EMAIL).size(), 1u);
    ASSERT_EQ(OfType(findings, PIIType::SSN).size(), 1u);
    for (const auto& finding : findings) {
        EXPECT_EQ(finding.context.find("234-5678"), std::string::npos);
        EXPECT_EQ(finding.context.find("alice@"), std::string::npos);
        EXPECT_EQ(finding.context.find("45-6789"), std::string::npos);
        EXPECT_NE(finding.context.find(finding.masked_value), std::string::npos);
    }
}

TEST_F(PIIPatternMatcherTest, PlaceholderEmailsAreDropped) {
    auto findings = matcher_.Scan(*Content("contact test@test.com or user@example.com"), token_);
    EXPECT_TRUE(OfType(findings, PIIType::EMAIL).empty());
}

TEST_F(PIIPatternMatcherTest, LineAndColumnAreReported) {
    auto findings = matcher_.Scan(*Content("header\n  mail bob@firm.net"), token_);
    auto email = OfType(findings, PIIType::EMAIL);
    ASSERT_EQ(email.size(), 1u);
    EXPECT_EQ(email[0].location.line, 2u);
    EXPECT_EQ(email[0].location.column, 8u);
}

TEST_F(PIIPatternMatcherTest, CleanTextHasNoFindings) {
    EXPECT_TRUE(matcher_.Scan(*Content("The meeting is on Thursday afternoon."), token_).empty());
}

TEST_F(PIIPatternMatcherTest, CancelledTokenStopsScan) {
    token_.Cancel();
    EXPECT_TRUE(matcher_.Scan(*Content("ssn: 123-45-6789"), token_).empty());
}

TEST(PIIPatternMatcherSetupTest, InvalidAndDisabledPatternsAreSkipped) {
    PIIPattern bad;
    bad.id = "bad";
    bad.pattern = "[unclosed";
    PIIPattern off;
    off.id = "off";
    off.pattern = "x";
    off.enabled = false;
    PIIPattern good;
    good.id = "good";
    good.type = PIIType::CUSTOM;
    good.pattern = "EMP-[0-9]{4}";

    PIIPatternMatcher matcher({bad, off, good});
    EXPECT_EQ(matcher.CompiledCount(), 1u);
    EXPECT_EQ(matcher.RejectedCount(), 1u);

    CancellationToken token;
    auto findings = matcher.Scan(*Content("badge EMP-1234"), token);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].masked_value, "********");
}
