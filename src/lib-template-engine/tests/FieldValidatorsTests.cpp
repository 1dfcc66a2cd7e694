#include <gtest/gtest.h>

#include "ifx/FieldValidators.hpp"

using namespace ifx;

TEST(FiscalIdValidatorTest, AcceptsKnownValidNip) {
  auto outcome = validateFiscalId("5260250995");
  EXPECT_TRUE(outcome.valid);
  EXPECT_EQ(outcome.normalized, "5260250995");
  EXPECT_TRUE(outcome.reason.empty());

  outcome = validateFiscalId("PL 526-025-09-95");
  EXPECT_TRUE(outcome.valid);
  EXPECT_EQ(outcome.normalized, "5260250995");

  EXPECT_TRUE(validateFiscalId("123-456-32-18").valid);
}

TEST(FiscalIdValidatorTest, DetectsEverySingleDigitSubstitution) {
  const std::string valid = "5260250995";
  for (std::size_t pos = 0; pos < valid.size(); ++pos) {
    for (char digit = '0'; digit <= '9'; ++digit) {
      if (digit == valid[pos]) continue;
      std::string changed = valid;
      changed[pos] = digit;
      EXPECT_FALSE(validateFiscalId(changed).valid) << changed;
    }
  }
}

TEST(FiscalIdValidatorTest, DetectsAdjacentTransposition) {
  auto outcome = validateFiscalId("5620250995");
  EXPECT_FALSE(outcome.valid);
  EXPECT_EQ(outcome.reason, "NIP checksum mismatch");
  EXPECT_EQ(outcome.normalized, "5620250995");
}

TEST(FiscalIdValidatorTest, RejectsWrongLengthAndControlTen) {
  auto outcome = validateFiscalId("52602509");
  EXPECT_FALSE(outcome.valid);
  EXPECT_NE(outcome.reason.find("10 digits"), std::string::npos);

  EXPECT_FALSE(validateFiscalId("1000000160").valid);
  EXPECT_FALSE(validateFiscalId("").valid);
}

TEST(RoFiscalIdValidatorTest, ChecksCui) {
  auto outcome = validateRoFiscalId("RO14399840");
  EXPECT_TRUE(outcome.valid);
  EXPECT_EQ(outcome.normalized, "14399840");
  EXPECT_TRUE(validateRoFiscalId("18547290").valid);
  EXPECT_FALSE(validateRoFiscalId("14399841").valid);
  EXPECT_FALSE(validateRoFiscalId("1").valid);
}

TEST(BankAccountValidatorTest, AcceptsValidIbans) {
  auto outcome = validateBankAccount("PL61 1090 1014 0000 0712 1981 2874");
  EXPECT_TRUE(outcome.valid);
  EXPECT_EQ(outcome.normalized, "PL61109010140000071219812874");

  EXPECT_TRUE(validateBankAccount("DE89370400440532013000").valid);
  EXPECT_TRUE(validateBankAccount("gb82 west 1234 5698 7654 32").valid);
}

TEST(BankAccountValidatorTest, PrefixesBarePolishNrb) {
  auto outcome = validateBankAccount("27 1140 2004 0000 3002 0135 5387");
  EXPECT_TRUE(outcome.valid);
  EXPECT_EQ(outcome.normalized, "PL27114020040000300201355387");
}

TEST(BankAccountValidatorTest, RejectsBadChecksumAndLength) {
  auto outcome = validateBankAccount("PL61109010140000071219812875");
  EXPECT_FALSE(outcome.valid);
  EXPECT_EQ(outcome.reason, "IBAN checksum mismatch");

  EXPECT_FALSE(validateBankAccount("DE8937040044053201300").valid);
  EXPECT_FALSE(validateBankAccount("PL61_1090").valid);
  EXPECT_FALSE(validateBankAccount("").valid);
}

TEST(EmailValidatorTest, NormalizesToLowercase) {
  auto outcome = validateEmail(" Faktury@Orange.PL ");
  EXPECT_TRUE(outcome.valid);
  EXPECT_EQ(outcome.normalized, "faktury@orange.pl");
  EXPECT_FALSE(validateEmail("faktury.orange.pl").valid);
  EXPECT_FALSE(validateEmail("a@b").valid);
}

class DateSanityTest : public ::testing::Test {
 protected:
  void SetUp() override { policy_.today = Date{2024, 6, 1}; }
  ValidationPolicy policy_;
};

TEST_F(DateSanityTest, AcceptsPlausibleRange) {
  EXPECT_TRUE(validateDate(Date{1990, 1, 1}, policy_).valid);
  EXPECT_TRUE(validateDate(Date{2026, 6, 1}, policy_).valid);
}

TEST_F(DateSanityTest, RejectsOutOfRange) {
  auto outcome = validateDate(Date{1989, 12, 31}, policy_);
  EXPECT_FALSE(outcome.valid);
  EXPECT_EQ(outcome.reason, "date before 1990");

  outcome = validateDate(Date{2026, 6, 2}, policy_);
  EXPECT_FALSE(outcome.valid);
  EXPECT_EQ(outcome.reason, "date more than 2 years ahead");

  EXPECT_FALSE(validateDate(Date{2024, 4, 31}, policy_).valid);
}

TEST(AmountSanityTest, TotalsMustBePositive) {
  ValidationPolicy policy;
  EXPECT_FALSE(validateAmount(Amount(0), policy, true).valid);
  EXPECT_FALSE(validateAmount(Amount(-100), policy, true).valid);
  EXPECT_TRUE(validateAmount(Amount(-100), policy, false).valid);
  EXPECT_TRUE(validateAmount(Amount(1), policy, true).valid);
}

TEST(AmountSanityTest, EnforcesCeiling) {
  ValidationPolicy policy;
  policy.amountCeiling = Amount(100000);
  EXPECT_TRUE(validateAmount(Amount(100000), policy, true).valid);

  auto outcome = validateAmount(Amount(100001), policy, true);
  EXPECT_FALSE(outcome.valid);
  EXPECT_EQ(outcome.reason, "amount exceeds 1000.00");
  EXPECT_FALSE(validateAmount(Amount(-100001), policy, false).valid);
}
