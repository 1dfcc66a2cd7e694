#include <gtest/gtest.h>

#include "TestTemplates.hpp"
#include "ifx/Errors.hpp"
#include "ifx/ExtractionEngine.hpp"

using namespace ifx;
using ifx::testing::makeTemplate;

class ExtractionEngineTest : public ::testing::Test {
 protected:
  static ValidationPolicy fixedPolicy() {
    ValidationPolicy policy;
    policy.today = Date{2024, 6, 1};
    return policy;
  }

  ExtractionEngine engine_{fixedPolicy()};
  Template orange_ = makeTemplate(ifx::testing::kOrangePolska);
};

TEST_F(ExtractionEngineTest, ExtractsTypedFields) {
  const auto result = engine_.extract(ifx::testing::kOrangeInvoiceText, orange_);

  EXPECT_EQ(result.templateId, "orange_polska");
  EXPECT_TRUE(result.complete);
  ASSERT_EQ(result.fields.size(), 7u);

  EXPECT_EQ(result.value("invoice_id"), FieldValue(std::string("FV/2024/03/0012")));
  EXPECT_EQ(result.value("supplier_tax_id"), FieldValue(std::string("5260250995")));
  EXPECT_EQ(result.value("issue_date"), FieldValue(Date{2024, 3, 15}));
  EXPECT_EQ(result.value("due_date"), FieldValue(Date{2024, 3, 29}));
  EXPECT_EQ(result.value("bank_account"),
            FieldValue(std::string("PL61109010140000071219812874")));
  EXPECT_EQ(result.value("total_net"), FieldValue(Amount(6504)));
  EXPECT_EQ(result.value("total_gross"), FieldValue(Amount(7999)));

  const ExtractedField* nip = result.field("supplier_tax_id");
  ASSERT_NE(nip, nullptr);
  EXPECT_EQ(nip->status, FieldStatus::Found);
  EXPECT_EQ(nip->raw, "526-025-09-95");
  EXPECT_TRUE(nip->required);
}

TEST_F(ExtractionEngineTest, ExtractsTableRowsAndSkipsNoise) {
  const auto result = engine_.extract(ifx::testing::kOrangeInvoiceText, orange_);

  auto it = result.tables.find("line_items");
  ASSERT_NE(it, result.tables.end());
  const auto& rows = it->second;
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0], (TableRow{{"lp", "1"},
                               {"description", "Abonament komorkowy"},
                               {"quantity", "1"},
                               {"amount", "49,99"}}));
  EXPECT_EQ(rows[1].at("lp"), "2");
  EXPECT_EQ(rows[1].at("description"), "Pakiet internetowy");
  EXPECT_EQ(rows[1].at("amount"), "30,00");
}

TEST_F(ExtractionEngineTest, MissingRequiredFieldKeepsOtherFields) {
  const std::string text =
      "Orange Polska S.A.\n"
      "NIP: 526-025-09-95\n"
      "Data wystawienia: 15.03.2024\n"
      "Do zaplaty: 79,99 zl\n";

  const auto result = engine_.extract(text, orange_);

  EXPECT_FALSE(result.complete);
  const ExtractedField* invoice = result.field("invoice_id");
  ASSERT_NE(invoice, nullptr);
  EXPECT_EQ(invoice->status, FieldStatus::Missing);
  EXPECT_FALSE(invoice->value.has_value());
  EXPECT_EQ(invoice->reason, "no pattern matched");

  EXPECT_EQ(result.value("supplier_tax_id"), FieldValue(std::string("5260250995")));
  EXPECT_EQ(result.value("issue_date"), FieldValue(Date{2024, 3, 15}));
  EXPECT_EQ(result.value("total_gross"), FieldValue(Amount(7999)));
  EXPECT_EQ(result.tables.at("line_items").size(), 0u);
}

TEST_F(ExtractionEngineTest, FallsBackToNextPattern) {
  const auto result = engine_.extract(
      "Orange Polska\nNr faktury: ABC-77\nDo zaplaty: 10,00", orange_);
  EXPECT_EQ(result.value("invoice_id"), FieldValue(std::string("ABC-77")));
}

TEST_F(ExtractionEngineTest, FailedValidationClearsFieldWithReason) {
  const auto result = engine_.extract(
      "Faktura VAT nr FV/1\n"
      "NIP: 562-025-09-95\n"
      "Data wystawienia: 15.03.2024\n"
      "Rachunek: PL61 1090 1014 0000 0712 1981 2875\n"
      "Do zaplaty: 0,00\n",
      orange_);

  EXPECT_FALSE(result.complete);

  const ExtractedField* nip = result.field("supplier_tax_id");
  EXPECT_EQ(nip->status, FieldStatus::Invalid);
  EXPECT_FALSE(nip->value.has_value());
  EXPECT_EQ(nip->reason, "NIP checksum mismatch");

  EXPECT_EQ(result.field("bank_account")->status, FieldStatus::Invalid);
  EXPECT_EQ(result.field("total_gross")->reason, "total amount must be positive");
  EXPECT_EQ(result.field("issue_date")->status, FieldStatus::Found);
}

TEST_F(ExtractionEngineTest, ImplausibleDateIsInvalid) {
  const auto result = engine_.extract(
      "Faktura VAT nr FV/1\nData wystawienia: 15.03.2031\n", orange_);
  const ExtractedField* date = result.field("issue_date");
  EXPECT_EQ(date->status, FieldStatus::Invalid);
  EXPECT_EQ(date->reason, "date more than 2 years ahead");
}

TEST_F(ExtractionEngineTest, CoercionFailureTriesNextPattern) {
  const Template tpl = makeTemplate(R"json({
    "template": {"name": "dates", "locale": "pl"},
    "fields": {
      "issue_date": {"patterns": ["Data:\\s*(\\S+)", "Wystawiono\\s+(\\S+)"],
                     "type": "date", "required": true}
    }
  })json");

  auto result = engine_.extract("Data: 31.04.2024\nWystawiono 30.04.2024", tpl);
  EXPECT_EQ(result.value("issue_date"), FieldValue(Date{2024, 4, 30}));
  EXPECT_TRUE(result.complete);

  result = engine_.extract("Data: 31.04.2024", tpl);
  const ExtractedField* field = result.field("issue_date");
  EXPECT_EQ(field->status, FieldStatus::Missing);
  EXPECT_EQ(field->raw, "31.04.2024");
  EXPECT_EQ(field->reason, "cannot read '31.04.2024' as date");
  EXPECT_FALSE(result.complete);
}

TEST_F(ExtractionEngineTest, AmountConventionFollowsLocaleAndHint) {
  const Template english = makeTemplate(R"json({
    "template": {"name": "en_invoice", "locale": "en"},
    "fields": {
      "total": {"patterns": ["Total:\\s*([0-9,.]+)"], "type": "amount"},
      "eu_total": {"patterns": ["EU:\\s*([0-9,. ]+)"], "type": "amount", "format": "comma"}
    }
  })json");

  const auto result = engine_.extract("Total: 1,234.50\nEU: 1.234,50", english);
  EXPECT_EQ(result.value("total"), FieldValue(Amount(123450)));
  EXPECT_EQ(result.value("eu_total"), FieldValue(Amount(123450)));
}

TEST_F(ExtractionEngineTest, IntegerGroupAndLineAnchoredPatterns) {
  const Template tpl = makeTemplate(R"json({
    "template": {"name": "misc"},
    "fields": {
      "pages": {"patterns": ["^Stron:\\s*(\\d+)$"], "type": "integer"},
      "order": {"patterns": ["Zamowienie (\\w+)/(\\d+)"], "group": 2, "type": "integer"},
      "whole": {"patterns": ["REF-\\d+"], "group": 1}
    }
  })json");

  const auto result = engine_.extract(
      "Naglowek\nStron: 3\nZamowienie ZK/1042\nREF-99 koniec", tpl);
  EXPECT_EQ(result.value("pages"), FieldValue(std::int64_t{3}));
  EXPECT_EQ(result.value("order"), FieldValue(std::int64_t{1042}));
  EXPECT_EQ(result.value("whole"), FieldValue(std::string("REF-99")));
}

TEST_F(ExtractionEngineTest, ContextKeywordsNarrowSearch) {
  const Template tpl = makeTemplate(R"json({
    "template": {"name": "ctx"},
    "fields": {
      "buyer_nip": {"patterns": ["NIP:?\\s*([0-9\\-]{10,13})"],
                    "validator": "nip",
                    "context_keywords": ["Nabywca"], "context_range": 60}
    }
  })json");

  const auto result = engine_.extract(
      "Sprzedawca\nNIP: 526-025-09-95\n"
      "..........................................................................\n"
      "Nabywca\nNIP: 123-456-32-18\n",
      tpl);
  EXPECT_EQ(result.value("buyer_nip"), FieldValue(std::string("1234563218")));
}

TEST_F(ExtractionEngineTest, ContextWindowStartsAtLineBoundary) {
  const Template tpl = makeTemplate(R"json({
    "template": {"name": "ctx_anchor"},
    "fields": {
      "amount_line": {"patterns": ["^(\\d+)"], "type": "integer",
                      "context_keywords": ["Kwota"]}
    }
  })json");

  const std::string text =
      "Opis: abc 77" + std::string(48, 'x') + "Kwota 99\n";
  const auto result = engine_.extract(text, tpl);
  const ExtractedField* field = result.field("amount_line");
  ASSERT_NE(field, nullptr);
  EXPECT_EQ(field->status, FieldStatus::Missing);

  const auto anchored = engine_.extract(
      "Naglowek\n" + std::string(60, '-') + "\n12 Kwota\n", tpl);
  EXPECT_EQ(anchored.value("amount_line"), FieldValue(std::int64_t{12}));
}

TEST_F(ExtractionEngineTest, MultipleFieldCollectsDistinctValidValues) {
  const Template tpl = makeTemplate(R"json({
    "template": {"name": "accounts"},
    "fields": {
      "bank_accounts": {"patterns": ["Konto:\\s*([A-Z]{2}[0-9 ]{24,32}[0-9])"],
                        "validator": "iban", "multiple": true},
      "order_numbers": {"patterns": ["^ZK/(\\d+)"], "type": "integer",
                        "multiple": true}
    }
  })json");

  const auto result = engine_.extract(
      "Konto: PL61 1090 1014 0000 0712 1981 2874\n"
      "Konto: PL61 1090 1014 0000 0712 1981 2875\n"
      "Konto: PL61109010140000071219812874\n"
      "ZK/7 oraz ZK/8\n"
      "ZK/9\n",
      tpl);

  const ExtractedField* accounts = result.field("bank_accounts");
  ASSERT_NE(accounts, nullptr);
  EXPECT_EQ(accounts->status, FieldStatus::Found);
  EXPECT_TRUE(accounts->multiple);
  ASSERT_EQ(accounts->values.size(), 1u);
  EXPECT_EQ(accounts->values[0],
            FieldValue(std::string("PL61109010140000071219812874")));
  EXPECT_EQ(accounts->value, accounts->values[0]);

  const ExtractedField* orders = result.field("order_numbers");
  ASSERT_NE(orders, nullptr);
  ASSERT_EQ(orders->values.size(), 2u);
  EXPECT_EQ(orders->values[0], FieldValue(std::int64_t{7}));
  EXPECT_EQ(orders->values[1], FieldValue(std::int64_t{9}));
}

TEST_F(ExtractionEngineTest, MultipleFieldWithOnlyRejectedValuesIsInvalid) {
  const Template tpl = makeTemplate(R"json({
    "template": {"name": "accounts"},
    "fields": {
      "bank_accounts": {"patterns": ["Konto:\\s*([A-Z]{2}[0-9 ]{26,32}[0-9])"],
                        "validator": "iban", "multiple": true, "required": true}
    }
  })json");

  const auto result = engine_.extract(
      "Konto: PL61 1090 1014 0000 0712 1981 2875\n", tpl);
  const ExtractedField* accounts = result.field("bank_accounts");
  ASSERT_NE(accounts, nullptr);
  EXPECT_EQ(accounts->status, FieldStatus::Invalid);
  EXPECT_TRUE(accounts->values.empty());
  EXPECT_FALSE(result.complete);
}

TEST_F(ExtractionEngineTest, KeywordMappingPicksFirstDeclaredKeyword) {
  const Template tpl = makeTemplate(R"json({
    "template": {"name": "kw"},
    "fields": {
      "currency": {"mapping": {"EUR": "EUR", "PLN": "PLN"}, "default": "PLN"},
      "payment_method": {"mapping": {"przelew": "transfer", "gotowka": "cash"},
                         "required": true}
    }
  })json");

  const auto euro = engine_.extract(
      "Kwota: 100,00 EUR (rownowartosc 430,00 PLN)\nZaplacono gotowka\n", tpl);
  EXPECT_EQ(euro.value("currency"), FieldValue(std::string("EUR")));
  EXPECT_EQ(euro.field("currency")->raw, "EUR");
  EXPECT_FALSE(euro.field("currency")->derived);
  EXPECT_EQ(euro.value("payment_method"), FieldValue(std::string("cash")));
  EXPECT_TRUE(euro.complete);

  const auto plain = engine_.extract("Kwota: 100,00\n", tpl);
  EXPECT_EQ(plain.value("currency"), FieldValue(std::string("PLN")));
  EXPECT_TRUE(plain.field("currency")->derived);
  const ExtractedField* method = plain.field("payment_method");
  EXPECT_EQ(method->status, FieldStatus::Missing);
  EXPECT_EQ(method->reason, "no keyword matched");
  EXPECT_FALSE(plain.complete);
}

TEST_F(ExtractionEngineTest, DateFallbackDerivesFromIssueDate) {
  const Template tpl = makeTemplate(R"json({
    "template": {"name": "due"},
    "fields": {
      "due_date": {"patterns": ["Termin:\\s*(\\S+)"], "type": "date",
                   "fallback": "add_days:14", "required": true},
      "sale_date": {"patterns": ["Data sprzedazy:\\s*(\\S+)"], "type": "date",
                    "fallback": "use_issue_date"},
      "issue_date": {"patterns": ["Data wystawienia:\\s*(\\S+)"], "type": "date"}
    }
  })json");

  const auto derived = engine_.extract("Data wystawienia: 2024-03-25\n", tpl);
  EXPECT_EQ(derived.value("due_date"), FieldValue(Date{2024, 4, 8}));
  EXPECT_TRUE(derived.field("due_date")->derived);
  EXPECT_EQ(derived.value("sale_date"), FieldValue(Date{2024, 3, 25}));
  EXPECT_TRUE(derived.complete);

  const auto explicitDue = engine_.extract(
      "Data wystawienia: 2024-03-25\nTermin: 2024-04-30\n", tpl);
  EXPECT_EQ(explicitDue.value("due_date"), FieldValue(Date{2024, 4, 30}));
  EXPECT_FALSE(explicitDue.field("due_date")->derived);

  const auto noIssue = engine_.extract("Faktura bez dat\n", tpl);
  const ExtractedField* due = noIssue.field("due_date");
  EXPECT_EQ(due->status, FieldStatus::Missing);
  EXPECT_NE(due->reason.find("fallback source 'issue_date'"), std::string::npos);
  EXPECT_FALSE(noIssue.complete);
}

TEST_F(ExtractionEngineTest, ExtractionIsIdempotent) {
  const auto first = engine_.extract(ifx::testing::kOrangeInvoiceText, orange_);
  const auto second = engine_.extract(ifx::testing::kOrangeInvoiceText, orange_);
  EXPECT_EQ(first, second);
}

TEST_F(ExtractionEngineTest, BlankDocumentIsRejected) {
  EXPECT_THROW(engine_.extract("", orange_), EmptyDocumentError);
  EXPECT_THROW(engine_.extract(" \n\t ", orange_), EmptyDocumentError);
}

TEST(FieldValueTest, RendersCanonicalText) {
  EXPECT_EQ(fieldValueToString(FieldValue(Date{2024, 3, 5})), "2024-03-05");
  EXPECT_EQ(fieldValueToString(FieldValue(Amount(7999))), "79.99");
  EXPECT_EQ(fieldValueToString(FieldValue(std::int64_t{42})), "42");
  EXPECT_EQ(fieldValueToString(FieldValue(std::string("FV/1"))), "FV/1");
}
