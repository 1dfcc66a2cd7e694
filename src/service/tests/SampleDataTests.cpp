#include <gtest/gtest.h>

#include <string>

#include "../include/configloader.hpp"
#include "../include/configvalidator.hpp"
#include "../include/documentprocessor.hpp"
#include "../include/engine_settings.hpp"
#include "ifx/TemplateLoader.hpp"
#include "ifx/TemplateRegistry.hpp"

// Шаблоны и конфигурация из каталога репозитория
class SampleDataTest : public ::testing::Test {
 protected:
  static std::string sourcePath(const std::string &relative) {
    return std::string(IFX_SOURCE_DIR) + "/" + relative;
  }

  std::vector<ifx::TemplateSource> sources() const {
    return {{sourcePath("templates/generic"), "", false},
            {sourcePath("templates/pl"), "pl", false},
            {sourcePath("templates/ro"), "ro", false}};
  }
};

TEST_F(SampleDataTest, ShippedTemplatesLoadWithoutErrors) {
  ifx::TemplateLoader loader;
  const ifx::LoadReport report = loader.load(sources());

  EXPECT_TRUE(report.errors.empty());
  ASSERT_NE(report.store, nullptr);
  EXPECT_EQ(report.store->size(), 3u);
  EXPECT_NE(report.store->find("generic_pl"), nullptr);
  EXPECT_NE(report.store->find("orange_polska"), nullptr);
  EXPECT_NE(report.store->find("generic_ro"), nullptr);
}

TEST_F(SampleDataTest, ShippedConfigurationIsValid) {
  ConfigLoader loader;
  const nlohmann::json config = loader.loadFromFile(sourcePath("config/config.json"));

  ConfigValidator validator;
  EXPECT_TRUE(validator.validateRoot(config));
  for (const auto &[env, overrides] : config["environments"].items()) {
    nlohmann::json merged = config["defaults"];
    merged.merge_patch(overrides);
    EXPECT_NO_THROW(validator.validateMerged(merged)) << env;
  }
}

TEST_F(SampleDataTest, SampleInvoiceUsesDedicatedTemplate) {
  ifx::TemplateRegistry registry;
  registry.reload(sources());

  EngineSettings settings;
  settings.locale = "pl";
  DocumentProcessor processor(settings, registry);
  const DocumentReport report = processor.processFile(
      sourcePath("samples/orange_2024_03.txt"), std::nullopt);

  ASSERT_TRUE(report.match.has_value());
  EXPECT_EQ(report.match->templateId, "orange_polska");
  ASSERT_TRUE(report.result.has_value());
  EXPECT_TRUE(report.result->complete);
  EXPECT_EQ(report.result->value("payment_method"),
            ifx::FieldValue(std::string("transfer")));
  EXPECT_EQ(report.result->value("due_date"),
            ifx::FieldValue(ifx::Date{2024, 3, 29}));
  const ifx::ExtractedField *accounts = report.result->field("bank_account");
  ASSERT_NE(accounts, nullptr);
  EXPECT_EQ(accounts->values.size(), 1u);
  ASSERT_TRUE(report.fingerprint.has_value());
  EXPECT_EQ(report.fingerprint->value,
            "5260250995|FV/2024/03/0012|2024-03-15|79.99");
}

TEST_F(SampleDataTest, ShippedConfigurationLeavesLocaleOpen) {
  ConfigLoader loader;
  const nlohmann::json config = loader.loadFromFile(sourcePath("config/config.json"));

  for (const auto &[env, overrides] : config["environments"].items()) {
    nlohmann::json merged = config["defaults"];
    merged.merge_patch(overrides);
    const EngineSettings settings = EngineSettings::fromConfig(merged);
    EXPECT_FALSE(settings.effectiveLocale(std::nullopt).has_value()) << env;
    EXPECT_EQ(settings.effectiveLocale(std::string("ro")), "ro") << env;
  }
}

TEST_F(SampleDataTest, RomanianInvoiceWithoutLocaleUsesRomanianFallback) {
  ifx::TemplateRegistry registry;
  registry.reload(sources());

  DocumentProcessor processor(EngineSettings{}, registry);
  const DocumentReport report = processor.process(
      "ro.txt",
      "SC Exemplu SRL\n"
      "Cod fiscal: RO14399840\n"
      "Factura fiscala nr. EX-0042\n"
      "Data emiterii: 12.04.2024\n"
      "Total de plata: 1190,00 lei\n",
      std::nullopt);

  ASSERT_TRUE(report.match.has_value());
  EXPECT_EQ(report.match->templateId, "generic_ro");
  ASSERT_TRUE(report.result.has_value());
  EXPECT_TRUE(report.result->complete);
  EXPECT_EQ(report.result->value("currency"),
            ifx::FieldValue(std::string("RON")));
}
