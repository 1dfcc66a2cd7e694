#include <gtest/gtest.h>

#include "TempDir.hpp"
#include "TestTemplates.hpp"
#include "ifx/TemplateLoader.hpp"

using namespace ifx;
using ifx::testing::TempDir;

namespace {

std::string minimalTemplate(const std::string& header) {
  return "{\"template\": " + header +
         ", \"fields\": {\"invoice_id\": {\"patterns\": [\"nr\\\\s*(\\\\S+)\"]}}}";
}

}  // namespace

class TemplateLoaderTest : public ::testing::Test {
 protected:
  TempDir dir_{"ifx_loader"};
  TemplateLoader loader_;
};

TEST_F(TemplateLoaderTest, LoadsDirectoriesRecursively) {
  dir_.write("generic/generic_pl.json", ifx::testing::kGenericPl);
  dir_.write("pl/orange_polska.json", ifx::testing::kOrangePolska);
  dir_.write("pl/operators/play.json", minimalTemplate("{}"));
  dir_.write("pl/README.txt", "not a template");

  auto report = loader_.load({{dir_.path().string(), "pl", false}});

  ASSERT_TRUE(report.store);
  EXPECT_EQ(report.documentsSeen, 3u);
  EXPECT_TRUE(report.errors.empty());
  EXPECT_EQ(report.store->size(), 3u);
  EXPECT_NE(report.store->find("generic_pl"), nullptr);
  EXPECT_NE(report.store->find("orange_polska"), nullptr);

  auto derived = report.store->find("pl/operators/play");
  ASSERT_NE(derived, nullptr);
  EXPECT_EQ(derived->locale, "pl");
}

TEST_F(TemplateLoaderTest, MalformedDocumentDoesNotAbortLoad) {
  dir_.write("a_good.json", ifx::testing::kGenericPl);
  const std::string broken = dir_.write("b_broken.json", "{\"template\": {}}");
  dir_.write("c_good.json", ifx::testing::kOrangePolska);
  const std::string badPattern = dir_.write(
      "d_nested.json",
      "{\"template\": {}, \"fields\": {\"x\": {\"patterns\": [\"(a+)+\"]}}}");

  auto report = loader_.load({{dir_.path().string(), "", false}});

  EXPECT_EQ(report.store->size(), 2u);
  ASSERT_EQ(report.errors.size(), 2u);
  EXPECT_EQ(report.errors[0].path, broken);
  EXPECT_NE(report.errors[0].reason.find("fields"), std::string::npos);
  EXPECT_EQ(report.errors[1].path, badPattern);
  EXPECT_NE(report.errors[1].reason.find("nested"), std::string::npos);
}

TEST_F(TemplateLoaderTest, LaterSourceOverridesEarlierById) {
  const std::string builtin = dir_.write(
      "builtin/orange.json",
      minimalTemplate("{\"name\": \"orange_polska\", \"priority\": 10}"));
  const std::string custom = dir_.write(
      "custom/orange.json",
      minimalTemplate("{\"name\": \"orange_polska\", \"priority\": 90}"));

  auto report = loader_.load({{(dir_.path() / "builtin").string(), "pl", false},
                              {(dir_.path() / "custom").string(), "pl", false}});

  ASSERT_EQ(report.store->size(), 1u);
  auto tpl = report.store->find("orange_polska");
  ASSERT_NE(tpl, nullptr);
  EXPECT_EQ(tpl->priority, 90);
  EXPECT_EQ(tpl->sourcePath, custom);
  EXPECT_EQ(report.overridden, (std::vector<std::string>{"orange_polska"}));
}

TEST_F(TemplateLoaderTest, DocumentLocaleWinsOverSourceLocale) {
  dir_.write("ro/factura.json",
             minimalTemplate("{\"name\": \"factura\", \"locale\": \"RO\"}"));
  dir_.write("ro/plain.json", minimalTemplate("{\"name\": \"plain\"}"));

  auto report = loader_.load({{(dir_.path() / "ro").string(), "pl", false}});

  EXPECT_EQ(report.store->find("factura")->locale, "ro");
  EXPECT_EQ(report.store->find("plain")->locale, "pl");
}

TEST_F(TemplateLoaderTest, SingleFileSource) {
  const std::string file =
      dir_.write("only/generic_pl.json", ifx::testing::kGenericPl);
  auto report = loader_.load({{file, "", false}});
  EXPECT_EQ(report.store->size(), 1u);
}

TEST_F(TemplateLoaderTest, MissingSources) {
  dir_.write("pl/generic_pl.json", ifx::testing::kGenericPl);
  const std::string missing = (dir_.path() / "absent").string();

  auto report = loader_.load({{(dir_.path() / "pl").string(), "pl", false},
                              {missing, "", true}});
  EXPECT_TRUE(report.errors.empty());

  report = loader_.load({{(dir_.path() / "pl").string(), "pl", false},
                         {missing, "", false}});
  ASSERT_EQ(report.errors.size(), 1u);
  EXPECT_EQ(report.errors[0].path, missing);
  EXPECT_EQ(report.store->size(), 1u);
}

TEST_F(TemplateLoaderTest, ZeroUsableTemplatesIsFatal) {
  dir_.write("broken.json", "[]");
  dir_.write("empty_fields.json", "{\"template\": {}, \"fields\": {}}");

  try {
    loader_.load({{dir_.path().string(), "", false}});
    FAIL() << "expected StoreEmptyError";
  } catch (const StoreEmptyError& e) {
    EXPECT_EQ(e.errors().size(), 2u);
  }

  EXPECT_THROW(loader_.load({}), StoreEmptyError);
}

TEST_F(TemplateLoaderTest, GenerationGrowsWithEveryBuild) {
  dir_.write("generic_pl.json", ifx::testing::kGenericPl);
  auto first = loader_.load({{dir_.path().string(), "", false}});
  auto second = loader_.load({{dir_.path().string(), "", false}});
  EXPECT_LT(first.store->generation(), second.store->generation());
  EXPECT_EQ(loader_.generation(), second.store->generation());
}
