#include <gtest/gtest.h>

#include "TestTemplates.hpp"
#include "ifx/TemplateStore.hpp"

using namespace ifx;
using ifx::testing::makeTemplate;

namespace {

std::shared_ptr<const Template> shared(const std::string& json) {
  return std::make_shared<const Template>(makeTemplate(json));
}

std::shared_ptr<const Template> plain(const std::string& name,
                                      const std::string& locale) {
  return shared("{\"template\": {\"name\": \"" + name + "\", \"locale\": \"" +
                locale + "\"}, \"fields\": {\"a\": {\"patterns\": [\"a\"]}}}");
}

}  // namespace

TEST(TemplateStoreTest, IndexesByIdAndLocale) {
  TemplateStore store({plain("ro_generic", "ro"), shared(ifx::testing::kOrangePolska),
                       plain("universal", ""), shared(ifx::testing::kGenericPl)},
                      7);

  EXPECT_EQ(store.size(), 4u);
  EXPECT_EQ(store.generation(), 7u);
  EXPECT_EQ(store.all().front()->id, "generic_pl");
  EXPECT_EQ(store.find("missing"), nullptr);
  EXPECT_EQ(store.locales(), (std::vector<std::string>{"pl", "ro"}));

  std::vector<std::string> ids;
  for (const auto& tpl : store.candidatesFor(std::string("PL"))) {
    ids.push_back(tpl->id);
  }
  EXPECT_EQ(ids, (std::vector<std::string>{"generic_pl", "orange_polska",
                                           "universal"}));
  EXPECT_EQ(store.candidatesFor(std::nullopt).size(), 4u);

  ASSERT_EQ(store.issuerSpecific().size(), 1u);
  EXPECT_EQ(store.issuerSpecific()[0]->id, "orange_polska");
  EXPECT_EQ(store.generic().size(), 3u);
}

TEST(TemplateStoreTest, RejectsDuplicateIdsAndNull) {
  EXPECT_THROW(TemplateStore({plain("a", ""), plain("a", "pl")}, 1),
               std::invalid_argument);
  EXPECT_THROW(TemplateStore({nullptr}, 1), std::invalid_argument);
}
