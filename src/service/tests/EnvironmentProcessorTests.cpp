#include <gtest/gtest.h>

#include <cstdlib>

#include "../include/enviromentprocessor.hpp"

class EnvironmentProcessorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    setenv("IFX_TEST_ROOT", "/srv/ifx", 1);
    unsetenv("IFX_TEST_UNSET");
  }
  void TearDown() override { unsetenv("IFX_TEST_ROOT"); }

  EnvironmentProcessor processor_;
};

TEST_F(EnvironmentProcessorTest, SubstitutesNestedStrings) {
  nlohmann::json config = {
      {"defaults",
       {{"template_sources",
         {{{"path", "$ENV{IFX_TEST_ROOT}/templates"}},
          {{"path", "$ENV{IFX_TEST_ROOT}/$ENV{IFX_TEST_ROOT}"}}}},
        {"priority", 5}}}};

  processor_.process(config);

  const auto &sources = config["defaults"]["template_sources"];
  EXPECT_EQ(sources[0]["path"], "/srv/ifx/templates");
  EXPECT_EQ(sources[1]["path"], "/srv/ifx//srv/ifx");
  EXPECT_EQ(config["defaults"]["priority"], 5);
}

TEST_F(EnvironmentProcessorTest, UnsetVariableStaysUnlessDefaultGiven) {
  EXPECT_EQ(processor_.resolve("$ENV{IFX_TEST_UNSET}/x"),
            "$ENV{IFX_TEST_UNSET}/x");
  EXPECT_EQ(processor_.resolve("$ENV{IFX_TEST_UNSET:-/tmp}/x"), "/tmp/x");
  EXPECT_EQ(processor_.resolve("$ENV{IFX_TEST_ROOT:-/tmp}"), "/srv/ifx");
}

TEST_F(EnvironmentProcessorTest, UnterminatedPatternIsLeftAlone) {
  EXPECT_EQ(processor_.resolve("$ENV{IFX_TEST_ROOT"), "$ENV{IFX_TEST_ROOT");
  EXPECT_EQ(processor_.resolve("plain"), "plain");
}
