#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../include/documentprocessor.hpp"
#include "TestTemplates.hpp"
#include "ifx/compositelogger.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;

namespace {

class MockLogger : public ifx::ILogger {
 public:
  MOCK_METHOD(void, init, (const ifx::LogLevel level), (override));
  MOCK_METHOD(void, flush, (), (override));
  MOCK_METHOD(void, log, (ifx::LogLevel level, const std::string &message),
              (override));
};

}  // namespace

class DocumentProcessorLoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ifx::CompositeLogger::instance().clear();
    ifx::CompositeLogger::instance().addLogger(logger_);
    EXPECT_CALL(*logger_, log(_, _)).Times(AnyNumber());

    registry_.install(std::make_shared<const ifx::TemplateStore>(
        std::vector<ifx::TemplateStore::TemplatePtr>{
            std::make_shared<const ifx::Template>(
                ifx::testing::makeTemplate(ifx::testing::kOrangePolska))},
        1));
  }

  void TearDown() override { ifx::CompositeLogger::instance().clear(); }

  std::shared_ptr<MockLogger> logger_ = std::make_shared<MockLogger>();
  ifx::TemplateRegistry registry_;
  EngineSettings settings_;
};

TEST_F(DocumentProcessorLoggingTest, DuplicateIsReportedAsWarning) {
  EXPECT_CALL(*logger_, log(ifx::LogLevel::LOG_WARNING,
                            HasSubstr("second.txt duplicates first.txt")))
      .Times(1);

  DocumentProcessor processor(settings_, registry_);
  processor.process("first.txt", ifx::testing::kOrangeInvoiceText,
                    std::string("pl"));
  processor.process("second.txt", ifx::testing::kOrangeInvoiceText,
                    std::string("pl"));
}

TEST_F(DocumentProcessorLoggingTest, UnmatchedDocumentIsReportedAsInfo) {
  EXPECT_CALL(*logger_, log(ifx::LogLevel::LOG_INFO,
                            HasSubstr("acme.txt: no template matched")))
      .Times(1);

  DocumentProcessor processor(settings_, registry_);
  processor.process("acme.txt", ifx::testing::kUnknownIssuerText,
                    std::string("pl"));
}
