#include <gtest/gtest.h>

#include <vector>

#include "ifx/compositelogger.hpp"

namespace {

class RecordingLogger : public ifx::ILogger {
 public:
  ~RecordingLogger() override = default;
  void init(const ifx::LogLevel level) override { setLogLevel(level); }
  void flush() override { ++flushes; }

  std::vector<std::string> lines;
  int flushes = 0;

 protected:
  void log(ifx::LogLevel level, const std::string& message) override {
    if (shouldSkipLog(level)) return;
    lines.push_back(ifx::leveltoString(level) + ":" + message);
  }
};

}  // namespace

TEST(CompositeLoggerTest, FansOutToEveryLogger) {
  auto first = std::make_shared<RecordingLogger>();
  auto second = std::make_shared<RecordingLogger>();
  ifx::CompositeLogger composite{first, second};

  composite.info("reload finished");
  composite.flush();

  ASSERT_EQ(first->lines.size(), 1u);
  EXPECT_EQ(first->lines[0], "INFO:reload finished");
  EXPECT_EQ(second->lines, first->lines);
  EXPECT_EQ(second->flushes, 1);
}

TEST(CompositeLoggerTest, NestedLoggersFilterByTheirOwnLevel) {
  auto verbose = std::make_shared<RecordingLogger>();
  auto quiet = std::make_shared<RecordingLogger>();
  verbose->init(ifx::LogLevel::LOG_DEBUG);
  quiet->init(ifx::LogLevel::LOG_ERROR);

  ifx::CompositeLogger composite;
  composite.addLogger(verbose);
  composite.addLogger(quiet);

  composite.debug("candidate scored");
  composite.error("store empty");

  EXPECT_EQ(verbose->lines.size(), 2u);
  ASSERT_EQ(quiet->lines.size(), 1u);
  EXPECT_EQ(quiet->lines[0], "ERROR:store empty");
}

TEST(CompositeLoggerTest, ClearDropsLoggers) {
  auto sink = std::make_shared<RecordingLogger>();
  ifx::CompositeLogger composite{sink};
  EXPECT_EQ(composite.size(), 1u);

  composite.clear();
  composite.critical("nobody listens");

  EXPECT_EQ(composite.size(), 0u);
  EXPECT_TRUE(sink->lines.empty());
}
