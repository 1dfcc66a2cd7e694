#include "ifx/MetricsCollector.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace ifx {

namespace {

bool isValidMetricName(const std::string& name) {
  if (name.empty()) return false;
  const auto first = static_cast<unsigned char>(name.front());
  if (!std::isalpha(first) && first != '_') return false;
  for (unsigned char c : name) {
    if (!std::isalnum(c) && c != '_') return false;
  }
  return true;
}

}  // namespace

MetricsCollector& MetricsCollector::instance() {
  static MetricsCollector instance;
  return instance;
}

void MetricsCollector::registerCounter(const std::string& name,
                                       const std::string& help) {
  if (!isValidMetricName(name)) {
    throw std::runtime_error("Invalid metric name: '" + name + "'");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (counters_.count(name)) {
    throw std::runtime_error("Metric already registered: " + name);
  }
  counters_[name].help = help;
}

void MetricsCollector::ensureCounter(const std::string& name,
                                     const std::string& help) {
  if (!isValidMetricName(name)) {
    throw std::runtime_error("Invalid metric name: '" + name + "'");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = counters_.try_emplace(name);
  if (inserted) {
    it->second.help = help;
  }
}

void MetricsCollector::incrementCounter(const std::string& name,
                                        std::uint64_t value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = counters_.find(name); it != counters_.end()) {
    it->second.value += value;
  }
}

std::uint64_t MetricsCollector::counterValue(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0 : it->second.value;
}

void MetricsCollector::recordTaskTime(const std::string& name,
                                      std::chrono::milliseconds duration) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& summary = summaries_[name];
  summary.sumMs += static_cast<std::uint64_t>(duration.count());
  summary.count += 1;
}

std::string MetricsCollector::exportPrometheus() const {
  std::ostringstream ss;
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto& [name, counter] : counters_) {
    if (!counter.help.empty()) {
      ss << "# HELP ifx_" << name << " " << counter.help << "\n";
    }
    ss << "# TYPE ifx_" << name << " counter\n";
    ss << "ifx_" << name << " " << counter.value << "\n";
  }

  for (const auto& [name, summary] : summaries_) {
    ss << "# TYPE ifx_" << name << "_ms summary\n";
    ss << "ifx_" << name << "_ms_sum " << summary.sumMs << "\n";
    ss << "ifx_" << name << "_ms_count " << summary.count << "\n";
  }

  return ss.str();
}

void MetricsCollector::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.clear();
  summaries_.clear();
}

}  // namespace ifx
