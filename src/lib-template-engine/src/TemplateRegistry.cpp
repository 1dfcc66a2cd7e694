#include "ifx/TemplateRegistry.hpp"

#include <stdexcept>

#include "ifx/compositelogger.hpp"

namespace ifx {

TemplateRegistry& TemplateRegistry::instance() {
  static TemplateRegistry registry;
  return registry;
}

std::shared_ptr<const TemplateStore> TemplateRegistry::snapshot() const {
  return std::atomic_load(&store_);
}

LoadReport TemplateRegistry::reload(const std::vector<TemplateSource>& sources) {
  std::lock_guard<std::mutex> lock(reloadMutex_);

  try {
    LoadReport report = loader_.load(sources);
    auto previous = std::atomic_exchange(&store_, report.store);
    CompositeLogger::instance().info(
        "Template store swapped: generation " +
        std::to_string(previous ? previous->generation() : 0) + " -> " +
        std::to_string(report.store->generation()));
    return report;
  } catch (const StoreEmptyError& e) {
    CompositeLogger::instance().error(std::string("Template reload failed, ") +
                                      (snapshot() ? "keeping previous store: "
                                                  : "no store active: ") +
                                      e.what());
    throw;
  }
}

void TemplateRegistry::install(std::shared_ptr<const TemplateStore> store) {
  if (!store) {
    throw std::invalid_argument("TemplateRegistry: cannot install null store");
  }
  std::lock_guard<std::mutex> lock(reloadMutex_);
  std::atomic_store(&store_, std::move(store));
}

}  // namespace ifx
