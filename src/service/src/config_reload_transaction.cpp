#include "../include/config_reload_transaction.hpp"

#include "ifx/compositelogger.hpp"

ConfigReloadTransaction::ConfigReloadTransaction(
    ConfigManager &configMgr, std::string environment,
    ifx::TemplateRegistry &registry)
    : configMgr_(configMgr),
      environment_(std::move(environment)),
      registry_(registry) {}

ConfigReloadTransaction::~ConfigReloadTransaction() {
  if (active_) {
    try {
      rollback();
    } catch (const std::exception &e) {
      ifx::CompositeLogger::instance().error(
          "ConfigReloadTransaction: rollback failed: " + std::string(e.what()));
    }
  }
}

void ConfigReloadTransaction::begin() {
  if (active_) {
    throw std::runtime_error("Transaction already active");
  }
  std::lock_guard lock(configMgr_.configMutex_);
  backup_ = configMgr_.baseConfig_;
  active_ = true;
  ifx::CompositeLogger::instance().debug(
      "ConfigReloadTransaction: backup created");
}

void ConfigReloadTransaction::commit() {
  if (!active_) {
    throw std::runtime_error("No active transaction");
  }
  active_ = false;
  backup_ = nullptr;
  ifx::CompositeLogger::instance().debug("ConfigReloadTransaction: committed");
}

void ConfigReloadTransaction::rollback() {
  if (!active_) {
    throw std::runtime_error("No active transaction");
  }
  {
    std::lock_guard lock(configMgr_.configMutex_);
    configMgr_.baseConfig_ = backup_;
    configMgr_.cache_.clearAll();
  }
  active_ = false;
  ifx::CompositeLogger::instance().info("ConfigReloadTransaction: rolled back");
}

ReloadOutcome ConfigReloadTransaction::reload() {
  begin();
  try {
    configMgr_.reload();
    EngineSettings settings =
        EngineSettings::fromConfig(configMgr_.getMergedConfig(environment_));
    ifx::LoadReport report = registry_.reload(settings.templateSources);
    commit();
    ifx::CompositeLogger::instance().info(
        "ConfigReloadTransaction: reload successful, " +
        std::to_string(report.store->size()) + " templates active");
    return ReloadOutcome{std::move(settings), std::move(report)};
  } catch (const std::exception &e) {
    ifx::CompositeLogger::instance().warning(
        "ConfigReloadTransaction: reload failed, rolling back: " +
        std::string(e.what()));
    rollback();
    throw;
  }
}
