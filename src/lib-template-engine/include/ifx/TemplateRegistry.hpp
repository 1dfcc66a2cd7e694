/**
 * @file TemplateRegistry.hpp
 * @brief Активное хранилище шаблонов с горячей перезагрузкой
 *
 * @details Читатели получают снимок (shared_ptr на неизменяемое
 * хранилище) без блокировок и работают с ним до конца обработки
 * документа. Перезагрузка строит новое хранилище целиком и подменяет
 * указатель атомарно, поэтому читатель видит либо старый, либо новый
 * набор шаблонов, но никогда их смесь.
 */
#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "ifx/TemplateLoader.hpp"

namespace ifx {

/**
 * @class TemplateRegistry
 * @brief Владелец активного TemplateStore
 *
 * @note Перезагрузки сериализуются мьютексом; чтение снимка от него не зависит
 */
class TemplateRegistry {
 public:
  TemplateRegistry() = default;

  /// Экземпляр, используемый сервисом
  static TemplateRegistry& instance();

  /// Текущий снимок или nullptr, если шаблоны ещё не загружались
  std::shared_ptr<const TemplateStore> snapshot() const;

  /**
   * @brief Загрузить шаблоны и атомарно заменить активное хранилище
   * @throw StoreEmptyError Если новых шаблонов нет; прежнее хранилище остаётся
   *
   * @code
   * auto report = registry.reload(sources);
   * for (const auto& error : report.errors) { ... }
   * @endcode
   */
  LoadReport reload(const std::vector<TemplateSource>& sources);

  /// Установить готовое хранилище (тесты, встраивание)
  void install(std::shared_ptr<const TemplateStore> store);

  bool hasStore() const { return snapshot() != nullptr; }

  TemplateRegistry(const TemplateRegistry&) = delete;
  TemplateRegistry& operator=(const TemplateRegistry&) = delete;

 private:
  std::shared_ptr<const TemplateStore> store_;
  std::mutex reloadMutex_;
  TemplateLoader loader_;
};

}  // namespace ifx
