/**
 * @file TemplateLoader.hpp
 * @brief Загрузка шаблонов из упорядоченного списка источников
 *
 * @details Источник: каталог (рекурсивно, файлы *.json) или отдельный файл.
 * Ошибочный документ пропускается с записью LoadError, остальные
 * загружаются. При совпадении id побеждает шаблон из более позднего
 * источника: так пользовательские шаблоны перекрывают встроенные.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ifx/Errors.hpp"
#include "ifx/TemplateParser.hpp"
#include "ifx/TemplateStore.hpp"

namespace ifx {

/// Источник шаблонов
struct TemplateSource {
  std::string path;
  std::string locale;     ///< Локаль по умолчанию для документов источника
  bool optional = false;  ///< Отсутствующий необязательный источник не ошибка
};

/// Итог загрузки
struct LoadReport {
  std::shared_ptr<const TemplateStore> store;
  std::vector<LoadError> errors;
  std::size_t documentsSeen = 0;
  std::vector<std::string> overridden;  ///< id шаблонов, перекрытых позже
};

class TemplateLoader {
 public:
  /**
   * @brief Загрузить шаблоны из источников
   * @throw StoreEmptyError Если не загружено ни одного шаблона
   */
  LoadReport load(const std::vector<TemplateSource>& sources);

  /**
   * @brief Собрать хранилище из уже прочитанных документов
   * @param documents Документы в порядке приоритета источников
   * @param errors Ошибки, накопленные при чтении источников
   * @throw StoreEmptyError Если не загружено ни одного шаблона
   */
  LoadReport build(const std::vector<TemplateDocument>& documents,
                   std::vector<LoadError> errors = {});

  /// Прочитать документы из источников; ошибки чтения дописываются в errors
  static std::vector<TemplateDocument> collect(
      const std::vector<TemplateSource>& sources,
      std::vector<LoadError>& errors);

  /// Номер поколения последнего построенного хранилища
  std::uint64_t generation() const noexcept { return generation_; }

 private:
  std::uint64_t generation_ = 0;
};

}  // namespace ifx
