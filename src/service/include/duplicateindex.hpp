#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "ifx/DuplicateFingerprinter.hpp"

/**
 * @class DuplicateIndex
 * @brief Ключи дубликатов, встреченные за время работы процесса
 *
 * @details Хранит первый документ для каждого ключа. Индекс живёт в памяти
 * и не сохраняется между запусками.
 */
class DuplicateIndex {
 public:
  /**
   * @brief Зарегистрировать документ
   * @param key Ключ дубликата
   * @param source Имя документа
   * @return Имя ранее зарегистрированного документа с тем же ключом или
   * nullopt, если ключ новый
   */
  std::optional<std::string> record(const ifx::DuplicateKey &key,
                                    const std::string &source);

  /// Первый документ с ключом, без регистрации
  std::optional<std::string> find(const ifx::DuplicateKey &key) const;

  std::size_t size() const;
  void clear();

 private:
  mutable std::mutex mutex_;
  std::map<ifx::DuplicateKey, std::string> firstSeen_;
};
