/**
 * @file TemplateStore.hpp
 * @brief Неизменяемое хранилище загруженных шаблонов
 *
 * @details Хранилище строится TemplateLoader'ом целиком и после создания
 * не меняется. Перезагрузка создаёт новое хранилище, которое
 * TemplateRegistry подменяет атомарно.
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ifx/Template.hpp"

namespace ifx {

class TemplateStore {
 public:
  using TemplatePtr = std::shared_ptr<const Template>;

  /**
   * @param templates Шаблоны с уникальными id
   * @param generation Номер поколения (растёт при каждой перезагрузке)
   * @throw std::invalid_argument При пустом указателе или повторе id
   */
  TemplateStore(std::vector<TemplatePtr> templates, std::uint64_t generation);

  /// Шаблон по id или nullptr
  TemplatePtr find(const std::string& id) const;

  /// Все шаблоны, упорядоченные по id
  const std::vector<TemplatePtr>& all() const noexcept { return templates_; }

  /**
   * @brief Кандидаты для сопоставления
   * @return Шаблоны указанной локали и шаблоны без локали; без подсказки все
   */
  std::vector<TemplatePtr> candidatesFor(
      const std::optional<std::string>& locale) const;

  std::vector<TemplatePtr> issuerSpecific() const;
  std::vector<TemplatePtr> generic() const;

  /// Локали, для которых есть хотя бы один шаблон
  std::vector<std::string> locales() const;

  std::size_t size() const noexcept { return templates_.size(); }
  bool empty() const noexcept { return templates_.empty(); }
  std::uint64_t generation() const noexcept { return generation_; }

 private:
  std::vector<TemplatePtr> templates_;
  std::unordered_map<std::string, std::size_t> byId_;
  std::map<std::string, std::vector<std::size_t>> byLocale_;
  std::uint64_t generation_;
};

}  // namespace ifx
