/**
 * @file DuplicateFingerprinter.hpp
 * @brief Ключ для поиска повторно обработанных документов
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ifx/ExtractionEngine.hpp"

namespace ifx {

/// Имена полей, из которых собирается ключ
struct FingerprintFields {
  std::string fiscalId = "supplier_tax_id";
  std::string documentNumber = "invoice_id";
  std::string documentDate = "issue_date";
  std::string grossAmount = "total_gross";
};

/**
 * @struct DuplicateKey
 * @brief Нормализованный ключ "5260250995|FV/2024/001|2024-03-15|1230.00"
 */
struct DuplicateKey {
  std::string value;

  /**
   * @brief SHA-256 ключа (OpenSSL EVP), 64 шестнадцатеричных символа
   * @throw std::runtime_error При ошибке OpenSSL
   */
  std::string digest() const;

  bool operator==(const DuplicateKey& other) const {
    return value == other.value;
  }
  bool operator!=(const DuplicateKey& other) const {
    return value != other.value;
  }
  bool operator<(const DuplicateKey& other) const {
    return value < other.value;
  }
};

class DuplicateFingerprinter {
 public:
  explicit DuplicateFingerprinter(FingerprintFields fields = {});

  /**
   * @brief Построить ключ
   * @return nullopt (Incomplete), если хотя бы одно из четырёх полей
   * отсутствует или имеет неподходящий тип
   */
  std::optional<DuplicateKey> fingerprint(const ExtractionResult& result) const;

  /// Буквы и цифры в верхнем регистре без двухбуквенного префикса страны
  static std::string normalizeFiscalId(std::string_view raw);

  /// Схлопнутые пробелы, верхний регистр
  static std::string normalizeDocumentNumber(std::string_view raw);

  const FingerprintFields& fields() const noexcept { return fields_; }

 private:
  FingerprintFields fields_;
};

}  // namespace ifx
