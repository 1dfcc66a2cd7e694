/**
 * @file Errors.hpp
 * @brief Ошибки загрузки шаблонов и обработки документов
 */
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace ifx {

/// Ошибка загрузки одного шаблона (не прерывает загрузку остальных)
struct LoadError {
  std::string path;
  std::string reason;
};

/// Некорректный документ шаблона; перехватывается загрузчиком и превращается в LoadError
class TemplateParseError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief После загрузки не осталось ни одного пригодного шаблона
 * @note Активное хранилище шаблонов при этом не заменяется
 */
class StoreEmptyError : public std::runtime_error {
 public:
  StoreEmptyError(const std::string& message, std::vector<LoadError> errors)
      : std::runtime_error(message), errors_(std::move(errors)) {}

  const std::vector<LoadError>& errors() const noexcept { return errors_; }

 private:
  std::vector<LoadError> errors_;
};

/// Пустой (или состоящий из пробелов) текст документа
class EmptyDocumentError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace ifx
