#include "ifx/DuplicateFingerprinter.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ifx {

std::string DuplicateKey::digest() const {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context");
  }

  const EVP_MD *md = EVP_sha256();
  const auto hashSize = static_cast<unsigned int>(EVP_MD_size(md));

  if (EVP_DigestInit_ex(mdctx, md, nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx, value.data(), value.size()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(mdctx, hash, &len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }
  EVP_MD_CTX_free(mdctx);

  if (len != hashSize) {
    throw std::runtime_error("Invalid SHA256 digest length");
  }

  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < len; ++i) {
    ss << std::setw(2) << static_cast<int>(hash[i]);
  }
  return ss.str();
}

DuplicateFingerprinter::DuplicateFingerprinter(FingerprintFields fields)
    : fields_(std::move(fields)) {}

std::string DuplicateFingerprinter::normalizeFiscalId(std::string_view raw) {
  std::string compact;
  for (char c : raw) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) compact.push_back(static_cast<char>(std::toupper(uc)));
  }
  if (compact.size() > 2 && std::isalpha(static_cast<unsigned char>(compact[0])) &&
      std::isalpha(static_cast<unsigned char>(compact[1])) &&
      std::isdigit(static_cast<unsigned char>(compact[2]))) {
    compact.erase(0, 2);
  }
  return compact;
}

std::string DuplicateFingerprinter::normalizeDocumentNumber(
    std::string_view raw) {
  std::string normalized = normalizeText(raw);
  for (char& c : normalized) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc < 0x80) c = static_cast<char>(std::toupper(uc));
  }
  return normalized;
}

std::optional<DuplicateKey> DuplicateFingerprinter::fingerprint(
    const ExtractionResult& result) const {
  const auto fiscal = result.value(fields_.fiscalId);
  const auto number = result.value(fields_.documentNumber);
  const auto date = result.value(fields_.documentDate);
  const auto amount = result.value(fields_.grossAmount);
  if (!fiscal || !number || !date || !amount) return std::nullopt;

  const auto* fiscalText = std::get_if<std::string>(&*fiscal);
  const auto* issued = std::get_if<Date>(&*date);
  const auto* gross = std::get_if<Amount>(&*amount);
  if (!fiscalText || !issued || !gross) return std::nullopt;

  std::string numberText;
  if (const auto* text = std::get_if<std::string>(&*number)) {
    numberText = normalizeDocumentNumber(*text);
  } else if (const auto* integer = std::get_if<std::int64_t>(&*number)) {
    numberText = std::to_string(*integer);
  } else {
    return std::nullopt;
  }

  const std::string fiscalId = normalizeFiscalId(*fiscalText);
  if (fiscalId.empty() || numberText.empty()) return std::nullopt;

  return DuplicateKey{fiscalId + "|" + numberText + "|" + issued->toIso() +
                      "|" + gross->toString()};
}

}  // namespace ifx
