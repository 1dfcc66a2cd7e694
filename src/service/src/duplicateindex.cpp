#include "../include/duplicateindex.hpp"

std::optional<std::string> DuplicateIndex::record(const ifx::DuplicateKey &key,
                                                  const std::string &source) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = firstSeen_.emplace(key, source);
  if (inserted) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> DuplicateIndex::find(
    const ifx::DuplicateKey &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = firstSeen_.find(key);
  if (it == firstSeen_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t DuplicateIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return firstSeen_.size();
}

void DuplicateIndex::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  firstSeen_.clear();
}
