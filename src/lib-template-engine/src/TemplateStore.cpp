#include "ifx/TemplateStore.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "ifx/ValueCoercion.hpp"

namespace ifx {

TemplateStore::TemplateStore(std::vector<TemplatePtr> templates,
                             std::uint64_t generation)
    : templates_(std::move(templates)), generation_(generation) {
  for (const auto& tpl : templates_) {
    if (!tpl) {
      throw std::invalid_argument("TemplateStore: null template");
    }
  }

  std::sort(templates_.begin(), templates_.end(),
            [](const TemplatePtr& a, const TemplatePtr& b) {
              return a->id < b->id;
            });

  for (std::size_t i = 0; i < templates_.size(); ++i) {
    const auto& tpl = templates_[i];
    if (!byId_.emplace(tpl->id, i).second) {
      throw std::invalid_argument("TemplateStore: duplicate template id '" +
                                  tpl->id + "'");
    }
    byLocale_[tpl->locale].push_back(i);
  }
}

TemplateStore::TemplatePtr TemplateStore::find(const std::string& id) const {
  auto it = byId_.find(id);
  return it == byId_.end() ? nullptr : templates_[it->second];
}

std::vector<TemplateStore::TemplatePtr> TemplateStore::candidatesFor(
    const std::optional<std::string>& locale) const {
  if (!locale || locale->empty()) return templates_;

  const std::string wanted = toLowerAscii(*locale);
  std::vector<std::size_t> indices;
  for (const auto& key : {wanted, std::string()}) {
    if (auto it = byLocale_.find(key); it != byLocale_.end()) {
      indices.insert(indices.end(), it->second.begin(), it->second.end());
    }
  }
  std::sort(indices.begin(), indices.end());

  std::vector<TemplatePtr> result;
  result.reserve(indices.size());
  for (auto index : indices) result.push_back(templates_[index]);
  return result;
}

std::vector<TemplateStore::TemplatePtr> TemplateStore::issuerSpecific() const {
  std::vector<TemplatePtr> result;
  std::copy_if(templates_.begin(), templates_.end(), std::back_inserter(result),
               [](const TemplatePtr& tpl) { return !tpl->isGeneric(); });
  return result;
}

std::vector<TemplateStore::TemplatePtr> TemplateStore::generic() const {
  std::vector<TemplatePtr> result;
  std::copy_if(templates_.begin(), templates_.end(), std::back_inserter(result),
               [](const TemplatePtr& tpl) { return tpl->isGeneric(); });
  return result;
}

std::vector<std::string> TemplateStore::locales() const {
  std::vector<std::string> result;
  for (const auto& [locale, indices] : byLocale_) {
    if (!locale.empty()) result.push_back(locale);
  }
  return result;
}

}  // namespace ifx
