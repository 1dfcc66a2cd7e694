#include "../include/enviromentprocessor.hpp"

#include <cstdlib>

using namespace std;

void EnvironmentProcessor::process(nlohmann::json &config) const {
  walkJson(config, [this](string &value) { value = resolve(value); });
}

void EnvironmentProcessor::walkJson(
    nlohmann::json &node, const function<void(string &)> &func) const {
  if (node.is_object() || node.is_array()) {
    for (auto &child : node) {
      walkJson(child, func);
    }
  } else if (node.is_string()) {
    string str = node.get<string>();
    func(str);
    node = str;
  }
}

string EnvironmentProcessor::resolve(const string &value) const {
  const string prefix = "$ENV{";
  const string defaultMarker = ":-";

  string result = value;
  size_t start_pos = 0;

  while ((start_pos = result.find(prefix, start_pos)) != string::npos) {
    size_t end_pos = result.find('}', start_pos + prefix.length());
    if (end_pos == string::npos) break;

    string expr = result.substr(start_pos + prefix.length(),
                                end_pos - start_pos - prefix.length());
    string var_name = expr;
    const string *fallback = nullptr;
    string fallbackValue;
    if (size_t marker = expr.find(defaultMarker); marker != string::npos) {
      var_name = expr.substr(0, marker);
      fallbackValue = expr.substr(marker + defaultMarker.length());
      fallback = &fallbackValue;
    }

    const char *env_val = var_name.empty() ? nullptr : getenv(var_name.c_str());
    if (env_val != nullptr || fallback != nullptr) {
      const string replacement = env_val != nullptr ? string(env_val) : *fallback;
      result.replace(start_pos, end_pos - start_pos + 1, replacement);
      start_pos += replacement.length();
    } else {
      start_pos = end_pos + 1;
    }
  }
  return result;
}
