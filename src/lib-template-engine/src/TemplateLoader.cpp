#include "ifx/TemplateLoader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>

#include "ifx/compositelogger.hpp"

namespace fs = std::filesystem;

namespace ifx {

namespace {

bool isTemplateFile(const fs::path& path) {
  return path.extension() == ".json";
}

/// id по относительному пути без расширения: "pl/orange_polska"
std::string deriveId(const fs::path& root, const fs::path& file) {
  fs::path relative = file.lexically_relative(root);
  if (relative.empty() || relative.native().rfind("..", 0) == 0) {
    relative = file.filename();
  }
  relative.replace_extension();
  return relative.generic_string();
}

bool readDocument(const fs::path& file, const fs::path& root,
                  const TemplateSource& source,
                  std::vector<TemplateDocument>& documents,
                  std::vector<LoadError>& errors) {
  std::ifstream input(file);
  if (!input.is_open()) {
    errors.push_back({file.string(), "cannot open file"});
    return false;
  }
  std::stringstream buffer;
  buffer << input.rdbuf();

  TemplateDocument document;
  document.path = file.string();
  document.locale = source.locale;
  document.derivedId = deriveId(root, file);
  document.content = buffer.str();
  documents.push_back(std::move(document));
  return true;
}

}  // namespace

std::vector<TemplateDocument> TemplateLoader::collect(
    const std::vector<TemplateSource>& sources,
    std::vector<LoadError>& errors) {
  std::vector<TemplateDocument> documents;

  for (const auto& source : sources) {
    std::error_code ec;
    const fs::path root(source.path);

    if (!fs::exists(root, ec)) {
      if (source.optional) {
        CompositeLogger::instance().info("Optional template source missing: " +
                                         source.path);
      } else {
        CompositeLogger::instance().warning("Template source missing: " +
                                            source.path);
        errors.push_back({source.path, "template source does not exist"});
      }
      continue;
    }

    if (fs::is_regular_file(root, ec)) {
      readDocument(root, root.parent_path(), source, documents, errors);
      continue;
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      errors.push_back({source.path, "cannot list directory: " + ec.message()});
      continue;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        errors.push_back({source.path, "directory walk failed: " + ec.message()});
        break;
      }
      if (it->is_regular_file(ec) && isTemplateFile(it->path())) {
        files.push_back(it->path());
      }
    }
    std::sort(files.begin(), files.end());

    CompositeLogger::instance().debug("Template source " + source.path +
                                      ": " + std::to_string(files.size()) +
                                      " documents");
    for (const auto& file : files) {
      readDocument(file, root, source, documents, errors);
    }
  }

  return documents;
}

LoadReport TemplateLoader::load(const std::vector<TemplateSource>& sources) {
  std::vector<LoadError> errors;
  auto documents = collect(sources, errors);
  return build(documents, std::move(errors));
}

LoadReport TemplateLoader::build(const std::vector<TemplateDocument>& documents,
                                 std::vector<LoadError> errors) {
  auto& logger = CompositeLogger::instance();

  LoadReport report;
  report.documentsSeen = documents.size();

  std::vector<std::shared_ptr<const Template>> templates;
  std::unordered_map<std::string, std::size_t> positions;

  for (const auto& document : documents) {
    try {
      auto tpl = std::make_shared<const Template>(TemplateParser::parse(document));
      auto [it, inserted] = positions.emplace(tpl->id, templates.size());
      if (inserted) {
        templates.push_back(std::move(tpl));
      } else {
        logger.info("Template '" + tpl->id + "' from " +
                    templates[it->second]->sourcePath + " overridden by " +
                    document.path);
        report.overridden.push_back(tpl->id);
        templates[it->second] = std::move(tpl);
      }
    } catch (const TemplateParseError& e) {
      logger.warning("Skipping template " + document.path + ": " + e.what());
      errors.push_back({document.path, e.what()});
    }
  }

  if (templates.empty()) {
    logger.error("No usable templates among " +
                 std::to_string(documents.size()) + " documents");
    throw StoreEmptyError("No usable templates loaded (" +
                              std::to_string(errors.size()) + " errors)",
                          std::move(errors));
  }

  report.store = std::make_shared<const TemplateStore>(std::move(templates),
                                                       ++generation_);
  report.errors = std::move(errors);

  logger.info("Loaded " + std::to_string(report.store->size()) +
              " templates (generation " +
              std::to_string(report.store->generation()) + ", " +
              std::to_string(report.errors.size()) + " errors)");
  return report;
}

}  // namespace ifx
