#include <scribe/result_store.h>

#include <scribe/escaping.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace scribe {
namespace {

std::string Quote(const std::string &value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

void WriteFile(const std::filesystem::path &path, const std::string &content) {
  std::ofstream stream(path, std::ios::trunc);
  if (!stream) {
    throw std::runtime_error("Unable to write result file: " + path.string());
  }
  stream << content;
  if (!stream) {
    throw std::runtime_error("Failed writing result file: " + path.string());
  }
}

} // namespace

std::string RenderSummaryJson(const RunResult &result) {
  std::ostringstream out;
  out << "{\n  \"project_id\": " << Quote(result.project_id)
      << ",\n  \"partial\": " << (result.partial ? "true" : "false")
      << ",\n  \"aborted\": " << (result.aborted ? "true" : "false")
      << ",\n  \"duration_ms\": " << result.total_duration_ms
      << ",\n  \"stages\": [";
  for (std::size_t i = 0; i < result.stages.size(); ++i) {
    const auto &stage = result.stages[i];
    out << (i == 0 ? "\n" : ",\n") << "    {\"name\": " << Quote(stage.name)
        << ", \"ok\": " << (stage.ok ? "true" : "false")
        << ", \"duration_ms\": " << stage.duration_ms << ", \"error\": "
        << (stage.error ? Quote(*stage.error) : std::string("null")) << "}";
  }
  out << (result.stages.empty() ? "]" : "\n  ]") << ",\n  \"sections\": [";
  for (std::size_t i = 0; i < result.sections.size(); ++i) {
    const auto &section = result.sections[i];
    out << (i == 0 ? "\n" : ",\n") << "    {\"name\": "
        << Quote(section.section_name) << ", \"title\": "
        << Quote(section.title) << ", \"confidence\": " << section.confidence
        << ", \"citations\": " << section.citations.size()
        << ", \"degraded\": " << (section.degraded ? "true" : "false")
        << ", \"gated\": " << (section.gated ? "true" : "false") << "}";
  }
  out << (result.sections.empty() ? "]" : "\n  ]");
  if (result.quality_report) {
    const auto &report = *result.quality_report;
    out << ",\n  \"quality\": {\"citations_checked\": "
        << report.citations_checked
        << ", \"citations_valid\": " << report.citations_valid
        << ", \"avg_confidence\": " << report.avg_confidence << "}";
  }
  out << "\n}\n";
  return out.str();
}

DirectoryResultStore::DirectoryResultStore(std::filesystem::path directory,
                                           std::shared_ptr<Logger> logger)
    : directory_(std::move(directory)),
      logger_(EnsureLogger(std::move(logger))) {}

std::filesystem::path
DirectoryResultStore::ProjectDirectory(const std::string &project_id) const {
  return directory_ / project_id;
}

void DirectoryResultStore::Persist(const RunResult &result) {
  const auto &id = result.project_id;
  if (id.empty() || id == "." || id == ".." ||
      id.find_first_of("/\\") != std::string::npos) {
    throw std::invalid_argument("Project id is not a valid directory name: " +
                                id);
  }
  const auto target = ProjectDirectory(result.project_id);
  std::filesystem::create_directories(target);
  for (const auto &section : result.sections) {
    WriteFile(target / (section.section_name + ".md"), section.content);
  }
  WriteFile(target / "summary.json", RenderSummaryJson(result));
  logger_->Log(LogLevel::kInfo, "results.persisted",
               {{"directory", target.string()},
                {"sections", std::to_string(result.sections.size())}});
}

} // namespace scribe
