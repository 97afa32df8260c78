#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace scribe {

enum class StageProgress { kRunning, kDone, kError };

std::string ToString(StageProgress status);

// Transient progress record. A stage emits one kRunning event, zero or
// more progress ticks, then one terminal event.
struct StageEvent {
  std::string name;
  StageProgress status = StageProgress::kRunning;
  std::string message;
  double duration_ms = 0.0;
  std::optional<int> completed;
  std::optional<int> total;
  std::optional<double> percent;
};

using ProgressCallback = std::function<void(const StageEvent &)>;

struct StageStatus {
  std::string name;
  bool ok = false;
  double duration_ms = 0.0;
  std::optional<std::string> error;
};

// line_start >= 1 and line_end >= line_start are expected but only
// checked when the citation is verified against a source tree.
struct Citation {
  std::string file_path;
  std::optional<std::string> function_name;
  int line_start = 1;
  int line_end = 1;
  double confidence = 0.0;
};

enum class AnalysisSource { kAst, kLlm, kCrossValidated };

std::string ToString(AnalysisSource source);

struct ConfidenceScore {
  double value = 0.0;
  AnalysisSource source = AnalysisSource::kLlm;
  std::string explanation;
};

struct GuardrailResult {
  std::string check_name;
  bool passed = false;
  std::optional<std::string> reason;
};

struct SourceTree {
  std::string root;
  std::string branch;
  // Relative, '/' separated, sorted.
  std::vector<std::string> files;
};

struct LanguageMap {
  // Relative path -> language name.
  std::map<std::string, std::string> file_languages;
  // Language name -> file count.
  std::map<std::string, int> language_counts;
};

struct CodeChunk {
  std::string file_path;
  std::string language;
  int start_line = 1;
  int end_line = 1;
  std::string content;
};

struct ChunkedFiles {
  std::vector<CodeChunk> chunks;
  int total_files = 0;
};

struct CodeEntity {
  std::string name;
  std::string kind;
  std::string file_path;
  int line_start = 1;
  int line_end = 1;
  std::string signature;
};

struct CallSite {
  std::string caller;
  std::string callee;
  std::string file_path;
  int line = 0;
};

struct FieldDeclaration {
  std::string owner;
  std::string name;
  std::string type;
  std::string file_path;
  int line = 0;
};

struct AstForest {
  std::vector<CodeEntity> entities;
  std::vector<CallSite> calls;
  std::vector<FieldDeclaration> fields;
  int parsed_files = 0;
};

struct CallGraph {
  struct Edge {
    std::string caller;
    std::string callee;
    std::string file_path;
    int line = 0;
  };
  std::vector<Edge> edges;
};

struct DependencyGraph {
  struct Import {
    std::string source_file;
    std::string target;
    int line = 0;
  };
  std::vector<Import> imports;
};

struct SchemaMap {
  struct Schema {
    std::string name;
    std::string file_path;
    int line_start = 1;
    int line_end = 1;
    std::vector<std::pair<std::string, std::string>> fields;
  };
  std::vector<Schema> schemas;
};

struct ApiEndpoints {
  struct Endpoint {
    std::string method;
    std::string path;
    std::string file_path;
    int line = 0;
  };
  std::vector<Endpoint> endpoints;
};

struct StaticAnalysisResult {
  AstForest ast_forest;
  CallGraph call_graph;
  DependencyGraph dependency_graph;
  SchemaMap schema_map;
  ApiEndpoints api_endpoints;
};

struct ChunkNarrative {
  std::string file_path;
  int start_line = 1;
  int end_line = 1;
  std::string summary;
  std::vector<std::string> behaviors;
};

struct LlmAnalysisResult {
  std::vector<ChunkNarrative> narratives;
  int analyzed_chunks = 0;
  int resumed_chunks = 0;
  int failed_chunks = 0;
};

struct ValidatedEntity {
  std::string name;
  std::string kind;
  std::string file_path;
  int line_start = 1;
  int line_end = 1;
  ConfidenceScore confidence;
};

struct ValidationResult {
  std::vector<ValidatedEntity> entities;
  std::vector<std::string> conflicts;
  int cross_validated_count = 0;
  int ast_only_count = 0;
  int llm_only_count = 0;
};

struct IntelligenceModel {
  std::string project_id;
  std::vector<ValidatedEntity> entities;
  CallGraph call_graph;
  DependencyGraph dependency_graph;
  SchemaMap schema_map;
  ApiEndpoints api_endpoints;
  std::vector<ChunkNarrative> narratives;
  std::map<std::string, int> language_counts;
};

struct SectionOutput {
  std::string section_name;
  std::string title;
  std::string content;
  double confidence = 0.0;
  std::vector<Citation> citations;
  bool degraded = false;
  bool gated = false;
};

struct QualityReport {
  std::vector<GuardrailResult> guardrail_results;
  int citations_checked = 0;
  int citations_valid = 0;
  double avg_confidence = 0.0;
};

struct RunResult {
  std::string project_id;
  std::vector<StageStatus> stages;
  std::vector<SectionOutput> sections;
  std::optional<IntelligenceModel> model;
  std::optional<QualityReport> quality_report;
  double total_duration_ms = 0.0;
  // Some non-foundational stage failed.
  bool partial = false;
  // A foundational stage failed and later stages were not attempted.
  bool aborted = false;

  std::vector<std::string> SucceededStages() const;
  std::vector<std::string> FailedStages() const;
};

} // namespace scribe
