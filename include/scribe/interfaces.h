#pragma once

#include <scribe/cancellation.h>
#include <scribe/models.h>

#include <string>
#include <vector>

namespace scribe {

class SourceResolver {
public:
  virtual ~SourceResolver() = default;
  virtual SourceTree Resolve(const std::string &repo_path,
                             const std::string &branch) = 0;
};

class LanguageDetector {
public:
  virtual ~LanguageDetector() = default;
  virtual LanguageMap Detect(const SourceTree &tree) = 0;
};

class Chunker {
public:
  virtual ~Chunker() = default;
  virtual ChunkedFiles Chunk(const SourceTree &tree,
                             const LanguageMap &languages) = 0;
};

class AstParser {
public:
  virtual ~AstParser() = default;
  virtual AstForest Parse(const SourceTree &tree,
                          const LanguageMap &languages) = 0;
};

class CallGraphBuilder {
public:
  virtual ~CallGraphBuilder() = default;
  virtual CallGraph Build(const AstForest &forest) = 0;
};

class DependencyExtractor {
public:
  virtual ~DependencyExtractor() = default;
  virtual DependencyGraph Extract(const AstForest &forest,
                                  const ChunkedFiles &chunks) = 0;
};

class SchemaExtractor {
public:
  virtual ~SchemaExtractor() = default;
  virtual SchemaMap Extract(const AstForest &forest) = 0;
};

class EndpointDiscoverer {
public:
  virtual ~EndpointDiscoverer() = default;
  virtual ApiEndpoints Discover(const AstForest &forest,
                                const ChunkedFiles &chunks) = 0;
};

struct ChunkAnalysisContext {
  std::string project_id;
  std::string trace_id;
  // Receives kRunning ticks with completed/total/percent.
  ProgressCallback on_progress;
  const CancellationToken *cancellation = nullptr;
};

class ChunkAnalyzer {
public:
  virtual ~ChunkAnalyzer() = default;
  virtual LlmAnalysisResult Analyze(const ChunkedFiles &chunks,
                                    const ChunkAnalysisContext &context) = 0;
};

class SectionGenerator {
public:
  virtual ~SectionGenerator() = default;
  virtual std::vector<std::string> SupportedSections() const = 0;
  virtual SectionOutput Generate(const std::string &section_name,
                                 const IntelligenceModel &model) = 0;
};

class ResultStore {
public:
  virtual ~ResultStore() = default;
  virtual void Persist(const RunResult &result) = 0;
};

} // namespace scribe
