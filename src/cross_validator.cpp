#include <scribe/cross_validator.h>

#include <scribe/confidence_scorer.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <utility>

namespace scribe {
namespace {

std::string ShortName(std::string identifier) {
  if (identifier.size() > 2 &&
      identifier.compare(identifier.size() - 2, 2, "()") == 0) {
    identifier.resize(identifier.size() - 2);
  }
  const auto separator = identifier.rfind("::");
  if (separator != std::string::npos) {
    return identifier.substr(separator + 2);
  }
  const auto dot = identifier.rfind('.');
  return dot == std::string::npos ? identifier : identifier.substr(dot + 1);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char character) {
                   return static_cast<char>(std::tolower(character));
                 });
  return value;
}

std::string NarrativeText(const ChunkNarrative &narrative) {
  auto text = narrative.summary;
  for (const auto &behavior : narrative.behaviors) {
    text.push_back('\n');
    text.append(behavior);
  }
  return text;
}

bool Overlaps(const CodeEntity &entity, const ChunkNarrative &narrative) {
  return entity.file_path == narrative.file_path &&
         entity.line_start <= narrative.end_line &&
         narrative.start_line <= entity.line_end;
}

ValidatedEntity FromEntity(const CodeEntity &entity, ConfidenceScore score) {
  return ValidatedEntity{entity.name,       entity.kind,
                         entity.file_path,  entity.line_start,
                         entity.line_end,   std::move(score)};
}

} // namespace

std::vector<std::string> MentionedIdentifiers(const std::string &text) {
  std::vector<std::string> identifiers;
  std::size_t position = 0;
  while (true) {
    const auto open = text.find('`', position);
    if (open == std::string::npos) {
      break;
    }
    const auto close = text.find('`', open + 1);
    if (close == std::string::npos) {
      break;
    }
    const auto identifier = text.substr(open + 1, close - open - 1);
    const bool plausible =
        !identifier.empty() &&
        std::all_of(identifier.begin(), identifier.end(), [](char character) {
          return std::isalnum(static_cast<unsigned char>(character)) != 0 ||
                 character == '_' || character == ':' || character == '.' ||
                 character == '(' || character == ')';
        });
    if (plausible) {
      identifiers.push_back(identifier);
    }
    position = close + 1;
  }
  return identifiers;
}

std::vector<std::string> IdentifierWords(const std::string &identifier) {
  std::vector<std::string> words;
  std::string current;
  const auto flush = [&] {
    if (current.size() >= 3) {
      words.push_back(ToLower(current));
    }
    current.clear();
  };
  for (std::size_t i = 0; i < identifier.size(); ++i) {
    const auto character = static_cast<unsigned char>(identifier[i]);
    if (std::isalnum(character) == 0) {
      flush();
      continue;
    }
    if (std::isupper(character) != 0 && !current.empty()) {
      const auto previous = static_cast<unsigned char>(current.back());
      const bool next_is_lower =
          i + 1 < identifier.size() &&
          std::islower(static_cast<unsigned char>(identifier[i + 1])) != 0;
      if (std::islower(previous) != 0 || std::isdigit(previous) != 0 ||
          (std::isupper(previous) != 0 && next_is_lower)) {
        flush();
      }
    }
    current.push_back(static_cast<char>(character));
  }
  flush();
  return words;
}

ValidationResult CrossValidate(const StaticAnalysisResult &static_result,
                               const LlmAnalysisResult &llm_result) {
  std::map<std::string, std::vector<const ChunkNarrative *>> mentions;
  for (const auto &narrative : llm_result.narratives) {
    for (const auto &identifier :
         MentionedIdentifiers(NarrativeText(narrative))) {
      auto &where = mentions[ShortName(identifier)];
      if (std::find(where.begin(), where.end(), &narrative) == where.end()) {
        where.push_back(&narrative);
      }
    }
  }

  ValidationResult result;
  std::set<std::string> confirmed;
  for (const auto &entity : static_result.ast_forest.entities) {
    const auto name = ShortName(entity.name);
    const auto mentioned = mentions.find(name);
    if (mentioned != mentions.end()) {
      confirmed.insert(name);
      const bool same_file = std::any_of(
          mentioned->second.begin(), mentioned->second.end(),
          [&entity](const ChunkNarrative *narrative) {
            return narrative->file_path == entity.file_path;
          });
      if (same_file) {
        result.entities.push_back(FromEntity(
            entity, ScoreFinding(entity.name, true, true, Agreement::kHigh)));
      } else {
        result.entities.push_back(FromEntity(
            entity, ScoreFinding(entity.name, true, true, Agreement::kLow)));
        result.conflicts.push_back(
            "'" + entity.name + "' is defined in " + entity.file_path +
            " but described in " + mentioned->second.front()->file_path);
      }
      ++result.cross_validated_count;
      continue;
    }

    const auto words = IdentifierWords(name);
    const bool partially_described =
        !words.empty() &&
        std::any_of(llm_result.narratives.begin(), llm_result.narratives.end(),
                    [&](const ChunkNarrative &narrative) {
                      if (!Overlaps(entity, narrative)) {
                        return false;
                      }
                      const auto text = ToLower(NarrativeText(narrative));
                      return std::all_of(words.begin(), words.end(),
                                         [&text](const std::string &word) {
                                           return text.find(word) !=
                                                  std::string::npos;
                                         });
                    });
    if (partially_described) {
      result.entities.push_back(FromEntity(
          entity, ScoreFinding(entity.name, true, true, Agreement::kMedium)));
      ++result.cross_validated_count;
    } else {
      result.entities.push_back(
          FromEntity(entity, ScoreFinding(entity.name, true, false)));
      ++result.ast_only_count;
    }
  }

  std::set<std::pair<std::string, std::string>> reported;
  for (const auto &[name, narratives] : mentions) {
    if (confirmed.count(name) > 0) {
      continue;
    }
    for (const auto *narrative : narratives) {
      if (!reported.emplace(name, narrative->file_path).second) {
        continue;
      }
      result.entities.push_back(ValidatedEntity{
          name, "behavior", narrative->file_path, narrative->start_line,
          narrative->end_line, ScoreFinding(name, false, true)});
      ++result.llm_only_count;
    }
  }
  return result;
}

} // namespace scribe
