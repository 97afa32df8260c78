#pragma once

#include <scribe/models.h>

#include <string>
#include <vector>

namespace scribe {

// Identifiers wrapped in backticks, in order of appearance.
std::vector<std::string> MentionedIdentifiers(const std::string &text);

// Lower case words of an identifier: "parseHttpRequest" and
// "parse_http_request" both give {"parse", "http", "request"}. Words shorter
// than three characters are dropped.
std::vector<std::string> IdentifierWords(const std::string &identifier);

// Compares AST entities against chunk narratives and scores each finding:
//  - mentioned in a narrative of the same file: cross-validated, high
//  - every name word appears in an overlapping narrative: medium
//  - mentioned only in narratives of other files: low, recorded as conflict
//  - not mentioned at all: AST-only
// Mentioned identifiers with no AST entity become LLM-only findings.
ValidationResult CrossValidate(const StaticAnalysisResult &static_result,
                               const LlmAnalysisResult &llm_result);

} // namespace scribe
