#include <scribe/clang_ast_parser.h>

#include <scribe/paths.h>

#include <clang-c/Index.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace scribe {
namespace {

struct IndexDeleter {
  void operator()(CXIndex index) const { clang_disposeIndex(index); }
};

struct UnitDeleter {
  void operator()(CXTranslationUnit unit) const {
    clang_disposeTranslationUnit(unit);
  }
};

using IndexHandle = std::unique_ptr<void, IndexDeleter>;
using UnitHandle =
    std::unique_ptr<std::remove_pointer_t<CXTranslationUnit>, UnitDeleter>;

std::string ToString(CXString value) {
  std::string text;
  if (const auto *cstr = clang_getCString(value); cstr != nullptr) {
    text = cstr;
  }
  clang_disposeString(value);
  return text;
}

struct SourceSpan {
  std::filesystem::path file;
  int line_start = 0;
  int line_end = 0;
};

std::optional<SourceSpan> SpanOf(CXCursor cursor) {
  const auto extent = clang_getCursorExtent(cursor);
  CXFile file{};
  unsigned start_line = 0;
  clang_getSpellingLocation(clang_getRangeStart(extent), &file, &start_line,
                            nullptr, nullptr);
  if (file == nullptr) {
    return std::nullopt;
  }
  unsigned end_line = 0;
  clang_getSpellingLocation(clang_getRangeEnd(extent), nullptr, &end_line,
                            nullptr, nullptr);
  const auto path = ToString(clang_getFileName(file));
  if (path.empty()) {
    return std::nullopt;
  }
  std::error_code error;
  auto canonical = std::filesystem::weakly_canonical(path, error);
  if (error) {
    canonical = std::filesystem::path(path).lexically_normal();
  }
  return SourceSpan{std::move(canonical), static_cast<int>(start_line),
                    static_cast<int>(std::max(start_line, end_line))};
}

std::string TypeName(CXType type) {
  return ToString(clang_getTypeSpelling(type));
}

std::string QualifiedName(CXCursor cursor) {
  if (clang_Cursor_isNull(cursor)) {
    return {};
  }
  const auto name = ToString(clang_getCursorSpelling(cursor));
  const auto parent = clang_getCursorSemanticParent(cursor);
  if (clang_Cursor_isNull(parent) ||
      clang_getCursorKind(parent) == CXCursor_TranslationUnit) {
    return name;
  }
  const auto parent_name = QualifiedName(parent);
  if (parent_name.empty()) {
    return name;
  }
  return name.empty() ? parent_name : parent_name + "::" + name;
}

std::string Signature(CXCursor cursor) {
  const auto kind = clang_getCursorKind(cursor);
  if (kind == CXCursor_FunctionDecl || kind == CXCursor_CXXMethod ||
      kind == CXCursor_Constructor || kind == CXCursor_FunctionTemplate) {
    const auto result_type = TypeName(clang_getCursorResultType(cursor));
    const auto display = ToString(clang_getCursorDisplayName(cursor));
    return result_type.empty() ? display : result_type + " " + display;
  }
  if (kind == CXCursor_VarDecl) {
    return ToString(clang_getCursorSpelling(cursor)) + ": " +
           TypeName(clang_getCursorType(cursor));
  }
  return ToString(clang_getCursorDisplayName(cursor));
}

const char *EntityKind(CXCursorKind kind) {
  switch (kind) {
  case CXCursor_FunctionDecl:
  case CXCursor_CXXMethod:
  case CXCursor_Constructor:
  case CXCursor_FunctionTemplate:
    return "function";
  case CXCursor_StructDecl:
  case CXCursor_ClassDecl:
  case CXCursor_EnumDecl:
    return "type";
  default:
    return nullptr;
  }
}

// Walks one translation unit. Entity definitions open a scope so that
// calls and fields can be attributed to their enclosing entity. An
// exception raised while visiting stops the walk and is rethrown by
// Collect once libclang has returned.
class ForestCollector {
public:
  ForestCollector(std::filesystem::path root, AstForest &forest,
                  std::unordered_set<std::string> &seen)
      : root_(std::move(root)), forest_(&forest), seen_(&seen) {}

  void Collect(CXTranslationUnit unit) {
    Visit(clang_getTranslationUnitCursor(unit));
    if (failure_) {
      std::rethrow_exception(failure_);
    }
  }

private:
  static CXChildVisitResult VisitChild(CXCursor child, CXCursor,
                                       CXClientData data) {
    auto *self = static_cast<ForestCollector *>(data);
    try {
      self->Visit(child);
    } catch (...) {
      self->failure_ = std::current_exception();
    }
    return self->failure_ ? CXChildVisit_Break : CXChildVisit_Continue;
  }

  void Visit(CXCursor cursor) {
    const auto kind = clang_getCursorKind(cursor);
    const auto span = SpanOf(cursor);
    const bool in_tree = span && IsWithin(span->file, root_);

    bool entered = false;
    if (in_tree) {
      const auto relative = RelativeTo(span->file, root_);
      if (const auto *entity_kind = EntityKind(kind);
          entity_kind != nullptr && clang_isCursorDefinition(cursor)) {
        const auto name = QualifiedName(cursor);
        if (!name.empty()) {
          AddEntity({name, entity_kind, relative, span->line_start,
                     span->line_end, Signature(cursor)});
          scopes_.push_back(name);
          entered = true;
        }
      } else if (kind == CXCursor_VarDecl && scopes_.empty() &&
                 clang_isCursorDefinition(cursor)) {
        AddEntity({QualifiedName(cursor), "variable", relative,
                   span->line_start, span->line_end, Signature(cursor)});
      } else if (kind == CXCursor_FieldDecl && !scopes_.empty()) {
        forest_->fields.push_back(
            {scopes_.back(), ToString(clang_getCursorSpelling(cursor)),
             TypeName(clang_getCursorType(cursor)), relative,
             span->line_start});
      } else if (kind == CXCursor_CallExpr && !scopes_.empty()) {
        AddCall(cursor, relative, span->line_start);
      }
    }

    clang_visitChildren(cursor, &ForestCollector::VisitChild, this);

    if (entered) {
      scopes_.pop_back();
    }
  }

  void AddEntity(CodeEntity entity) {
    const auto fingerprint = entity.kind + "|" + entity.name + "|" +
                             entity.file_path + "|" +
                             std::to_string(entity.line_start);
    if (seen_->insert(fingerprint).second) {
      forest_->entities.push_back(std::move(entity));
    }
  }

  void AddCall(CXCursor cursor, const std::string &file, int line) {
    auto callee = QualifiedName(clang_getCursorReferenced(cursor));
    if (callee.empty()) {
      callee = ToString(clang_getCursorDisplayName(cursor));
    }
    if (callee.empty()) {
      return;
    }
    const auto fingerprint = "call|" + scopes_.back() + "|" + callee + "|" +
                             file + "|" + std::to_string(line);
    if (seen_->insert(fingerprint).second) {
      forest_->calls.push_back({scopes_.back(), callee, file, line});
    }
  }

  std::filesystem::path root_;
  AstForest *forest_;
  std::unordered_set<std::string> *seen_;
  std::vector<std::string> scopes_;
  std::exception_ptr failure_;
};

std::vector<std::string> ArgumentsFor(const std::string &language,
                                      const std::filesystem::path &root,
                                      const std::vector<std::string> &extra) {
  std::vector<std::string> args;
  if (language == "c") {
    args = {"-x", "c", "-std=c11"};
  } else {
    args = {"-x", "c++", "-std=c++20"};
  }
  args.push_back("-I" + root.string());
  args.push_back("-I" + (root / "include").string());
  args.insert(args.end(), extra.begin(), extra.end());
  return args;
}

} // namespace

ClangAstParser::ClangAstParser(std::vector<std::string> extra_args,
                               std::shared_ptr<Logger> logger)
    : extra_args_(std::move(extra_args)),
      logger_(EnsureLogger(std::move(logger))) {}

AstForest ClangAstParser::Parse(const SourceTree &tree,
                                const LanguageMap &languages) {
  const auto root = std::filesystem::weakly_canonical(tree.root);
  AstForest forest;
  std::unordered_set<std::string> seen;

  const IndexHandle index(clang_createIndex(0, 0));
  for (const auto &[file, language] : languages.file_languages) {
    if (language != "c" && language != "cpp") {
      continue;
    }
    const auto path = (root / file).string();
    const auto args = ArgumentsFor(language, root, extra_args_);
    std::vector<const char *> arg_pointers;
    arg_pointers.reserve(args.size());
    for (const auto &arg : args) {
      arg_pointers.push_back(arg.c_str());
    }

    CXTranslationUnit raw_unit = nullptr;
    const auto error = clang_parseTranslationUnit2(
        index.get(), path.c_str(), arg_pointers.data(),
        static_cast<int>(arg_pointers.size()), nullptr, 0,
        CXTranslationUnit_KeepGoing, &raw_unit);
    const UnitHandle unit(raw_unit);
    if (error != CXError_Success || !unit) {
      logger_->Log(LogLevel::kWarn, "ast.parse.failed",
                   {{"file", file},
                    {"code", std::to_string(static_cast<int>(error))}});
      continue;
    }

    ForestCollector collector(root, forest, seen);
    try {
      collector.Collect(unit.get());
    } catch (const std::exception &ex) {
      logger_->Log(LogLevel::kError, "ast.visit.failed",
                   {{"file", file}, {"error", ex.what()}});
      throw;
    }
    ++forest.parsed_files;
  }

  logger_->Log(LogLevel::kInfo, "ast.parsed",
               {{"files", std::to_string(forest.parsed_files)},
                {"entities", std::to_string(forest.entities.size())},
                {"calls", std::to_string(forest.calls.size())}});
  return forest;
}

} // namespace scribe
