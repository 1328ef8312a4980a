#include "pkgdriver/golang/go_source_scanner.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include <fmt/format.h>

namespace pkgdriver::golang {

namespace {

// Minimal lexer over the header section of a Go file
class HeaderLexer {
 public:
  explicit HeaderLexer(std::string_view source) : source_(source) {
  }

  // Skip whitespace, semicolons and comments
  auto SkipTrivia() -> std::expected<void, std::string> {
    while (pos_ < source_.size()) {
      char c = source_[pos_];
      if (std::isspace(static_cast<unsigned char>(c)) != 0 || c == ';') {
        ++pos_;
      } else if (source_.substr(pos_, 2) == "//") {
        auto end = source_.find('\n', pos_);
        pos_ = end == std::string_view::npos ? source_.size() : end + 1;
      } else if (source_.substr(pos_, 2) == "/*") {
        auto end = source_.find("*/", pos_ + 2);
        if (end == std::string_view::npos) {
          return std::unexpected("unterminated block comment");
        }
        pos_ = end + 2;
      } else {
        break;
      }
    }
    return {};
  }

  [[nodiscard]] auto Peek() const -> char {
    return pos_ < source_.size() ? source_[pos_] : '\0';
  }

  void Advance() {
    ++pos_;
  }

  // Identifier, or empty when the next token is not one
  auto ReadIdentifier() -> std::string_view {
    size_t start = pos_;
    while (pos_ < source_.size() &&
           (std::isalnum(static_cast<unsigned char>(source_[pos_])) != 0 ||
            source_[pos_] == '_' ||
            static_cast<unsigned char>(source_[pos_]) >= 0x80)) {
      ++pos_;
    }
    return source_.substr(start, pos_ - start);
  }

  // Interpreted ("...") or raw (`...`) string literal, unquoted
  auto ReadString() -> std::expected<std::string, std::string> {
    char quote = Peek();
    if (quote != '"' && quote != '`') {
      return std::unexpected("expected import path");
    }
    ++pos_;

    std::string value;
    while (pos_ < source_.size()) {
      char c = source_[pos_++];
      if (c == quote) {
        return value;
      }
      if (quote == '"' && c == '\n') {
        break;
      }
      if (quote == '"' && c == '\\' && pos_ < source_.size()) {
        c = source_[pos_++];
      }
      value += c;
    }
    return std::unexpected("unterminated import path");
  }

  // Remember a position to roll back to when a lookahead fails
  [[nodiscard]] auto Mark() const -> size_t {
    return pos_;
  }

  void Reset(size_t mark) {
    pos_ = mark;
  }

 private:
  std::string_view source_;
  size_t pos_ = 0;
};

// ImportSpec = [ "." | "_" | identifier ] ImportPath
auto ReadImportSpec(HeaderLexer& lexer)
    -> std::expected<std::string, std::string> {
  if (lexer.Peek() == '.') {
    lexer.Advance();
  } else {
    lexer.ReadIdentifier();
  }
  if (auto skipped = lexer.SkipTrivia(); !skipped) {
    return std::unexpected(skipped.error());
  }
  return lexer.ReadString();
}

}  // namespace

GoSourceScanner::GoSourceScanner(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto GoSourceScanner::ScanFile(const std::filesystem::path& path) const
    -> std::expected<GoFileHeader, DriverError> {
  std::ifstream file(path);
  if (!file) {
    logger_->error("GoSourceScanner failed to open: {}", path.string());
    return DriverError::Unexpected(
        DriverErrorCode::FileNotFound, path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto header = ParseHeader(buffer.str());
  if (!header) {
    logger_->error(
        "GoSourceScanner failed to parse {}: {}", path.string(),
        header.error());
    return DriverError::Unexpected(
        DriverErrorCode::ParseFailed,
        fmt::format("{}: {}", path.string(), header.error()));
  }

  logger_->trace(
      "GoSourceScanner scanned {}: package {}, {} imports", path.string(),
      header->package_name, header->imports.size());
  return *header;
}

auto GoSourceScanner::ParseHeader(std::string_view source)
    -> std::expected<GoFileHeader, std::string> {
  HeaderLexer lexer(source);
  GoFileHeader header;

  if (auto skipped = lexer.SkipTrivia(); !skipped) {
    return std::unexpected(skipped.error());
  }
  if (lexer.ReadIdentifier() != "package") {
    return std::unexpected("missing package clause");
  }
  if (auto skipped = lexer.SkipTrivia(); !skipped) {
    return std::unexpected(skipped.error());
  }
  header.package_name = std::string(lexer.ReadIdentifier());
  if (header.package_name.empty()) {
    return std::unexpected("missing package name");
  }

  while (true) {
    if (auto skipped = lexer.SkipTrivia(); !skipped) {
      return std::unexpected(skipped.error());
    }
    auto mark = lexer.Mark();
    if (lexer.ReadIdentifier() != "import") {
      // First non-import declaration ends the header
      lexer.Reset(mark);
      break;
    }
    if (auto skipped = lexer.SkipTrivia(); !skipped) {
      return std::unexpected(skipped.error());
    }

    if (lexer.Peek() != '(') {
      auto path = ReadImportSpec(lexer);
      if (!path) {
        return std::unexpected(path.error());
      }
      header.imports.push_back(std::move(*path));
      continue;
    }

    lexer.Advance();
    while (true) {
      if (auto skipped = lexer.SkipTrivia(); !skipped) {
        return std::unexpected(skipped.error());
      }
      if (lexer.Peek() == ')') {
        lexer.Advance();
        break;
      }
      if (lexer.Peek() == '\0') {
        return std::unexpected("unterminated import group");
      }
      auto path = ReadImportSpec(lexer);
      if (!path) {
        return std::unexpected(path.error());
      }
      header.imports.push_back(std::move(*path));
    }
  }

  return header;
}

GoImportScanner::GoImportScanner(
    std::shared_ptr<const GoSourceScanner> source_scanner,
    std::shared_ptr<spdlog::logger> logger)
    : source_scanner_(std::move(source_scanner)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto GoImportScanner::ScanImports(const PackageNode& node) const
    -> std::expected<std::vector<std::string>, DriverError> {
  std::vector<std::string> imports;
  std::unordered_set<std::string> seen;

  for (const auto& file : node.SourceFiles()) {
    auto header = source_scanner_->ScanFile(file);
    if (!header) {
      return std::unexpected(header.error());
    }
    for (auto& import_path : header->imports) {
      if (seen.insert(import_path).second) {
        imports.push_back(std::move(import_path));
      }
    }
  }

  logger_->trace(
      "GoImportScanner found {} imports in {}", imports.size(), node.id);
  return imports;
}

}  // namespace pkgdriver::golang
