#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace rag_core {

class DocumentParseError : public std::exception {
 public:
  explicit DocumentParseError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class DocumentNotFoundError : public DocumentParseError {
 public:
  explicit DocumentNotFoundError(const fs::path& file_path)
      : DocumentParseError("File not found: " + file_path.string()) {}
};

// Turns one file format into plain text ready for chunking
class DocumentParser {
 public:
  virtual ~DocumentParser() = default;

  // Checks if this parser can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Reads the file and returns its text. Throws DocumentParseError.
  virtual std::string parse(const fs::path& file_path) const = 0;

 protected:
  // Whole file as bytes, without a UTF-8 byte-order mark and with CRLF turned into LF
  std::string read_text_file(const fs::path& file_path) const;
};

// .txt, .text and .log files, returned as is
class PlainTextParser : public DocumentParser {
 public:
  bool can_handle(const fs::path& file_path) const override;
  std::string parse(const fs::path& file_path) const override;
};

// .md and .markdown files; markup is kept, YAML front matter is dropped
class MarkdownParser : public DocumentParser {
 public:
  bool can_handle(const fs::path& file_path) const override;
  std::string parse(const fs::path& file_path) const override;

  static std::string strip_front_matter(const std::string& content);
};

/**
 * @class DocumentParserFactory
 * @brief Picks the parser for a file by its extension.
 */
class DocumentParserFactory {
 public:
  DocumentParserFactory();

  // @throw DocumentParseError("Unsupported file format: .ext") if no parser matches
  const DocumentParser& get_parser_for(const fs::path& file_path) const;

  DocumentParserFactory(const DocumentParserFactory&) = delete;
  DocumentParserFactory& operator=(const DocumentParserFactory&) = delete;
  DocumentParserFactory(DocumentParserFactory&&) = delete;
  DocumentParserFactory& operator=(DocumentParserFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<DocumentParser>> parsers_;
};

/**
 * @brief Heuristic used by the ingest tool to tell a file path from document text.
 *
 * An existing regular file is always a path. Otherwise the text must be a
 * single whitespace-free token containing a path separator whose last segment
 * has an extension, e.g. "docs/readme.md" or "./notes/todo.txt".
 */
bool is_file_path(const std::string& text);

// Parses the file with the matching parser. Throws DocumentNotFoundError or DocumentParseError.
std::string parse_document(const fs::path& file_path);

}  // namespace rag_core
