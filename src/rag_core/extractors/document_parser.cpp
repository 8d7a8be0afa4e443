#include "rag_core/extractors/document_parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace rag_core {

namespace {

constexpr size_t kMaxPathLength = 2000;

std::string lowercase_extension(const fs::path& file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

}  // namespace

std::string DocumentParser::read_text_file(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentParseError("Could not open file: " + file_path.string());
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  std::string content = buffer.str();

  if (content.rfind("\xEF\xBB\xBF", 0) == 0) {
    content.erase(0, 3);
  }

  std::string normalized;
  normalized.reserve(content.size());
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
      continue;
    }
    normalized.push_back(content[i]);
  }
  return normalized;
}

bool PlainTextParser::can_handle(const fs::path& file_path) const {
  const std::string extension = lowercase_extension(file_path);
  return extension == ".txt" || extension == ".text" || extension == ".log";
}

std::string PlainTextParser::parse(const fs::path& file_path) const {
  return read_text_file(file_path);
}

bool MarkdownParser::can_handle(const fs::path& file_path) const {
  const std::string extension = lowercase_extension(file_path);
  return extension == ".md" || extension == ".markdown";
}

std::string MarkdownParser::parse(const fs::path& file_path) const {
  return strip_front_matter(read_text_file(file_path));
}

std::string MarkdownParser::strip_front_matter(const std::string& content) {
  if (content.rfind("---\n", 0) != 0) {
    return content;
  }
  size_t closing = content.find("\n---", 3);
  while (closing != std::string::npos) {
    size_t after = closing + 4;
    if (after == content.size()) {
      return std::string();
    }
    if (content[after] == '\n') {
      return content.substr(after + 1);
    }
    closing = content.find("\n---", after);
  }
  // Unterminated block: not front matter
  return content;
}

DocumentParserFactory::DocumentParserFactory() {
  parsers_.push_back(std::make_unique<MarkdownParser>());
  parsers_.push_back(std::make_unique<PlainTextParser>());
}

const DocumentParser& DocumentParserFactory::get_parser_for(const fs::path& file_path) const {
  for (const auto& parser : parsers_) {
    if (parser->can_handle(file_path)) {
      return *parser;
    }
  }
  throw DocumentParseError("Unsupported file format: " + file_path.extension().string());
}

bool is_file_path(const std::string& text) {
  if (text.empty() || text.size() > kMaxPathLength) {
    return false;
  }
  if (text.find('\n') != std::string::npos || text.find('\r') != std::string::npos) {
    return false;
  }

  std::error_code ec;
  if (fs::is_regular_file(fs::path(text), ec)) {
    return true;
  }

  bool has_whitespace = std::any_of(text.begin(), text.end(),
                                    [](unsigned char c) { return std::isspace(c) != 0; });
  if (has_whitespace) {
    return false;
  }
  size_t separator = text.find_last_of("/\\");
  if (separator == std::string::npos) {
    return false;
  }
  std::string last_segment = text.substr(separator + 1);
  size_t dot = last_segment.rfind('.');
  return dot != std::string::npos && dot > 0 && dot + 1 < last_segment.size();
}

std::string parse_document(const fs::path& file_path) {
  std::error_code ec;
  if (!fs::is_regular_file(file_path, ec)) {
    throw DocumentNotFoundError(file_path);
  }
  static const DocumentParserFactory factory;
  return factory.get_parser_for(file_path).parse(file_path);
}

}  // namespace rag_core
