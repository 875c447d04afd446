#include "internal/jobs/doc_generation.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace codeintel::jobs {

namespace fs = std::filesystem;

using observability::BoolField;
using observability::CountField;
using observability::StringField;

namespace {

const std::set<std::string> kSkippedDirectories = {
    ".git", ".venv", "venv", "build", "vendor", "chroma_db", "__pycache__", "node_modules",
};

std::string_view Trim(std::string_view s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool IsTestDirectory(const fs::path& dir) {
  return Lower(dir.filename().string()) == "test";
}

std::string NormalizeLineEndings(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
    } else {
      out.push_back(text[i]);
    }
  }
  return out;
}

std::string ToCrlf(const std::string& text) {
  std::string out;
  out.reserve(text.size() + text.size() / 16);
  for (char c : text) {
    if (c == '\n') out.push_back('\r');
    out.push_back(c);
  }
  return out;
}

std::size_t LineStart(const std::string& code, std::size_t offset) {
  if (offset == 0) return 0;
  const auto nl = code.rfind('\n', offset - 1);
  return nl == std::string::npos ? 0 : nl + 1;
}

std::string LeadingIndent(const std::string& code, std::size_t line_start, std::size_t offset) {
  std::size_t i = line_start;
  while (i < offset && (code[i] == ' ' || code[i] == '\t')) ++i;
  return code.substr(line_start, i - line_start);
}

std::string IndentBlock(const std::string& block, const std::string& indent) {
  std::istringstream in(NormalizeLineEndings(block));
  std::string        line;
  std::string        out;
  bool               first = true;
  while (std::getline(in, line)) {
    if (!first) out.push_back('\n');
    first = false;
    if (!line.empty()) out += indent + line;
  }
  return out;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot read " + path.string());
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

void WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
  if (!out) {
    throw std::runtime_error("cannot write " + path.string());
  }
}

struct DocEdit {
  std::size_t begin = 0; // replaced range [begin, end)
  std::size_t end   = 0;
  std::string text;
  std::string signature;
  std::string member_type;
  std::string reason;
};

} // namespace

std::vector<fs::path> EnumerateSourceFiles(const fs::path& root, const JobOptions& options) {
  std::vector<fs::path> files;
  if (!fs::is_directory(root)) return files;

  for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
    const auto& path = it->path();
    if (it->is_directory()) {
      if (kSkippedDirectories.count(path.filename().string()) || (options.exclude_tests && IsTestDirectory(path))) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!it->is_regular_file()) continue;

    const auto ext = path.extension().string();
    if (std::find(options.source_extensions.begin(), options.source_extensions.end(), ext) == options.source_extensions.end()) {
      continue;
    }
    files.push_back(path);
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::optional<std::string> ExtractDocBlock(std::string_view text) {
  auto block = Trim(text);
  if (block.substr(0, 3) != "/**") {
    const auto start = block.find("/**");
    if (start != std::string_view::npos) block = block.substr(start);
  }
  if (block.size() < 2 || block.substr(block.size() - 2) != "*/") {
    const auto end = block.rfind("*/");
    if (end != std::string_view::npos) block = block.substr(0, end + 2);
  }
  block = Trim(block);

  // "/**/" is not a doc block
  if (block.size() < 5 || block.substr(0, 3) != "/**" || block.substr(block.size() - 2) != "*/") {
    return std::nullopt;
  }
  return std::string(block);
}

std::size_t CountMeaningfulDocLines(std::string_view doc_block) {
  std::size_t count = 0;
  while (!doc_block.empty()) {
    const auto nl   = doc_block.find('\n');
    auto       line = Trim(doc_block.substr(0, nl));
    doc_block       = nl == std::string_view::npos ? std::string_view() : doc_block.substr(nl + 1);

    if (line.substr(0, 3) == "/**") line.remove_prefix(3);
    if (line.size() >= 2 && line.substr(line.size() - 2) == "*/") line.remove_suffix(2);
    line = Trim(line);
    if (!line.empty() && line.front() == '*') line.remove_prefix(1);
    if (!Trim(line).empty()) ++count;
  }
  return count;
}

DocGenerationSummary RunDocumentationPass(const fs::path&          root,
                                          const JobOptions&        options,
                                          const MemberSource&      source,
                                          MemberDocumenter&        documenter,
                                          AuditLog&                log,
                                          const CancellationToken& token) {
  const auto files = EnumerateSourceFiles(root, options);

  DocGenerationSummary summary;
  summary.root_dir      = root.string();
  summary.files_scanned = files.size();
  summary.log_file      = log.Path().string();

  const auto min_lines = static_cast<std::size_t>(std::max(0, options.min_meaningful_lines));

  for (const auto& file : files) {
    if (token.IsCancelled()) break;

    const auto original = ReadFile(file);
    const auto code     = NormalizeLineEndings(original);

    std::vector<DocEdit> edits;
    for (const auto& member : source.Members(file, code)) {
      if (token.IsCancelled()) break;

      if (member.begin > member.end || member.end > code.size()) {
        CODEINTEL_LOG_WARN("member range out of bounds", {StringField("file", file.string()), StringField("signature", member.signature)});
        continue;
      }

      const bool has_doc = member.doc && Trim(*member.doc).substr(0, 3) == "/**";
      if (has_doc && CountMeaningfulDocLines(*member.doc) >= min_lines) continue;

      DocRequest request{member.signature, member.member_type, code.substr(member.begin, member.end - member.begin)};
      if (request.code.size() > options.max_code_chars) {
        request.code.resize(options.max_code_chars);
        request.code += "\n// ... truncated ...\n";
      }

      if (token.IsCancelled()) break;
      const auto block = ExtractDocBlock(documenter.Document(request));
      if (!block) continue;

      const auto line_start = LineStart(code, member.begin);

      DocEdit edit;
      edit.begin       = has_doc && member.doc_begin <= line_start ? LineStart(code, member.doc_begin) : line_start;
      edit.end         = line_start;
      edit.text        = IndentBlock(*block, LeadingIndent(code, line_start, member.begin)) + "\n";
      edit.signature   = member.signature;
      edit.member_type = member.member_type;
      edit.reason      = has_doc ? "short_javadoc" : "missing_javadoc";

      // regenerated doc identical to the one in place
      if (code.compare(edit.begin, edit.end - edit.begin, edit.text) == 0) continue;
      edits.push_back(std::move(edit));
    }

    if (edits.empty()) continue;

    // bottom to top keeps earlier offsets valid
    std::stable_sort(edits.begin(), edits.end(), [](const DocEdit& a, const DocEdit& b) { return a.begin > b.begin; });

    auto updated = code;
    for (const auto& edit : edits) {
      updated.replace(edit.begin, edit.end - edit.begin, edit.text);
      log.AppendChange(file.string(), edit.signature, edit.member_type, edit.reason);
      ++summary.members_documented;
    }

    if (updated != code) {
      WriteFile(file, original.find("\r\n") != std::string::npos ? ToCrlf(updated) : updated);
      ++summary.files_modified;
    }
  }

  CODEINTEL_LOG_INFO("documentation pass finished",
                     {StringField("root_dir", summary.root_dir),
                      CountField("files_scanned", summary.files_scanned),
                      CountField("files_modified", summary.files_modified),
                      CountField("members_documented", summary.members_documented),
                      BoolField("cancelled", token.IsCancelled())});
  return summary;
}

} // namespace codeintel::jobs
