#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/jobs/audit_log.hpp"
#include "internal/jobs/job_model.hpp"

namespace codeintel::jobs {

/*
  A documentable declaration found by the source parser.

  Offsets index the LF-normalized file text handed to MemberSource.
*/
struct SourceMember {
  std::string member_type; // class | interface | enum | method | constructor
  std::string signature;
  std::size_t begin = 0;
  std::size_t end   = 0;

  // existing doc comment directly above the declaration
  std::optional<std::string> doc;
  std::size_t                doc_begin = 0;
};

// Locates declarations in one source file (tree-sitter backed in production).
class MemberSource {
 public:
  virtual ~MemberSource() = default;

  virtual std::vector<SourceMember> Members(const std::filesystem::path& file, const std::string& code) const = 0;
};

struct DocRequest {
  std::string signature;
  std::string member_type;
  std::string code;
};

// Produces a doc comment for one member (LLM backed in production).
class MemberDocumenter {
 public:
  virtual ~MemberDocumenter() = default;

  virtual std::string Document(const DocRequest& request) = 0;
};

// Source files under `root`, sorted, skipping tool/build directories.
std::vector<std::filesystem::path> EnumerateSourceFiles(const std::filesystem::path& root, const JobOptions& options);

// Trims model output to a single /** ... */ block; nullopt when there is none.
std::optional<std::string> ExtractDocBlock(std::string_view text);

std::size_t CountMeaningfulDocLines(std::string_view doc_block);

/*
  One documentation pass over `root`.

  The token is checked before every file and every member; a cancelled
  pass still writes the edits collected for the current file and
  returns the partial summary.
*/
DocGenerationSummary RunDocumentationPass(const std::filesystem::path& root,
                                          const JobOptions&            options,
                                          const MemberSource&          source,
                                          MemberDocumenter&            documenter,
                                          AuditLog&                    log,
                                          const CancellationToken&     token);

} // namespace codeintel::jobs
