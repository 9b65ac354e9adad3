#ifndef FMX_LABEL_DETECTOR_H
#define FMX_LABEL_DETECTOR_H

#include "fmx_token_model.h"
#include "fmx_label_dictionary.h"
#include "fmx_extraction_options.h"
#include "fmx_extraction_record.h"
#include <set>
#include <vector>

namespace fmx::extract {

struct fmx_label_match {
  fmx_string text;
  fmx_rect rect;
  std::vector<size_t> token_indices;
};

// Label phrases matched as token sequences on one line, longest first
class fmx_label_set
{
  struct entry {
    fmx_string text;
    std::vector<fmx_string> words;
  };

  bool case_sensitive;
  std::vector<entry> entries;

  bool word_matches(const fmx_string& token, const fmx_string& word, bool last) const;

public:
  explicit fmx_label_set(bool case_sensitive = false);

  void add(const fmx_string& label);
  bool empty() const { return entries.empty(); }
  size_t size() const { return entries.size(); }

  // Token count of the longest label starting at line[pos], 0 if none.
  // Consumed tokens never match. The last label word also matches the
  // same token with a colon appended ("No." matches "No.:").
  size_t match_at(const fmx_token_model& tokens, const std::vector<size_t>& line, size_t pos,
                  const std::set<size_t>& consumed, fmx_string* label = nullptr) const;
};

// Word sets of two keys are contained in one another, ignoring case
bool keys_overlap(const fmx_string& a, const fmx_string& b);

// Finds label anchors on a page in the three heuristic flavours and
// tells whether a known label starts at a token
class fmx_label_detector
{
  const fmx_token_model& tokens;
  const fmx_extraction_options& options;
  fmx_label_set compound;
  fmx_label_set standalone;
  fmx_label_set declared;

  fmx_label_match make_match(const std::vector<size_t>& line, size_t pos, size_t count) const;

public:
  fmx_label_detector(const fmx_token_model& tokens, const fmx_label_dictionary& dictionary,
                     const fmx_extraction_options& options);

  // Config labels, case-sensitive
  void declare(const fmx_string& label);

  bool compound_at(size_t line, size_t pos, const fmx_page_extraction_context& ctx, fmx_label_match& out) const;
  // A colon token, extended to the left over adjacent plain words
  bool colon_at(size_t line, size_t pos, const fmx_page_extraction_context& ctx, fmx_label_match& out) const;
  // Skipped when an emitted key overlaps the label
  bool standalone_at(size_t line, size_t pos, const fmx_page_extraction_context& ctx, fmx_label_match& out) const;

  bool starts_label(size_t line, size_t pos) const;
};

} // namespace fmx::extract

#endif // FMX_LABEL_DETECTOR_H
