#ifndef FMX_TOKEN_MODEL_H
#define FMX_TOKEN_MODEL_H

#include "../documents/fmx_doc_source.h"
#include <vector>

namespace fmx::extract {

struct fmx_token {
  fmx_string text;
  fmx_rect rect;
  int page;
};

// Positioned words of one page with their text lines. Whitespace-only
// words are dropped; indices refer to tokens().
class fmx_token_model
{
  int page_number;
  std::vector<fmx_token> token_list;
  std::vector<std::vector<size_t>> line_list;
  std::vector<size_t> line_of_token;
  std::vector<size_t> order;

public:
  fmx_token_model(int page, const std::vector<fmx_word>& words, double line_bucket);

  int page() const { return page_number; }
  size_t size() const { return token_list.size(); }
  const std::vector<fmx_token>& tokens() const { return token_list; }
  // Throws std::out_of_range
  const fmx_token& at(size_t index) const;

  // Lines top to bottom, tokens left to right
  const std::vector<std::vector<size_t>>& lines() const { return line_list; }
  size_t line_of(size_t index) const;
  // All tokens, line by line
  const std::vector<size_t>& reading_order() const { return order; }

  // Tokens whose centre lies in the region
  std::vector<size_t> tokens_in(const fmx_rect& region) const;
};

} // namespace fmx::extract

#endif // FMX_TOKEN_MODEL_H
