#include "fmx_token_model.h"

namespace fmx::extract {

fmx_token_model::fmx_token_model(int page, const std::vector<fmx_word>& words, double line_bucket)
  : page_number(page)
{
  std::vector<fmx_rect> rects;
  for (const auto& word : words)
  {
    fmx_string text = word.text.trim();
    if (text.empty())
    {
      continue;
    }
    token_list.push_back({text, word.rect, page});
    rects.push_back(word.rect);
  }

  line_list = group_lines(rects, line_bucket);
  line_of_token.resize(token_list.size());
  for (size_t l = 0; l < line_list.size(); ++l)
  {
    for (size_t idx : line_list[l])
    {
      line_of_token[idx] = l;
      order.push_back(idx);
    }
  }
}

const fmx_token& fmx_token_model::at(size_t index) const
{
  return token_list.at(index);
}

size_t fmx_token_model::line_of(size_t index) const
{
  return line_of_token.at(index);
}

std::vector<size_t> fmx_token_model::tokens_in(const fmx_rect& region) const
{
  std::vector<size_t> result;
  for (size_t idx : order)
  {
    const fmx_rect& r = token_list[idx].rect;
    if (region.contains_point(r.center_x(), r.center_y()))
    {
      result.push_back(idx);
    }
  }
  return result;
}

} // namespace fmx::extract
