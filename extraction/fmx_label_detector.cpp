#include "fmx_label_detector.h"
#include "fmx_text_normalizer.h"
#include <algorithm>
#include <cctype>

namespace fmx::extract {

namespace {

  const std::set<size_t> no_tokens;

  bool plain_word(const fmx_string& text)
  {
    bool letter = false;
    for (size_t i = 0; i < text.size(); ++i)
    {
      unsigned char c = static_cast<unsigned char>(text[i]);
      if (std::isdigit(c)) return false;
      if (c >= 0x80 || std::isalpha(c)) letter = true;
    }
    return letter;
  }

  std::set<fmx_string> lower_words(const fmx_string& text)
  {
    std::set<fmx_string> result;
    for (const auto& w : text.to_lower().words()) result.insert(w);
    return result;
  }

  bool subset_of(const std::set<fmx_string>& a, const std::set<fmx_string>& b)
  {
    return std::includes(b.begin(), b.end(), a.begin(), a.end());
  }

}

fmx_label_set::fmx_label_set(bool case_sensitive) : case_sensitive(case_sensitive)
{
}

void fmx_label_set::add(const fmx_string& label)
{
  entry e;
  e.text = label.normalize_whitespace();
  e.words = e.text.words();
  if (e.words.empty())
  {
    return;
  }
  entries.push_back(e);
  std::stable_sort(entries.begin(), entries.end(), [](const entry& a, const entry& b) {
    if (a.words.size() != b.words.size()) return a.words.size() > b.words.size();
    return a.text.size() > b.text.size();
  });
}

bool fmx_label_set::word_matches(const fmx_string& token, const fmx_string& word, bool last) const
{
  if (case_sensitive ? token == word : token.equals_ignore_case(word))
  {
    return true;
  }
  if (!last || token.size() != word.size() + 1 || token.back() != ':')
  {
    return false;
  }
  fmx_string head = token.substr(0, word.size());
  return case_sensitive ? head == word : head.equals_ignore_case(word);
}

size_t fmx_label_set::match_at(const fmx_token_model& tokens, const std::vector<size_t>& line, size_t pos,
                               const std::set<size_t>& consumed, fmx_string* label) const
{
  for (const auto& e : entries)
  {
    if (pos + e.words.size() > line.size())
    {
      continue;
    }
    bool match = true;
    for (size_t k = 0; k < e.words.size() && match; ++k)
    {
      size_t idx = line[pos + k];
      match = consumed.count(idx) == 0 &&
              word_matches(tokens.at(idx).text, e.words[k], k + 1 == e.words.size());
    }
    if (match)
    {
      if (label != nullptr) *label = e.text;
      return e.words.size();
    }
  }
  return 0;
}

bool keys_overlap(const fmx_string& a, const fmx_string& b)
{
  std::set<fmx_string> wa = lower_words(a);
  std::set<fmx_string> wb = lower_words(b);
  if (wa.empty() || wb.empty())
  {
    return false;
  }
  return subset_of(wa, wb) || subset_of(wb, wa);
}

fmx_label_detector::fmx_label_detector(const fmx_token_model& tokens, const fmx_label_dictionary& dictionary,
                                       const fmx_extraction_options& options)
  : tokens(tokens), options(options), compound(false), standalone(false), declared(true)
{
  for (const auto& label : dictionary.compound_labels) compound.add(label);
  for (const auto& label : dictionary.standalone_labels) standalone.add(label);
}

void fmx_label_detector::declare(const fmx_string& label)
{
  declared.add(label);
}

fmx_label_match fmx_label_detector::make_match(const std::vector<size_t>& line, size_t pos, size_t count) const
{
  fmx_label_match match;
  std::vector<fmx_string> parts;
  for (size_t k = 0; k < count; ++k)
  {
    size_t idx = line[pos + k];
    const fmx_token& t = tokens.at(idx);
    match.rect = k == 0 ? t.rect : match.rect.include(t.rect);
    match.token_indices.push_back(idx);
    parts.push_back(t.text);
  }
  match.text = fmx_string(" ").join(parts);
  return match;
}

bool fmx_label_detector::compound_at(size_t line, size_t pos, const fmx_page_extraction_context& ctx,
                                     fmx_label_match& out) const
{
  const std::vector<size_t>& l = tokens.lines().at(line);
  size_t count = compound.match_at(tokens, l, pos, ctx.processed_indices);
  if (count == 0)
  {
    return false;
  }
  out = make_match(l, pos, count);
  return true;
}

bool fmx_label_detector::colon_at(size_t line, size_t pos, const fmx_page_extraction_context& ctx,
                                  fmx_label_match& out) const
{
  const std::vector<size_t>& l = tokens.lines().at(line);
  size_t idx = l.at(pos);
  if (ctx.is_consumed(idx) || !is_colon_label(tokens.at(idx).text))
  {
    return false;
  }

  size_t start = pos;
  while (start > 0 && static_cast<int>(pos - start + 1) < options.max_label_words)
  {
    const fmx_token& prev = tokens.at(l[start - 1]);
    const fmx_token& cur = tokens.at(l[start]);
    if (ctx.is_consumed(l[start - 1]) || !plain_word(prev.text) ||
        is_colon_label(prev.text) || is_marker_glyph(prev.text) ||
        cur.rect.x0 - prev.rect.x1 > options.word_gap)
    {
      break;
    }
    --start;
  }

  out = make_match(l, start, pos - start + 1);
  return true;
}

bool fmx_label_detector::standalone_at(size_t line, size_t pos, const fmx_page_extraction_context& ctx,
                                       fmx_label_match& out) const
{
  const std::vector<size_t>& l = tokens.lines().at(line);
  fmx_string label;
  size_t count = standalone.match_at(tokens, l, pos, ctx.processed_indices, &label);
  if (count == 0)
  {
    return false;
  }
  for (const auto& key : ctx.processed_keys)
  {
    if (keys_overlap(key, label))
    {
      return false;
    }
  }
  out = make_match(l, pos, count);
  return true;
}

bool fmx_label_detector::starts_label(size_t line, size_t pos) const
{
  const std::vector<size_t>& l = tokens.lines().at(line);
  if (is_colon_label(tokens.at(l.at(pos)).text))
  {
    return true;
  }
  return declared.match_at(tokens, l, pos, no_tokens) > 0 ||
         compound.match_at(tokens, l, pos, no_tokens) > 0 ||
         standalone.match_at(tokens, l, pos, no_tokens) > 0;
}

} // namespace fmx::extract
