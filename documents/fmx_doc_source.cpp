#include "fmx_doc_source.h"
#include <algorithm>
#include <cmath>
#include <iostream>

fmx_string widget_type_name(fmx_widget_type type)
{
  switch (type)
  {
    case fmx_widget_type::text: return "text";
    case fmx_widget_type::checkbox: return "checkbox";
    case fmx_widget_type::radio: return "radio";
    case fmx_widget_type::combo: return "combo";
    case fmx_widget_type::list: return "list";
  }
  return "text";
}

bool parse_widget_type(const fmx_string& name, fmx_widget_type& out)
{
  fmx_string lower = name.trim().to_lower();
  if (lower == "text") out = fmx_widget_type::text;
  else if (lower == "checkbox") out = fmx_widget_type::checkbox;
  else if (lower == "radio") out = fmx_widget_type::radio;
  else if (lower == "combo") out = fmx_widget_type::combo;
  else if (lower == "list") out = fmx_widget_type::list;
  else return false;
  return true;
}

size_t fmx_table_grid::row_count() const
{
  return cells.size();
}

size_t fmx_table_grid::column_count(size_t row) const
{
  return cells.at(row).size();
}

const fmx_string& fmx_table_grid::cell(size_t row, size_t col) const
{
  return cells.at(row).at(col);
}

const fmx_rect& fmx_table_grid::cell_rect(size_t row, size_t col) const
{
  return cell_rects.at(row).at(col);
}

fmx_rect fmx_table_grid::bounds() const
{
  bool first = true;
  fmx_rect result;
  for (const auto& row : cell_rects)
  {
    for (const auto& r : row)
    {
      result = first ? r : result.include(r);
      first = false;
    }
  }
  return result;
}

std::vector<std::vector<size_t>> group_lines(const std::vector<fmx_rect>& rects, double tolerance)
{
  std::vector<size_t> order(rects.size());
  for (size_t i = 0; i < order.size(); ++i) order[i] = i;

  std::stable_sort(order.begin(), order.end(), [&rects](size_t a, size_t b) {
    if (rects[a].y1 != rects[b].y1) return rects[a].y1 < rects[b].y1;
    return rects[a].x0 < rects[b].x0;
  });

  // each line is anchored at the baseline of its first word
  std::vector<std::vector<size_t>> lines;
  double anchor = 0;
  for (size_t idx : order)
  {
    if (lines.empty() || std::fabs(rects[idx].y1 - anchor) > tolerance)
    {
      lines.push_back(std::vector<size_t>());
      anchor = rects[idx].y1;
    }
    lines.back().push_back(idx);
  }

  for (auto& line : lines)
  {
    std::stable_sort(line.begin(), line.end(), [&rects](size_t a, size_t b) {
      return rects[a].x0 < rects[b].x0;
    });
  }
  return lines;
}

namespace {

  const double reading_order_tolerance = 3.0;

  std::vector<std::vector<size_t>> word_lines(const std::vector<fmx_word>& words)
  {
    std::vector<fmx_rect> rects;
    rects.reserve(words.size());
    for (const auto& w : words) rects.push_back(w.rect);
    return group_lines(rects, reading_order_tolerance);
  }

  bool word_matches(const fmx_string& token, const fmx_string& word, bool last)
  {
    if (token.equals_ignore_case(word)) return true;
    return last && token.size() == word.size() + 1 && token.back() == ':' &&
           token.substr(0, word.size()).equals_ignore_case(word);
  }

}

std::vector<fmx_rect> fmx_page_source::search_text(const fmx_string& phrase) const
{
  std::vector<fmx_rect> result;
  std::vector<fmx_string> parts = phrase.words();
  if (parts.empty()) return result;

  std::vector<fmx_word> all = words();
  for (const auto& line : word_lines(all))
  {
    for (size_t start = 0; start + parts.size() <= line.size(); ++start)
    {
      bool match = true;
      fmx_rect rect = all[line[start]].rect;
      for (size_t k = 0; k < parts.size() && match; ++k)
      {
        const fmx_word& w = all[line[start + k]];
        match = word_matches(w.text, parts[k], k + 1 == parts.size());
        rect = rect.include(w.rect);
      }
      if (match)
      {
        result.push_back(rect);
      }
    }
  }
  return result;
}

fmx_string fmx_page_source::text_in_region(const fmx_rect& region) const
{
  std::vector<fmx_word> all = words();
  std::vector<fmx_string> parts;
  for (const auto& line : word_lines(all))
  {
    for (size_t idx : line)
    {
      if (region.contains_point(all[idx].rect.center_x(), all[idx].rect.center_y()))
      {
        parts.push_back(all[idx].text);
      }
    }
  }
  return fmx_string(" ").join(parts);
}

fmx_string fmx_page_source::text() const
{
  std::vector<fmx_word> all = words();
  std::vector<fmx_string> lines;
  for (const auto& line : word_lines(all))
  {
    std::vector<fmx_string> parts;
    for (size_t idx : line) parts.push_back(all[idx].text);
    lines.push_back(fmx_string(" ").join(parts));
  }
  return fmx_string("\n").join(lines);
}

fmx_document_guard::fmx_document_guard(fmx_document& doc) : document(doc), opened(false)
{
  opened = document.open();
}

fmx_document_guard::~fmx_document_guard()
{
  try
  {
    release();
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: failed to release " << document.source_name() << ": " << e.what() << std::endl;
  }
}

void fmx_document_guard::release()
{
  if (!opened) return;
  opened = false;
  try
  {
    document.close();
  }
  catch (const fmx_document_closed_exception&)
  {
    // already invalidated by the engine
  }
}
