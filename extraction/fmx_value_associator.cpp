#include "fmx_value_associator.h"
#include "fmx_text_normalizer.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace fmx::extract {

fmx_value_associator::fmx_value_associator(const fmx_token_model& tokens, const fmx_label_detector& detector,
                                           const fmx_extraction_options& options)
  : tokens(tokens), detector(detector), options(options)
{
}

fmx_rect fmx_value_associator::same_line_region(const fmx_rect& label) const
{
  return fmx_rect(label.x1, label.y0 - options.same_line_tolerance,
                  label.x1 + options.max_same_line_distance, label.y1 + options.same_line_tolerance);
}

fmx_rect fmx_value_associator::next_line_region(const fmx_rect& label) const
{
  return fmx_rect(label.x0 - options.next_line_alignment, label.y1,
                  label.x1 + options.next_line_alignment, label.y1 + options.next_line_max_gap);
}

bool fmx_value_associator::usable(size_t index, const fmx_label_match& label, const std::set<size_t>& consumed) const
{
  if (consumed.count(index) > 0)
  {
    return false;
  }
  if (std::find(label.token_indices.begin(), label.token_indices.end(), index) != label.token_indices.end())
  {
    return false;
  }
  const fmx_string& text = tokens.at(index).text;
  return !is_marker_glyph(text) && !is_colon_label(text);
}

fmx_value_span fmx_value_associator::associate(const fmx_label_match& label, const std::set<size_t>& consumed) const
{
  fmx_rect same = same_line_region(label.rect);
  fmx_rect next = next_line_region(label.rect);

  size_t best = std::numeric_limits<size_t>::max();
  double best_distance = std::numeric_limits<double>::max();
  double best_centroid = std::numeric_limits<double>::max();
  bool best_same_line = false;

  for (size_t idx : tokens.reading_order())
  {
    if (!usable(idx, label, consumed))
    {
      continue;
    }
    const fmx_rect& r = tokens.at(idx).rect;

    double distance = std::numeric_limits<double>::max();
    bool same_line = false;
    if (r.intersects(same) && r.center_x() > label.rect.x1)
    {
      distance = std::max(0.0, r.x0 - label.rect.x1);
      same_line = true;
    }
    else if (r.intersects(next) && r.center_y() > label.rect.y1)
    {
      distance = std::max(0.0, r.y0 - label.rect.y1) * options.next_line_vertical_weight +
                 std::fabs(r.x0 - label.rect.x0) * options.misalignment_weight;
    }
    else
    {
      continue;
    }

    // equal distances go to the smaller centroid distance, then reading order
    double centroid = r.centroid_distance(label.rect);
    if (distance < best_distance || (distance == best_distance && centroid < best_centroid))
    {
      best = idx;
      best_distance = distance;
      best_centroid = centroid;
      best_same_line = same_line;
    }
  }

  fmx_value_span span;
  span.rect = label.rect;
  if (best == std::numeric_limits<size_t>::max())
  {
    return span;
  }

  fmx_rect region = best_same_line ? same
                                   : fmx_rect(next.x0, next.y0, label.rect.x1 + options.max_same_line_distance, next.y1);

  size_t line = tokens.line_of(best);
  const std::vector<size_t>& l = tokens.lines()[line];
  size_t pos = std::find(l.begin(), l.end(), best) - l.begin();

  std::vector<fmx_string> parts;
  std::vector<size_t> taken;
  fmx_rect rect = tokens.at(best).rect;
  parts.push_back(tokens.at(best).text);
  taken.push_back(best);

  for (size_t p = pos + 1; p < l.size(); ++p)
  {
    size_t idx = l[p];
    const fmx_rect& r = tokens.at(idx).rect;
    const fmx_rect& prev = tokens.at(l[p - 1]).rect;
    if (r.x0 - prev.x1 > options.word_gap || !r.intersects(region) ||
        !usable(idx, label, consumed) || detector.starts_label(line, p))
    {
      break;
    }
    parts.push_back(tokens.at(idx).text);
    taken.push_back(idx);
    rect = rect.include(r);
  }

  fmx_string text = clean_value(fmx_string(" ").join(parts));
  if (text.empty())
  {
    return span;
  }
  span.text = text;
  span.rect = rect;
  span.token_indices = taken;
  return span;
}

} // namespace fmx::extract
