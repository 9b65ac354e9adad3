#include "fmx_checkbox_resolver.h"
#include "fmx_text_normalizer.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace fmx::extract {

namespace {

  const size_t none = std::numeric_limits<size_t>::max();

  size_t nearest_label(const fmx_rect& target, const std::vector<fmx_rect>& labels, bool by_edge)
  {
    size_t best = none;
    double best_edge = std::numeric_limits<double>::max();
    double best_centroid = std::numeric_limits<double>::max();
    for (size_t i = 0; i < labels.size(); ++i)
    {
      double edge = by_edge ? edge_distance(target, labels[i]) : 0;
      double centroid = target.centroid_distance(labels[i]);
      if (edge < best_edge || (edge == best_edge && centroid < best_centroid))
      {
        best = i;
        best_edge = edge;
        best_centroid = centroid;
      }
    }
    return best;
  }

}

fmx_string checkbox_state_name(fmx_checkbox_state state)
{
  switch (state)
  {
    case fmx_checkbox_state::checked: return "Checked";
    case fmx_checkbox_state::unchecked: return "Unchecked";
    case fmx_checkbox_state::not_found: return "Not Found";
  }
  return "Not Found";
}

double edge_distance(const fmx_rect& a, const fmx_rect& b)
{
  double dx = std::max(0.0, std::max(a.x0 - b.x1, b.x0 - a.x1));
  double dy = std::max(0.0, std::max(a.y0 - b.y1, b.y0 - a.y1));
  return std::sqrt(dx * dx + dy * dy);
}

fmx_checkbox_resolver::fmx_checkbox_resolver(const fmx_page_source& page, const fmx_token_model& tokens,
                                             const fmx_extraction_options& options)
  : page(page), tokens(tokens), options(options)
{
  for (const auto& w : page.widgets())
  {
    if (w.field_type == fmx_widget_type::checkbox || w.field_type == fmx_widget_type::radio)
    {
      widgets.push_back(w);
    }
  }
  for (const auto& shape : page.vector_shapes())
  {
    if (shape.width() > options.checkbox_min_size && shape.width() < options.checkbox_max_size &&
        shape.height() > options.checkbox_min_size && shape.height() < options.checkbox_max_size)
    {
      boxes.push_back(shape);
    }
  }
}

fmx_checkbox_result fmx_checkbox_resolver::resolve(const fmx_rect& label, std::set<size_t>& consumed) const
{
  return resolve_group(std::vector<fmx_rect>(1, label), consumed).front();
}

std::vector<fmx_checkbox_result> fmx_checkbox_resolver::resolve_group(const std::vector<fmx_rect>& labels,
                                                                      std::set<size_t>& consumed) const
{
  std::vector<fmx_checkbox_result> results(labels.size());

  for (size_t i = 0; i < labels.size(); ++i)
  {
    const fmx_rect& label = labels[i];
    fmx_checkbox_result& result = results[i];
    result.rect = label;
    fmx_rect vicinity = label.expanded(options.checkbox_search_radius);

    // 1. widget
    size_t best = none;
    double best_distance = std::numeric_limits<double>::max();
    for (size_t w = 0; w < widgets.size(); ++w)
    {
      const fmx_rect& r = widgets[w].rect;
      double d = r.centroid_distance(label);
      if (r.intersects(vicinity) && d < best_distance && nearest_label(r, labels, false) == i)
      {
        best = w;
        best_distance = d;
      }
    }
    if (best != none)
    {
      const fmx_string& value = widgets[best].field_value;
      result.state = (value.empty() || value == "Off") ? fmx_checkbox_state::unchecked
                                                       : fmx_checkbox_state::checked;
      result.rect = widgets[best].rect;
      continue;
    }

    // 2. check mark glyph
    best = none;
    double best_edge = std::numeric_limits<double>::max();
    double best_centroid = std::numeric_limits<double>::max();
    for (size_t idx : tokens.reading_order())
    {
      const fmx_token& t = tokens.at(idx);
      if (consumed.count(idx) > 0 || !is_marker_glyph(t.text))
      {
        continue;
      }
      double edge = edge_distance(t.rect, label);
      double centroid = t.rect.centroid_distance(label);
      if (edge > options.marker_radius || nearest_label(t.rect, labels, true) != i)
      {
        continue;
      }
      if (edge < best_edge || (edge == best_edge && centroid < best_centroid))
      {
        best = idx;
        best_edge = edge;
        best_centroid = centroid;
      }
    }
    if (best != none)
    {
      result.state = fmx_checkbox_state::checked;
      result.rect = tokens.at(best).rect;
      result.token_indices.push_back(best);
      consumed.insert(best);
      continue;
    }

    // 3. vector box, nearest centroid
    best = none;
    best_distance = std::numeric_limits<double>::max();
    for (size_t b = 0; b < boxes.size(); ++b)
    {
      double d = boxes[b].centroid_distance(label);
      if (boxes[b].intersects(vicinity) && d < best_distance && nearest_label(boxes[b], labels, false) == i)
      {
        best = b;
        best_distance = d;
      }
    }
    if (best != none)
    {
      const fmx_rect& box = boxes[best];
      result.rect = box;
      result.state = contains_marker_glyph(page.text_in_region(box)) ? fmx_checkbox_state::checked
                                                                    : fmx_checkbox_state::unchecked;
      for (size_t idx : tokens.tokens_in(box))
      {
        if (consumed.count(idx) == 0 && is_marker_glyph(tokens.at(idx).text))
        {
          result.token_indices.push_back(idx);
          consumed.insert(idx);
        }
      }
    }
  }
  return results;
}

} // namespace fmx::extract
