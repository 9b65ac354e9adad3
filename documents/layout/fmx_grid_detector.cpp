#include "fmx_grid_detector.h"
#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <numeric>

fmx_grid_detector::fmx_grid_detector(double tolerance, double min_length)
  : tolerance(tolerance), min_length(min_length)
{
}

void fmx_grid_detector::add_segment(double x0, double y0, double x1, double y1)
{
  double dx = std::fabs(x1 - x0);
  double dy = std::fabs(y1 - y0);
  if (dy <= tolerance && dx >= min_length)
  {
    horizontals.push_back({(y0 + y1) / 2.0, std::min(x0, x1), std::max(x0, x1)});
  }
  else if (dx <= tolerance && dy >= min_length)
  {
    verticals.push_back({(x0 + x1) / 2.0, std::min(y0, y1), std::max(y0, y1)});
  }
}

void fmx_grid_detector::add_rectangle(const fmx_rect& rect)
{
  if (rect.height() <= tolerance || rect.width() <= tolerance)
  {
    add_segment(rect.x0, rect.center_y(), rect.x1, rect.center_y());
    add_segment(rect.center_x(), rect.y0, rect.center_x(), rect.y1);
    return;
  }
  add_segment(rect.x0, rect.y0, rect.x1, rect.y0);
  add_segment(rect.x0, rect.y1, rect.x1, rect.y1);
  add_segment(rect.x0, rect.y0, rect.x0, rect.y1);
  add_segment(rect.x1, rect.y0, rect.x1, rect.y1);
}

std::vector<double> fmx_grid_detector::merge_positions(std::vector<double> values) const
{
  std::sort(values.begin(), values.end());
  std::vector<double> merged;
  for (double v : values)
  {
    if (merged.empty() || v - merged.back() > tolerance)
    {
      merged.push_back(v);
    }
  }
  return merged;
}

std::vector<fmx_table_grid> fmx_grid_detector::detect() const
{
  // union-find over all rules, horizontals first
  size_t total = horizontals.size() + verticals.size();
  std::vector<size_t> parent(total);
  std::iota(parent.begin(), parent.end(), 0);

  std::function<size_t(size_t)> find = [&parent, &find](size_t i) {
    if (parent[i] != i) parent[i] = find(parent[i]);
    return parent[i];
  };

  for (size_t h = 0; h < horizontals.size(); ++h)
  {
    for (size_t v = 0; v < verticals.size(); ++v)
    {
      const rule& hr = horizontals[h];
      const rule& vr = verticals[v];
      bool touches = vr.pos >= hr.start - tolerance && vr.pos <= hr.end + tolerance &&
                     hr.pos >= vr.start - tolerance && hr.pos <= vr.end + tolerance;
      if (touches)
      {
        parent[find(h)] = find(horizontals.size() + v);
      }
    }
  }

  std::map<size_t, std::pair<std::vector<double>, std::vector<double>>> components;
  for (size_t i = 0; i < total; ++i)
  {
    auto& entry = components[find(i)];
    if (i < horizontals.size())
    {
      entry.first.push_back(horizontals[i].pos);
    }
    else
    {
      entry.second.push_back(verticals[i - horizontals.size()].pos);
    }
  }

  std::vector<fmx_table_grid> grids;
  for (const auto& component : components)
  {
    std::vector<double> ys = merge_positions(component.second.first);
    std::vector<double> xs = merge_positions(component.second.second);
    if (ys.size() < 3 || xs.size() < 2)
    {
      continue;
    }

    fmx_table_grid grid;
    for (size_t r = 0; r + 1 < ys.size(); ++r)
    {
      std::vector<fmx_string> row;
      std::vector<fmx_rect> rects;
      for (size_t c = 0; c + 1 < xs.size(); ++c)
      {
        row.push_back(fmx_string());
        rects.push_back(fmx_rect(xs[c], ys[r], xs[c + 1], ys[r + 1]));
      }
      grid.cells.push_back(row);
      grid.cell_rects.push_back(rects);
    }
    grids.push_back(grid);
  }

  std::sort(grids.begin(), grids.end(), [](const fmx_table_grid& a, const fmx_table_grid& b) {
    fmx_rect ra = a.bounds();
    fmx_rect rb = b.bounds();
    if (ra.y0 != rb.y0) return ra.y0 < rb.y0;
    return ra.x0 < rb.x0;
  });
  return grids;
}
