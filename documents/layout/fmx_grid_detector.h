#ifndef FMX_GRID_DETECTOR_H
#define FMX_GRID_DETECTOR_H

#include "../fmx_doc_source.h"
#include <vector>

// Finds ruled tables in a page's line art. Horizontal and vertical rules
// that touch each other form one grid; a grid needs at least two rows
// and one column. Spanning cells are not recognized, every grid line
// splits the whole table.
class fmx_grid_detector
{
public:
  explicit fmx_grid_detector(double tolerance = 2.0, double min_length = 10.0);

  // A stroked segment from (x0,y0) to (x1,y1)
  void add_segment(double x0, double y0, double x1, double y1);
  // A filled or stroked rectangle; thin ones count as a single rule
  void add_rectangle(const fmx_rect& rect);

  size_t horizontal_count() const { return horizontals.size(); }
  size_t vertical_count() const { return verticals.size(); }

  // Grids top to bottom, cell texts left empty
  std::vector<fmx_table_grid> detect() const;

private:
  struct rule {
    double pos;    // y for horizontal rules, x for vertical ones
    double start;
    double end;
  };

  double tolerance;
  double min_length;
  std::vector<rule> horizontals;
  std::vector<rule> verticals;

  std::vector<double> merge_positions(std::vector<double> values) const;
};

#endif // FMX_GRID_DETECTOR_H
