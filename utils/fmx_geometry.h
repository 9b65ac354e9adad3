#ifndef FMX_GEOMETRY_H
#define FMX_GEOMETRY_H

#include "fmx_string.h"

// Axis aligned rectangle in page space, y grows downwards
class fmx_rect
{
public:
  double x0;
  double y0;
  double x1;
  double y1;

  fmx_rect();
  fmx_rect(double x0_val, double y0_val, double x1_val, double y1_val);

  double width() const;
  double height() const;
  double center_x() const;
  double center_y() const;
  bool is_empty() const;

  bool contains_point(double px, double py) const;
  bool contains(const fmx_rect& other) const;
  // Touching edges count as intersecting
  bool intersects(const fmx_rect& other) const;

  fmx_rect include(const fmx_rect& other) const;
  fmx_rect expanded(double margin) const;
  double centroid_distance(const fmx_rect& other) const;

  bool operator==(const fmx_rect& other) const;
  bool operator!=(const fmx_rect& other) const { return !(*this == other); }

  // "x0,y0,x1,y1" with one decimal
  fmx_string to_string() const;

  // Reads the to_string() format back. Fails for anything other than four
  // numbers or for a degenerate rectangle.
  static bool parse(const fmx_string& text, fmx_rect& out);
};

#endif // FMX_GEOMETRY_H
