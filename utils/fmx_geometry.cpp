#include "fmx_geometry.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

fmx_rect::fmx_rect() : x0(0), y0(0), x1(0), y1(0) {}

fmx_rect::fmx_rect(double x0_val, double y0_val, double x1_val, double y1_val)
  : x0(x0_val), y0(y0_val), x1(x1_val), y1(y1_val)
{
}

double fmx_rect::width() const {
  return x1 - x0;
}

double fmx_rect::height() const {
  return y1 - y0;
}

double fmx_rect::center_x() const {
  return (x0 + x1) / 2.0;
}

double fmx_rect::center_y() const {
  return (y0 + y1) / 2.0;
}

bool fmx_rect::is_empty() const {
  return width() <= 0 || height() <= 0;
}

bool fmx_rect::contains_point(double px, double py) const {
  return px >= x0 && px <= x1 &&
         py >= y0 && py <= y1;
}

bool fmx_rect::contains(const fmx_rect& other) const {
  return other.x0 >= x0 &&
         other.x1 <= x1 &&
         other.y0 >= y0 &&
         other.y1 <= y1;
}

bool fmx_rect::intersects(const fmx_rect& other) const {
  return !(other.x1 < x0 ||
           other.x0 > x1 ||
           other.y1 < y0 ||
           other.y0 > y1);
}

fmx_rect fmx_rect::include(const fmx_rect& other) const {
  return fmx_rect(std::min(x0, other.x0), std::min(y0, other.y0),
                  std::max(x1, other.x1), std::max(y1, other.y1));
}

fmx_rect fmx_rect::expanded(double margin) const {
  return fmx_rect(x0 - margin, y0 - margin, x1 + margin, y1 + margin);
}

double fmx_rect::centroid_distance(const fmx_rect& other) const {
  double dx = center_x() - other.center_x();
  double dy = center_y() - other.center_y();
  return std::sqrt(dx * dx + dy * dy);
}

bool fmx_rect::operator==(const fmx_rect& other) const {
  return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 && y1 == other.y1;
}

fmx_string fmx_rect::to_string() const {
  char buf[128];
  std::snprintf(buf, sizeof(buf), "%.1f,%.1f,%.1f,%.1f", x0, y0, x1, y1);
  return fmx_string(buf);
}

bool fmx_rect::parse(const fmx_string& text, fmx_rect& out) {
  std::vector<fmx_string> parts = text.split(",");
  if (parts.size() != 4) {
    return false;
  }
  double v[4];
  for (size_t i = 0; i < 4; ++i) {
    fmx_string part = parts[i].trim();
    if (!part.is_numeric()) {
      return false;
    }
    v[i] = part.to_double(0);
  }
  fmx_rect r(v[0], v[1], v[2], v[3]);
  if (r.is_empty()) {
    return false;
  }
  out = r;
  return true;
}
