#ifndef FMX_EXTRACTION_OPTIONS_H
#define FMX_EXTRACTION_OPTIONS_H

namespace fmx::extract {

// Engine tunables in PDF points
struct fmx_extraction_options {
  // Value associator
  double max_same_line_distance = 300;
  double same_line_tolerance = 4;
  double next_line_max_gap = 20;
  double next_line_alignment = 20;
  double next_line_vertical_weight = 2.0;
  double misalignment_weight = 0.5;
  double word_gap = 10;

  // Baseline jitter allowed within one text line
  double line_bucket = 3;

  // Checkbox resolver
  double checkbox_search_radius = 50;
  double checkbox_min_size = 5;
  double checkbox_max_size = 100;
  double marker_radius = 25;

  // Longest label a colon token may extend to on its left
  int max_label_words = 4;

  // Defaults overridden by FMX_* environment variables
  static fmx_extraction_options from_environment();
};

} // namespace fmx::extract

#endif // FMX_EXTRACTION_OPTIONS_H
