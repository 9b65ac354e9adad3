#include "fmx_extraction_options.h"
#include "../utils/fmx_env.h"

namespace fmx::extract {

fmx_extraction_options fmx_extraction_options::from_environment()
{
  fmx_extraction_options o;
  o.max_same_line_distance = env_double("FMX_MAX_SAME_LINE_DISTANCE", o.max_same_line_distance);
  o.same_line_tolerance = env_double("FMX_SAME_LINE_TOLERANCE", o.same_line_tolerance);
  o.next_line_max_gap = env_double("FMX_NEXT_LINE_MAX_GAP", o.next_line_max_gap);
  o.next_line_alignment = env_double("FMX_NEXT_LINE_ALIGNMENT", o.next_line_alignment);
  o.next_line_vertical_weight = env_double("FMX_NEXT_LINE_VERTICAL_WEIGHT", o.next_line_vertical_weight);
  o.misalignment_weight = env_double("FMX_MISALIGNMENT_WEIGHT", o.misalignment_weight);
  o.word_gap = env_double("FMX_WORD_GAP", o.word_gap);
  o.line_bucket = env_double("FMX_LINE_BUCKET", o.line_bucket);
  o.checkbox_search_radius = env_double("FMX_CHECKBOX_SEARCH_RADIUS", o.checkbox_search_radius);
  o.checkbox_min_size = env_double("FMX_CHECKBOX_MIN_SIZE", o.checkbox_min_size);
  o.checkbox_max_size = env_double("FMX_CHECKBOX_MAX_SIZE", o.checkbox_max_size);
  o.marker_radius = env_double("FMX_MARKER_RADIUS", o.marker_radius);
  o.max_label_words = env_int("FMX_MAX_LABEL_WORDS", o.max_label_words);
  return o;
}

} // namespace fmx::extract
