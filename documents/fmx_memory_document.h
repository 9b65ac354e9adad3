#ifndef FMX_MEMORY_DOCUMENT_H
#define FMX_MEMORY_DOCUMENT_H

#include "fmx_doc_source.h"
#include "../utils/fmx_variant.h"

class fmx_memory_page : public fmx_page_source
{
public:
  double page_width = 612;
  double page_height = 792;
  std::vector<fmx_word> word_list;
  std::vector<fmx_rect> shape_list;
  std::vector<fmx_table_grid> table_list;
  std::vector<fmx_widget> widget_list;

  fmx_memory_page& add_word(const fmx_string& text, double x0, double y0, double x1, double y1);
  fmx_memory_page& add_shape(double x0, double y0, double x1, double y1);
  fmx_memory_page& add_widget(const fmx_string& name, fmx_widget_type type, const fmx_string& value, const fmx_rect& rect);
  fmx_memory_page& add_table(const fmx_table_grid& table);

  double width() const override { return page_width; }
  double height() const override { return page_height; }
  std::vector<fmx_word> words() const override { return word_list; }
  std::vector<fmx_rect> vector_shapes() const override { return shape_list; }
  std::vector<fmx_table_grid> tables() const override { return table_list; }
  std::vector<fmx_widget> widgets() const override { return widget_list; }
};

// Document held in memory. Built directly by callers, or read from a JSON
// page dump when a path is given:
//
// {"pages": [{"width": 612, "height": 792,
//             "words":   [{"text": "Surname:", "rect": [0, 0, 40, 10]}],
//             "shapes":  [[100, 100, 110, 110]],
//             "widgets": [{"name": "Agree", "type": "checkbox", "value": "Yes", "rect": [...]}],
//             "tables":  [{"cells": [["Name", "Age"], ["Ann", "7"]],
//                          "cell_rects": [[[...], [...]], [[...], [...]]]}]}]}
class fmx_memory_document : public fmx_document
{
  fmx_string dump_path;
  std::vector<fmx_memory_page> pages;
  bool open_state;

public:
  explicit fmx_memory_document(const fmx_string& path = "");

  fmx_memory_page& add_page();
  bool from_variant(const fmxv_map& dump);

  bool open() override;
  void close() override;
  bool is_open() const override { return open_state; }
  size_t page_count() const override;
  const fmx_page_source& page(size_t index) const override;
  fmx_string source_name() const override;
};

#endif // FMX_MEMORY_DOCUMENT_H
