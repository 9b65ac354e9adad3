#include "fmx_memory_document.h"
#include "../api/json/fmx_json.h"
#include <iostream>

namespace {

  bool read_rect(const fmx_variant* value, fmx_rect& out)
  {
    if (value == nullptr || !value->is_vector() || value->vector_value().size() != 4)
    {
      return false;
    }
    double v[4];
    for (size_t i = 0; i < 4; ++i)
    {
      const fmx_variant& n = value->vector_value()[i];
      if (!n.converts_to(fmx_variant::double_state))
      {
        return false;
      }
      v[i] = n.convert(fmx_variant::double_state).double_value();
    }
    out = fmx_rect(v[0], v[1], v[2], v[3]);
    return true;
  }

  bool read_page(const fmxv_map& data, fmx_memory_page& page, size_t page_index)
  {
    page.page_width = fmxv_get_double(data, "width", page.page_width);
    page.page_height = fmxv_get_double(data, "height", page.page_height);

    const fmx_variant* words = fmxv_find(data, "words");
    if (words != nullptr && words->is_vector())
    {
      for (const auto& entry : words->vector_value())
      {
        fmx_rect rect;
        if (!entry.is_map() || !read_rect(fmxv_find(entry.map_value(), "rect"), rect))
        {
          std::cerr << "Error: page " << page_index << ": word without text/rect" << std::endl;
          return false;
        }
        page.word_list.push_back({fmxv_get_string(entry.map_value(), "text"), rect});
      }
    }

    const fmx_variant* shapes = fmxv_find(data, "shapes");
    if (shapes != nullptr && shapes->is_vector())
    {
      for (const auto& entry : shapes->vector_value())
      {
        fmx_rect rect;
        if (!read_rect(&entry, rect))
        {
          std::cerr << "Error: page " << page_index << ": shape is not [x0, y0, x1, y1]" << std::endl;
          return false;
        }
        page.shape_list.push_back(rect);
      }
    }

    const fmx_variant* widgets = fmxv_find(data, "widgets");
    if (widgets != nullptr && widgets->is_vector())
    {
      for (const auto& entry : widgets->vector_value())
      {
        fmx_widget widget;
        if (!entry.is_map() || !read_rect(fmxv_find(entry.map_value(), "rect"), widget.rect))
        {
          std::cerr << "Error: page " << page_index << ": widget without rect" << std::endl;
          return false;
        }
        const fmxv_map& w = entry.map_value();
        widget.field_name = fmxv_get_string(w, "name");
        widget.field_value = fmxv_get_string(w, "value");
        fmx_string type = fmxv_get_string(w, "type", "text");
        if (!parse_widget_type(type, widget.field_type))
        {
          std::cerr << "Error: page " << page_index << ": unknown widget type '" << type << "'" << std::endl;
          return false;
        }
        page.widget_list.push_back(widget);
      }
    }

    const fmx_variant* tables = fmxv_find(data, "tables");
    if (tables != nullptr && tables->is_vector())
    {
      for (const auto& entry : tables->vector_value())
      {
        if (!entry.is_map())
        {
          std::cerr << "Error: page " << page_index << ": table is not an object" << std::endl;
          return false;
        }
        fmx_table_grid grid;
        const fmx_variant* cells = fmxv_find(entry.map_value(), "cells");
        if (cells != nullptr && cells->is_vector())
        {
          for (const auto& row : cells->vector_value())
          {
            std::vector<fmx_string> row_cells;
            if (row.is_vector())
            {
              for (const auto& c : row.vector_value())
              {
                row_cells.push_back(c.is_null() ? fmx_string() : c.convert(fmx_variant::string_state).string_value());
              }
            }
            grid.cells.push_back(row_cells);
          }
        }
        // shape mismatches between cells and rects are left to the table strategy
        const fmx_variant* rects = fmxv_find(entry.map_value(), "cell_rects");
        if (rects != nullptr && rects->is_vector())
        {
          for (const auto& row : rects->vector_value())
          {
            std::vector<fmx_rect> row_rects;
            if (row.is_vector())
            {
              for (const auto& r : row.vector_value())
              {
                fmx_rect rect;
                if (!read_rect(&r, rect))
                {
                  std::cerr << "Error: page " << page_index << ": cell rect is not [x0, y0, x1, y1]" << std::endl;
                  return false;
                }
                row_rects.push_back(rect);
              }
            }
            grid.cell_rects.push_back(row_rects);
          }
        }
        page.table_list.push_back(grid);
      }
    }
    return true;
  }

}

fmx_memory_page& fmx_memory_page::add_word(const fmx_string& text, double x0, double y0, double x1, double y1)
{
  word_list.push_back({text, fmx_rect(x0, y0, x1, y1)});
  return *this;
}

fmx_memory_page& fmx_memory_page::add_shape(double x0, double y0, double x1, double y1)
{
  shape_list.push_back(fmx_rect(x0, y0, x1, y1));
  return *this;
}

fmx_memory_page& fmx_memory_page::add_widget(const fmx_string& name, fmx_widget_type type, const fmx_string& value, const fmx_rect& rect)
{
  fmx_widget widget;
  widget.field_name = name;
  widget.field_type = type;
  widget.field_value = value;
  widget.rect = rect;
  widget_list.push_back(widget);
  return *this;
}

fmx_memory_page& fmx_memory_page::add_table(const fmx_table_grid& table)
{
  table_list.push_back(table);
  return *this;
}

fmx_memory_document::fmx_memory_document(const fmx_string& path) : dump_path(path), open_state(false)
{
}

fmx_memory_page& fmx_memory_document::add_page()
{
  pages.push_back(fmx_memory_page());
  return pages.back();
}

bool fmx_memory_document::from_variant(const fmxv_map& dump)
{
  pages.clear();
  const fmx_variant* list = fmxv_find(dump, "pages");
  if (list == nullptr || !list->is_vector())
  {
    std::cerr << "Error: page dump has no 'pages' array" << std::endl;
    return false;
  }
  for (size_t i = 0; i < list->vector_value().size(); ++i)
  {
    const fmx_variant& entry = list->vector_value()[i];
    if (!entry.is_map())
    {
      std::cerr << "Error: page " << i << " is not an object" << std::endl;
      return false;
    }
    if (!read_page(entry.map_value(), add_page(), i))
    {
      pages.clear();
      return false;
    }
  }
  return true;
}

bool fmx_memory_document::open()
{
  if (!dump_path.empty())
  {
    fmxv_map dump;
    fmx_json json(&dump);
    if (!json.load_file(dump_path) || !from_variant(dump))
    {
      return false;
    }
  }
  open_state = true;
  return true;
}

void fmx_memory_document::close()
{
  if (!open_state)
  {
    throw fmx_document_closed_exception(source_name());
  }
  open_state = false;
}

size_t fmx_memory_document::page_count() const
{
  return pages.size();
}

const fmx_page_source& fmx_memory_document::page(size_t index) const
{
  if (!open_state)
  {
    throw fmx_document_closed_exception(source_name());
  }
  if (index >= pages.size())
  {
    throw std::out_of_range("page index out of range");
  }
  return pages[index];
}

fmx_string fmx_memory_document::source_name() const
{
  return dump_path.empty() ? fmx_string("memory") : dump_path;
}
