#include "fmx_pdf_document.h"
#include "../layout/fmx_grid_detector.h"
#include <podofo/podofo.h>
#include <utf8cpp/utf8.h>
#include <algorithm>
#include <iostream>
#include <stack>

using namespace PoDoFo;

namespace {

  // Height for text entries that come without a bounding box
  const double default_text_height = 10.0;

  // PDF field flags (ISO 32000-1, 12.7.4)
  const int64_t flag_radio = 1 << 15;
  const int64_t flag_pushbutton = 1 << 16;
  const int64_t flag_combo = 1 << 17;

  struct ctm_matrix {
    double a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;

    // this * other, as the cm operator concatenates
    ctm_matrix then(const ctm_matrix& o) const
    {
      ctm_matrix r;
      r.a = a * o.a + b * o.c;
      r.b = a * o.b + b * o.d;
      r.c = c * o.a + d * o.c;
      r.d = c * o.b + d * o.d;
      r.e = e * o.a + f * o.c + o.e;
      r.f = e * o.b + f * o.d + o.f;
      return r;
    }

    void apply(double x, double y, double& ox, double& oy) const
    {
      ox = a * x + c * y + e;
      oy = b * x + d * y + f;
    }
  };

  fmx_string object_text(const PdfObject* obj)
  {
    if (obj == nullptr) return fmx_string();
    if (obj->IsString()) return fmx_string(std::string(obj->GetString().GetString()));
    if (obj->IsName()) return fmx_string(std::string(obj->GetName().GetString()));
    return fmx_string();
  }

  size_t code_point_count(const std::string& text)
  {
    try
    {
      return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
    }
    catch (const utf8::exception&)
    {
      return text.size();
    }
  }

}

fmx_pdf_document::fmx_pdf_document(const fmx_string& filename)
  : filename(filename), open_state(false)
{
}

fmx_pdf_document::~fmx_pdf_document()
{
}

bool fmx_pdf_document::open()
{
  pages.clear();
  try
  {
    m_pdf = std::make_unique<PdfMemDocument>();
    m_pdf->Load(filename.to_std_const());

    PdfPageCollection& page_list = m_pdf->GetPages();
    for (unsigned i = 0; i < page_list.GetCount(); ++i)
    {
      pages.push_back(fmx_memory_page());
      read_page(page_list.GetPageAt(i), pages.back());
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: cannot open PDF " << filename << ": " << e.what() << std::endl;
    m_pdf.reset();
    pages.clear();
    return false;
  }
  open_state = true;
  return true;
}

void fmx_pdf_document::close()
{
  if (!open_state)
  {
    throw fmx_document_closed_exception(filename);
  }
  open_state = false;
  pages.clear();
  m_pdf.reset();
}

size_t fmx_pdf_document::page_count() const
{
  return pages.size();
}

const fmx_page_source& fmx_pdf_document::page(size_t index) const
{
  if (!open_state)
  {
    throw fmx_document_closed_exception(filename);
  }
  if (index >= pages.size())
  {
    throw std::out_of_range("page index out of range");
  }
  return pages[index];
}

void fmx_pdf_document::read_page(PdfPage& page, fmx_memory_page& out)
{
  out.page_width = page.GetRect().Width;
  out.page_height = page.GetRect().Height;
  read_words(page, out);
  read_line_art(page, out);
  read_widgets(page, out);
}

void fmx_pdf_document::read_words(PdfPage& page, fmx_memory_page& out)
{
  std::vector<PdfTextEntry> entries;
  page.ExtractTextTo(entries);

  for (const auto& entry : entries)
  {
    const std::string& text = entry.Text;
    size_t count = code_point_count(text);
    if (count == 0)
    {
      continue;
    }

    double height = default_text_height;
    if (entry.BoundingBox.has_value() && entry.BoundingBox.value().Height > 0)
    {
      height = entry.BoundingBox.value().Height;
    }
    double char_width = entry.Length / static_cast<double>(count);
    double baseline = out.page_height - entry.Y;

    // split the entry at spaces, advancing one code point at a time
    std::string::const_iterator it = text.begin();
    std::string current;
    size_t index = 0;
    size_t word_start = 0;
    while (it != text.end())
    {
      std::string::const_iterator begin = it;
      try
      {
        utf8::next(it, text.end());
      }
      catch (const utf8::exception&)
      {
        ++it;
      }
      std::string glyph(begin, it);
      if (glyph == " " || glyph == "\t")
      {
        if (!current.empty())
        {
          out.add_word(current, entry.X + word_start * char_width, baseline - height,
                       entry.X + index * char_width, baseline);
          current.clear();
        }
        word_start = index + 1;
      }
      else
      {
        current += glyph;
      }
      ++index;
    }
    if (!current.empty())
    {
      out.add_word(current, entry.X + word_start * char_width, baseline - height,
                   entry.X + index * char_width, baseline);
    }
  }
}

void fmx_pdf_document::read_line_art(PdfPage& page, fmx_memory_page& out)
{
  fmx_grid_detector detector;
  std::stack<ctm_matrix> saved;
  ctm_matrix ctm;
  double cur_x = 0, cur_y = 0;
  double height = out.page_height;

  PdfContentStreamReader reader(page);
  PdfContent content;
  while (reader.TryReadNext(content))
  {
    if (content.Type != PdfContentType::Operator)
    {
      continue;
    }

    switch (content.Operator)
    {
      case PdfOperator::q:
        saved.push(ctm);
        break;

      case PdfOperator::Q:
        if (!saved.empty())
        {
          ctm = saved.top();
          saved.pop();
        }
        break;

      case PdfOperator::cm: {
        if (content.Stack.size() < 6) break;
        ctm_matrix m;
        m.a = content.Stack[5].GetReal();
        m.b = content.Stack[4].GetReal();
        m.c = content.Stack[3].GetReal();
        m.d = content.Stack[2].GetReal();
        m.e = content.Stack[1].GetReal();
        m.f = content.Stack[0].GetReal();
        ctm = m.then(ctm);
        break;
      }

      case PdfOperator::re: {
        if (content.Stack.size() < 4) break;
        double x = content.Stack[3].GetReal();
        double y = content.Stack[2].GetReal();
        double w = content.Stack[1].GetReal();
        double h = content.Stack[0].GetReal();
        double ax, ay, bx, by;
        ctm.apply(x, y, ax, ay);
        ctm.apply(x + w, y + h, bx, by);
        fmx_rect rect(std::min(ax, bx), height - std::max(ay, by),
                      std::max(ax, bx), height - std::min(ay, by));
        out.shape_list.push_back(rect);
        detector.add_rectangle(rect);
        break;
      }

      case PdfOperator::m:
        if (content.Stack.size() < 2) break;
        ctm.apply(content.Stack[1].GetReal(), content.Stack[0].GetReal(), cur_x, cur_y);
        break;

      case PdfOperator::l: {
        if (content.Stack.size() < 2) break;
        double x, y;
        ctm.apply(content.Stack[1].GetReal(), content.Stack[0].GetReal(), x, y);
        detector.add_segment(cur_x, height - cur_y, x, height - y);
        cur_x = x;
        cur_y = y;
        break;
      }

      default:
        break;
    }
  }

  for (auto& grid : detector.detect())
  {
    for (size_t r = 0; r < grid.row_count(); ++r)
    {
      for (size_t c = 0; c < grid.column_count(r); ++c)
      {
        grid.cells[r][c] = out.text_in_region(grid.cell_rect(r, c));
      }
    }
    out.add_table(grid);
  }
}

void fmx_pdf_document::read_widgets(PdfPage& page, fmx_memory_page& out)
{
  PdfAnnotationCollection& annotations = page.GetAnnotations();
  for (unsigned i = 0; i < annotations.GetCount(); ++i)
  {
    PdfAnnotation& annot = annotations.GetAnnotAt(i);
    if (annot.GetType() != PdfAnnotationType::Widget)
    {
      continue;
    }

    const PdfDictionary& dict = annot.GetDictionary();
    fmx_string field_type = object_text(dict.FindKeyParent("FT"));
    const PdfObject* flags_obj = dict.FindKeyParent("Ff");
    int64_t flags = (flags_obj != nullptr && flags_obj->IsNumber()) ? flags_obj->GetNumber() : 0;
    fmx_string value = object_text(dict.FindKeyParent("V"));
    fmx_string state = object_text(dict.FindKey("AS"));

    fmx_widget widget;
    widget.field_name = object_text(dict.FindKeyParent("T"));
    if (field_type == "Btn")
    {
      if (flags & flag_pushbutton)
      {
        continue;
      }
      if (flags & flag_radio)
      {
        // every button of a group shares V, only the selected one is not Off
        widget.field_type = fmx_widget_type::radio;
        widget.field_value = (state.empty() || state != "Off") ? value : fmx_string("Off");
      }
      else
      {
        widget.field_type = fmx_widget_type::checkbox;
        widget.field_value = state.empty() ? value : state;
      }
    }
    else if (field_type == "Tx")
    {
      widget.field_type = fmx_widget_type::text;
      widget.field_value = value;
    }
    else if (field_type == "Ch")
    {
      widget.field_type = (flags & flag_combo) ? fmx_widget_type::combo : fmx_widget_type::list;
      widget.field_value = value;
    }
    else
    {
      continue;
    }

    Rect r = annot.GetRect();
    widget.rect = fmx_rect(r.X, out.page_height - (r.Y + r.Height), r.X + r.Width, out.page_height - r.Y);
    out.widget_list.push_back(widget);
  }
}
