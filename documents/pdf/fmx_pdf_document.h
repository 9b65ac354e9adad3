#ifndef FMX_PDF_DOCUMENT_H
#define FMX_PDF_DOCUMENT_H

#include "../fmx_memory_document.h"
#include <memory>
#include <vector>

namespace PoDoFo {
  class PdfMemDocument;
  class PdfPage;
}

// PDF engine on top of PoDoFo. open() decodes every page once: words from
// the text layer, rectangles and rules from the content stream, form
// widgets from the annotations and ruled tables from the grid detector.
// All coordinates are converted to top-down page space.
class fmx_pdf_document : public fmx_document
{
private:
  fmx_string filename;
  std::unique_ptr<PoDoFo::PdfMemDocument> m_pdf;
  std::vector<fmx_memory_page> pages;
  bool open_state;

  void read_page(PoDoFo::PdfPage& page, fmx_memory_page& out);
  void read_words(PoDoFo::PdfPage& page, fmx_memory_page& out);
  void read_line_art(PoDoFo::PdfPage& page, fmx_memory_page& out);
  void read_widgets(PoDoFo::PdfPage& page, fmx_memory_page& out);

public:
  explicit fmx_pdf_document(const fmx_string& filename);
  ~fmx_pdf_document();

  bool open() override;
  void close() override;
  bool is_open() const override { return open_state; }
  size_t page_count() const override;
  const fmx_page_source& page(size_t index) const override;
  fmx_string source_name() const override { return filename; }
};

#endif // FMX_PDF_DOCUMENT_H
