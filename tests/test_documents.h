#ifndef FOLIO_TEST_DOCUMENTS_H
#define FOLIO_TEST_DOCUMENTS_H

#include <cstddef>
#include <string>
#include <vector>

namespace folio::test
{

struct run_spec
{
  std::string text;
  bool bold = false;
  bool italic = false;
  bool underline = false;
  int size_half_points = 0;
};

/// w:p with a style id and runs
std::string paragraph_xml(const std::vector<run_spec>& runs, const std::string& style_id = "", int numbering_id = -1);

/// w:p with one plain run
std::string paragraph_xml(const std::string& text, const std::string& style_id = "");

/// w:tbl of single paragraph cells, spans[r][c] > 1 adds a w:gridSpan
std::string table_xml(const std::vector<std::vector<std::string>>& rows, const std::vector<std::vector<int>>& spans = {});

/// styles.xml with Normal, Heading1..3, Title, ListBullet, ListNumber
std::string default_styles_xml();

/// DOCX package with the given body content (w:p and w:tbl elements), doctype goes before the root element of document.xml
std::vector<std::byte> make_docx(const std::string& body_xml, const std::string& styles_xml = default_styles_xml(), const std::string& doctype = "");

struct pdf_line_spec
{
  std::string text;
  double font_size = 12;
  bool bold = false;
};

/// Single page PDF with one text object per line, top to bottom, Helvetica or Helvetica-Bold
std::vector<std::byte> make_pdf(const std::vector<pdf_line_spec>& lines);

std::vector<std::byte> bytes(const std::string& text);

} // namespace folio::test

#endif // FOLIO_TEST_DOCUMENTS_H
