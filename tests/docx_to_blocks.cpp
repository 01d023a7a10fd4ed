#include "folio.h"
#include "test_documents.h"
#include <iostream>

using namespace folio;

namespace
{

std::vector<Block> blocks_of(const std::string& body_xml)
{
  std::vector<Page> pages = docx_extractor{}.extract(test::make_docx(body_xml));
  ensure(pages.size()) == 1;
  ensure(pages[0].number) == 1;
  return pages[0].blocks;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
  try
  {
    // heading style and plain paragraph
    {
      std::vector<Block> blocks = blocks_of(test::paragraph_xml("Title", "Heading1") + test::paragraph_xml("Hello world."));
      ensure(blocks.size()) == 2;
      const auto& heading = std::get<block::Heading>(blocks[0]);
      ensure(heading.level) == 1;
      ensure(heading.text) == "Title";
      ensure(std::get<block::Paragraph>(blocks[1]).text) == "Hello world.";
    }

    // heading levels from style names, Dutch "Kop" included
    {
      std::vector<Block> blocks = blocks_of(test::paragraph_xml("Two", "Heading2") + test::paragraph_xml("Kop", "Kop2") + test::paragraph_xml("Doc", "Title"));
      ensure(std::get<block::Heading>(blocks[0]).level) == 2;
      ensure(std::get<block::Heading>(blocks[1]).level) == 2;
      ensure(std::get<block::Heading>(blocks[2]).level) == 1;
    }

    // run formatting, hyperlink runs and empty runs
    {
      std::string body = "<w:p><w:r><w:rPr><w:b/></w:rPr><w:t>Bold</w:t></w:r>"
        "<w:r><w:t xml:space=\"preserve\"> and </w:t></w:r>"
        "<w:r><w:rPr><w:i/><w:u w:val=\"single\"/></w:rPr><w:t>styled</w:t></w:r>"
        "<w:r><w:t></w:t></w:r>"
        "<w:hyperlink><w:r><w:t xml:space=\"preserve\"> link</w:t></w:r></w:hyperlink>"
        "<w:r><w:rPr><w:b w:val=\"0\"/></w:rPr><w:tab/><w:t>end</w:t></w:r></w:p>";
      std::vector<Block> blocks = blocks_of(body + test::paragraph_xml("More text follows here, long enough to stay a paragraph."));
      // bold first run and a short text make a level 3 heading
      const auto& heading = std::get<block::Heading>(blocks[0]);
      ensure(heading.level) == 3;
      ensure(heading.text) == "Bold and styled link\tend";
      ensure(heading.runs.size()) == 5;
      ensure(heading.runs[0] == Run{"Bold", {mark::bold}}) == true;
      ensure(heading.runs[1] == Run{" and ", {}}) == true;
      ensure(heading.runs[2] == Run{"styled", {mark::italic, mark::underline}}) == true;
      ensure(heading.runs[3].text) == " link";
      ensure(heading.runs[4] == Run{"\tend", {}}) == true;
      ensure(std::holds_alternative<block::Paragraph>(blocks[1])) == true;
    }

    // bold paragraph promotion depends on word count and size
    {
      std::string long_bold = test::paragraph_xml(std::vector<test::run_spec>{{"A bold sentence that is somewhat longer than eight words", true}});
      std::string long_bold_large = test::paragraph_xml(std::vector<test::run_spec>{{"A bold sentence that is somewhat longer than eight words", true, false, false, 28}});
      std::vector<Block> blocks = blocks_of(long_bold + long_bold_large);
      ensure(std::holds_alternative<block::Paragraph>(blocks[0])) == true;
      ensure(std::get<block::Heading>(blocks[1]).level) == 3;
    }

    // lists: numbering, style names and text prefixes, split by kind, empty paragraphs and tables
    {
      std::string body =
        test::paragraph_xml({{"first"}}, "", 1) +
        test::paragraph_xml({{"second"}}, "", 1) +
        test::paragraph_xml({{"numbered"}}, "", 11) +
        test::paragraph_xml("styled", "ListNumber") +
        test::paragraph_xml("") +
        test::paragraph_xml("\xE2\x80\xA2 glyph") +
        test::paragraph_xml("- dash") +
        test::table_xml({{"a"}}) +
        test::paragraph_xml("1. one") +
        test::paragraph_xml("Title", "Heading1") +
        test::paragraph_xml("2) two");
      std::vector<Block> blocks = blocks_of(body);
      ensure(blocks.size()) == 7;
      const auto& bullets = std::get<block::BulletList>(blocks[0]);
      ensure(bullets.items.size()) == 2;
      ensure(bullets.items[0].text) == "first";
      const auto& numbers = std::get<block::OrderedList>(blocks[1]);
      ensure(numbers.items.size()) == 2;
      ensure(numbers.items[1].text) == "styled";
      ensure(std::get<block::BulletList>(blocks[2]).items.size()) == 2;
      ensure(std::holds_alternative<block::Table>(blocks[3])) == true;
      ensure(std::get<block::OrderedList>(blocks[4]).items.size()) == 1;
      ensure(std::holds_alternative<block::Heading>(blocks[5])) == true;
      // still pending at the end of the body
      ensure(std::get<block::OrderedList>(blocks[6]).items[0].text) == "2) two";
    }

    // tables: newline joined cell paragraphs and repeated spanning cells
    {
      std::string body = test::table_xml({{"Name", "Value"}, {"wide"}, {"a", "b"}}, {{}, {2}, {}});
      body.insert(body.find("<w:tc>") + 6, test::paragraph_xml("Top"));
      std::vector<Block> blocks = blocks_of(body);
      ensure(blocks.size()) == 1;
      const auto& table = std::get<block::Table>(blocks[0]);
      ensure(table.rows.size()) == 3;
      ensure(table.rows[0][0]) == "Top\nName";
      ensure(table.rows[1]) == std::vector<std::string>{"wide", "wide"};
      ensure(table.rows[2]) == std::vector<std::string>{"a", "b"};
    }

    // vertically merged cells take the text of the cell above
    {
      std::string body = "<w:tbl>"
        "<w:tr><w:tc><w:tcPr><w:vMerge w:val=\"restart\"/></w:tcPr>" + test::paragraph_xml("merged") + "</w:tc><w:tc>" + test::paragraph_xml("x") + "</w:tc></w:tr>"
        "<w:tr><w:tc><w:tcPr><w:vMerge/></w:tcPr>" + test::paragraph_xml("") + "</w:tc><w:tc>" + test::paragraph_xml("y") + "</w:tc></w:tr>"
        "</w:tbl>";
      std::vector<Block> blocks = blocks_of(body);
      const auto& table = std::get<block::Table>(blocks[0]);
      ensure(table.rows[1]) == std::vector<std::string>{"merged", "y"};
    }

    // missing styles part: style ids are used as names
    {
      std::vector<Page> pages = docx_extractor{}.extract(test::make_docx(test::paragraph_xml("Title", "heading1"), "<w:styles xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"/>"));
      ensure(std::get<block::Heading>(pages[0].blocks[0]).text) == "Title";
    }

    // damaged input gives no pages
    ensure(docx_extractor{}.extract(test::bytes("PK\x03\x04 not really a zip")).size()) == 0;
    ensure(docx_extractor{}.extract(test::bytes("")).size()) == 0;
    {
      bool thrown = false;
      try
      {
        docx_extractor{}.extract_or_throw(test::bytes("garbage"));
      }
      catch (const std::exception& e)
      {
        thrown = errors::contains_type<errors::uninterpretable_data>(e);
      }
      ensure(thrown) == true;
    }

    // entity declarations in a part are refused instead of expanded
    {
      std::string doctype = "<!DOCTYPE w:document [<!ENTITY e0 \"ha\">";
      for (int level = 1; level <= 4; ++level)
      {
        std::string previous = "&e" + std::to_string(level - 1) + ";";
        std::string expansion;
        for (int i = 0; i < 10; ++i)
          expansion += previous;
        doctype += "<!ENTITY e" + std::to_string(level) + " \"" + expansion + "\">";
      }
      doctype += "]>";
      std::vector<std::byte> package = test::make_docx("<w:p><w:r><w:t>&e4;</w:t></w:r></w:p>", test::default_styles_xml(), doctype);
      ensure(docx_extractor{}.extract(package).size()) == 0;
      bool thrown = false;
      try
      {
        docx_extractor{}.extract_or_throw(package);
      }
      catch (const std::exception& e)
      {
        thrown = errors::contains_type<errors::uninterpretable_data>(e);
      }
      ensure(thrown) == true;
    }

    // parts declaring more than the configured size are not inflated
    {
      std::vector<std::byte> package = test::make_docx(test::paragraph_xml("Fits easily"));
      ensure(docx_extractor{}.extract(package).size()) == 1;
      ensure(docx_extractor{docx_heuristics{.max_part_size = 64}}.extract(package).size()) == 0;
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
