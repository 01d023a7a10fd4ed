#include "folio.h"
#include <iostream>

using namespace folio;

namespace
{

spec::Node text(std::string value, std::vector<mark> marks = {})
{
  static spec::id_generator next_id = spec::sequential_id_generator("t");
  return spec::Node{next_id(), spec::Text{std::move(value), std::move(marks)}, {}};
}

spec::Node node(spec::Content content, std::vector<spec::Node> children = {})
{
  static spec::id_generator next_id = spec::sequential_id_generator("n");
  return spec::Node{next_id(), std::move(content), std::move(children)};
}

} // anonymous namespace

int main(int argc, char* argv[])
{
  try
  {
    ensure(html::escape("a & b < c > d \"e\" 'f'")) == std::string{"a &amp; b &lt; c &gt; d &quot;e&quot; &#x27;f&#x27;"};
    ensure(html::escape("")) == std::string{};

    // headings and paragraphs
    {
      spec::Node root = node(spec::Document{}, {
        node(spec::Heading{10}, {text("Title")}),
        node(spec::Paragraph{}, {text("Hello world.")})
      });
      ensure(html::render_fragment(root)) == std::string{"<h1>Title</h1>\n<p>Hello world.</p>\n"};
      ensure(html::render_fragment(node(spec::Heading{30}, {text("x")}))) == std::string{"<h3>x</h3>\n"};
      ensure(html::render_fragment(node(spec::Heading{5}, {text("x")}))) == std::string{"<h1>x</h1>\n"};
      ensure(html::render_fragment(node(spec::Heading{90}, {text("x")}))) == std::string{"<h6>x</h6>\n"};
    }

    // marks nest strong, em, u and text is escaped inside them
    {
      ensure(html::render_fragment(text("Hi", {mark::bold}))) == std::string{"<strong>Hi</strong>"};
      ensure(html::render_fragment(text("a<b", {mark::underline, mark::italic, mark::bold}))) == std::string{"<u><em><strong>a&lt;b</strong></em></u>"};
      ensure(html::render_fragment(text("x", {mark::italic, mark::italic}))) == std::string{"<em>x</em>"};
      spec::Node paragraph = node(spec::Paragraph{}, {text("plain "), text("bold", {mark::bold}), text(" & more")});
      ensure(html::render_fragment(paragraph)) == std::string{"<p>plain <strong>bold</strong> &amp; more</p>\n"};
    }

    // lists
    {
      spec::Node list = node(spec::OrderedList{}, {
        node(spec::ListItem{1}, {node(spec::Paragraph{}, {text("one")})}),
        node(spec::ListItem{2}, {node(spec::Paragraph{}, {text("two")})})
      });
      ensure(html::render_fragment(list)) == std::string{"<ol>\n<li><p>one</p>\n</li>\n<li><p>two</p>\n</li>\n</ol>\n"};
      spec::Node bullets = node(spec::BulletList{}, {node(spec::ListItem{}, {node(spec::Paragraph{}, {text("x")})})});
      ensure(html::render_fragment(bullets)) == std::string{"<ul>\n<li><p>x</p>\n</li>\n</ul>\n"};
    }

    // tables: header cells in th, body cells in td
    {
      auto cell = [](std::string value) { return node(spec::TableCell{}, {node(spec::Paragraph{}, {text(std::move(value))})}); };
      spec::Node table = node(spec::Table{}, {
        node(spec::TableHeaderRow{}, {cell("Name"), cell("Value")}),
        node(spec::TableRow{}, {cell("a"), cell("1")})
      });
      ensure(html::render_fragment(table)) == std::string{
        "<table>\n"
        "<tr><th><p>Name</p>\n</th><th><p>Value</p>\n</th></tr>\n"
        "<tr><td><p>a</p>\n</td><td><p>1</p>\n</td></tr>\n"
        "</table>\n"};
      ensure(html::render_fragment(node(spec::Table{}))) == std::string{"<table>\n</table>\n"};
    }

    // unknown nodes render their children only
    {
      spec::Node unknown = node(spec::Unknown{"https://spec.nldoc.nl/Resource/Image"}, {node(spec::Paragraph{}, {text("caption")})});
      ensure(html::render_fragment(unknown)) == std::string{"<p>caption</p>\n"};
      ensure(html::render_fragment(node(spec::Unknown{"urn:x"}))) == std::string{};
    }

    // full page
    {
      spec::Node root = node(spec::Document{}, {node(spec::Paragraph{}, {text("Body")})});
      std::string page = html::render(root);
      ensure(page.starts_with("<!DOCTYPE html>\n<html lang=\"nl\">")) == true;
      ensure(page).contains("<meta charset=\"UTF-8\">");
      ensure(page).contains("<title>Geconverteerd Document</title>");
      ensure(page).contains("th { background-color: #f5f5f5; font-weight: bold; }");
      ensure(page).contains("<body>\n<p>Body</p>\n\n</body>\n</html>");
      ensure(page.ends_with("</html>")) == true;
    }

    // rendering does not change the tree
    {
      spec::Node root = spec::build({Page{1, {block::Heading{2, "Kop"}, block::Table{{{"a"}, {"b"}}}}}}, 1, spec::sequential_id_generator());
      spec::Node copy = root;
      std::string first = html::render(root);
      ensure(html::render(root)) == first;
      ensure(root == copy) == true;
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
