#include <boost/json.hpp>
#include "folio.h"
#include <iostream>

using namespace folio;

namespace
{

spec::id_generator next_id = spec::sequential_id_generator();

spec::Node node(spec::Content content, std::vector<spec::Node> children = {})
{
  return spec::Node{next_id(), std::move(content), std::move(children)};
}

spec::Node text(std::string value, std::vector<mark> marks = {})
{
  return node(spec::Text{std::move(value), std::move(marks)});
}

std::string serialized(const boost::json::value& value)
{
  return boost::json::serialize(value);
}

} // anonymous namespace

int main(int argc, char* argv[])
{
  try
  {
    ensure(std::string{tiptap::content_type}) == "application/vnd.nldoc.tiptap+json";

    // bold text in a paragraph
    {
      spec::Node root = node(spec::Document{}, {node(spec::Paragraph{}, {text("Hi", {mark::bold})})});
      boost::json::object doc = tiptap::render(root);
      ensure(serialized(doc.at("type"))) == "\"doc\"";
      const boost::json::array& content = doc.at("content").as_array();
      ensure(content.size()) == 1;
      ensure(serialized(content[0])) == R"({"type":"paragraph","content":[{"type":"text","text":"Hi","marks":[{"type":"bold"}]}]})";
      ensure(html::render_fragment(root.children[0])) == "<p><strong>Hi</strong></p>\n";
    }

    // marks keep their order, text without marks has no marks key
    {
      boost::json::object paragraph = *tiptap::render_block(node(spec::Paragraph{}, {text("a", {mark::underline, mark::italic}), text("b")}));
      ensure(serialized(paragraph)) == R"({"type":"paragraph","content":[{"type":"text","text":"a","marks":[{"type":"underline"},{"type":"italic"}]},{"type":"text","text":"b"}]})";
    }

    // heading levels
    {
      ensure(serialized(*tiptap::render_block(node(spec::Heading{20}, {text("Kop")})))) == R"({"type":"heading","attrs":{"level":2},"content":[{"type":"text","text":"Kop"}]})";
      ensure(serialized(tiptap::render_block(node(spec::Heading{70}))->at("attrs"))) == R"({"level":6})";
      ensure(serialized(tiptap::render_block(node(spec::Heading{0}))->at("attrs"))) == R"({"level":1})";
    }

    // empty inline content becomes one empty text node
    ensure(serialized(*tiptap::render_block(node(spec::Paragraph{})))) == R"({"type":"paragraph","content":[{"type":"text","text":""}]})";

    // lists
    {
      spec::Node list = node(spec::OrderedList{}, {node(spec::ListItem{1}, {node(spec::Paragraph{}, {text("one")})})});
      ensure(serialized(*tiptap::render_block(list))) == R"({"type":"orderedList","content":[{"type":"listItem","content":[{"type":"paragraph","content":[{"type":"text","text":"one"}]}]}]})";
      ensure(serialized(*tiptap::render_block(node(spec::BulletList{})))) == R"({"type":"bulletList","content":[]})";
    }

    // tables: header cells, body cells, empty cells get an empty paragraph
    {
      spec::Node table = node(spec::Table{}, {
        node(spec::TableHeaderRow{}, {node(spec::TableCell{}, {node(spec::Paragraph{}, {text("H")})})}),
        node(spec::TableRow{}, {node(spec::TableCell{})})
      });
      ensure(serialized(*tiptap::render_block(table))) ==
        R"({"type":"table","content":[)"
        R"({"type":"tableRow","content":[{"type":"tableHeader","content":[{"type":"paragraph","content":[{"type":"text","text":"H"}]}]}]},)"
        R"({"type":"tableRow","content":[{"type":"tableCell","content":[{"type":"paragraph","content":[{"type":"text","text":""}]}]}]})"
        R"(]})";
    }

    // nodes without a block form
    ensure(tiptap::render_block(text("loose")).has_value()) == false;
    ensure(tiptap::render_block(node(spec::TableCell{})).has_value()) == false;
    ensure(tiptap::render_block(node(spec::Unknown{"https://spec.nldoc.nl/Resource/Image"})).has_value()) == false;
    {
      spec::Node root = node(spec::Document{}, {
        node(spec::Unknown{"urn:figure"}, {node(spec::Paragraph{}, {text("hidden")})}),
        node(spec::Paragraph{}, {text("shown")})
      });
      ensure(tiptap::render(root).at("content").as_array().size()) == 1;
    }

    // a root that is not a Document gives an empty document
    ensure(tiptap::render_to_string(node(spec::Paragraph{}, {text("x")}))) == R"({"type":"doc","content":[]})";

    // built tree end to end
    {
      spec::Node root = spec::build({Page{1, {block::Heading{1, "Title"}, block::Paragraph{"Hello world."}}}}, 1);
      spec::Node copy = root;
      ensure(tiptap::render_to_string(root)) ==
        R"({"type":"doc","content":[{"type":"heading","attrs":{"level":1},"content":[{"type":"text","text":"Title"}]},)"
        R"({"type":"paragraph","content":[{"type":"text","text":"Hello world."}]}]})";
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
