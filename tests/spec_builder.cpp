#include "folio.h"
#include <iostream>
#include <set>

using namespace folio;

namespace
{

void collect_ids(const spec::Node& node, std::vector<std::string>& ids)
{
  ids.push_back(node.id);
  for (const spec::Node& child : node.children)
    collect_ids(child, ids);
}

} // anonymous namespace

int main(int argc, char* argv[])
{
  try
  {
    // headings: levels in tens, clamped
    {
      spec::Node root = spec::build({Page{1, {block::Heading{1, "One"}, block::Heading{3, "Three"}, block::Heading{9, "Deep"}, block::Heading{0, "Zero"}}}}, 1, spec::sequential_id_generator());
      ensure(root.is<spec::Document>()) == true;
      ensure(root.children.size()) == 4;
      ensure(root.children[0].as<spec::Heading>().level) == 10;
      ensure(root.children[1].as<spec::Heading>().level) == 30;
      ensure(root.children[2].as<spec::Heading>().level) == 60;
      ensure(root.children[3].as<spec::Heading>().level) == 10;
      ensure(spec::plain_text(root.children[0])) == "One";
      ensure(root.children[0].children.size()) == 1;
      ensure(root.children[0].children[0].is<spec::Text>()) == true;
      ensure(root.children[0].children[0].children.size()) == 0;
    }

    // runs become marked Text nodes, blocks without runs get one trimmed Text
    {
      block::Paragraph formatted{"Hi there", {Run{"Hi", {mark::underline, mark::bold}}, Run{" there", {}}}};
      spec::Node root = spec::build({Page{1, {formatted, block::Paragraph{"  plain  "}}}}, 1, spec::sequential_id_generator());
      const spec::Node& paragraph = root.children[0];
      ensure(paragraph.children.size()) == 2;
      ensure(paragraph.children[0].as<spec::Text>() == spec::Text{"Hi", {mark::bold, mark::underline}}) == true;
      ensure(paragraph.children[1].as<spec::Text>().marks.size()) == 0;
      ensure(root.children[1].children[0].as<spec::Text>().text) == "plain";
    }

    // empty paragraphs, tables and lists are skipped
    {
      std::vector<Page> pages {
        Page{1, {block::Paragraph{""}, block::Paragraph{"  \t "}, block::Table{}, block::BulletList{}}},
        Page{2, {block::Paragraph{"Kept"}}}
      };
      spec::Node root = spec::build(pages, 2, spec::sequential_id_generator());
      ensure(root.children.size()) == 1;
      ensure(spec::plain_text(root)) == "Kept";
    }

    // tables: header row first, every cell a Paragraph with one Text
    {
      block::Table table{{{"h1", "h2", "h3"}, {"a", "b", "c"}, {"d", "e", "f"}}};
      spec::Node root = spec::build({Page{1, {table}}}, 1, spec::sequential_id_generator());
      const spec::Node& node = root.children[0];
      ensure(node.is<spec::Table>()) == true;
      ensure(node.children.size()) == 3;
      ensure(node.children[0].is<spec::TableHeaderRow>()) == true;
      ensure(node.children[1].is<spec::TableRow>()) == true;
      ensure(node.children[2].is<spec::TableRow>()) == true;
      for (const spec::Node& row : node.children)
      {
        ensure(row.children.size()) == 3;
        for (const spec::Node& cell : row.children)
        {
          ensure(cell.is<spec::TableCell>()) == true;
          ensure(cell.children.size()) == 1;
          ensure(cell.children[0].is<spec::Paragraph>()) == true;
          ensure(cell.children[0].children.size()) == 1;
        }
      }
      ensure(spec::plain_text(node.children[2].children[1])) == "e";
    }

    // lists: ordered items are numbered from 1, bullet items have no order
    {
      std::vector<block::ListItem> items {{"first"}, {"second"}, {"third"}};
      spec::Node root = spec::build({Page{1, {block::OrderedList{items}, block::BulletList{items}}}}, 1, spec::sequential_id_generator());
      const spec::Node& ordered = root.children[0];
      ensure(ordered.is<spec::OrderedList>()) == true;
      ensure(ordered.children.size()) == 3;
      for (std::size_t i = 0; i < 3; ++i)
      {
        ensure(ordered.children[i].as<spec::ListItem>().order) == std::optional<int>{static_cast<int>(i) + 1};
        ensure(ordered.children[i].children[0].is<spec::Paragraph>()) == true;
      }
      ensure(spec::plain_text(ordered.children[1])) == "second";
      const spec::Node& bullets = root.children[1];
      ensure(bullets.is<spec::BulletList>()) == true;
      ensure(bullets.children[0].as<spec::ListItem>().order.has_value()) == false;
    }

    // nothing extracted: one fallback paragraph naming the page count
    {
      spec::Node root = spec::build({}, 3, spec::sequential_id_generator());
      ensure(root.children.size()) == 1;
      ensure(root.children[0].is<spec::Paragraph>()) == true;
      ensure(spec::plain_text(root)) == "Dit document bevat 3 pagina's maar de tekst kon niet worden ge\xC3\xABxtraheerd.";
      ensure(spec::plain_text(spec::build({Page{1, {}}, Page{2, {}}}, 10))).contains("bevat 10 pagina's");
    }

    // ids are unique within a tree, for both generators
    for (spec::id_generator generator : {spec::sequential_id_generator("n"), spec::uuid_id_generator()})
    {
      std::vector<Page> pages {
        Page{1, {block::Heading{1, "Title"}, block::Table{{{"a", "b"}, {"c", "d"}}}}},
        Page{2, {block::OrderedList{{{"x"}, {"y"}}}, block::Paragraph{"End", {Run{"E", {mark::bold}}, Run{"nd", {}}}}}}
      };
      spec::Node root = spec::build(pages, 2, generator);
      std::vector<std::string> ids;
      collect_ids(root, ids);
      ensure(ids.size()) == 28;
      ensure(std::set<std::string>(ids.begin(), ids.end()).size()) == ids.size();
    }
    {
      spec::id_generator next = spec::sequential_id_generator();
      ensure(next()) == "node-1";
      ensure(next()) == "node-2";
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
