#include <boost/json.hpp>
#include "folio.h"
#include <iostream>

using namespace folio;

int main(int argc, char* argv[])
{
  try
  {
    std::vector<Page> pages {
      Page{1, {
        block::Heading{1, "Titel"},
        block::Paragraph{"Tekst met \"quotes\" & <tags>", {Run{"Tekst met ", {}}, Run{"\"quotes\"", {mark::bold, mark::italic}}, Run{" & <tags>", {mark::underline}}}},
        block::Table{{{"a", "b"}, {"c", "d"}}}
      }},
      Page{2, {
        block::OrderedList{{{"een"}, {"twee"}}},
        block::BulletList{{{"los"}}}
      }}
    };
    spec::Node root = spec::build(pages, 2);

    // a loaded tree equals the original and renders identically
    {
      std::string json = spec::serialize(root);
      spec::Node loaded = spec::parse(json);
      ensure(loaded == root) == true;
      ensure(spec::serialize(loaded)) == json;
      ensure(html::render(loaded)) == html::render(root);
      ensure(tiptap::render_to_string(loaded)) == tiptap::render_to_string(root);
    }

    // JSON shape
    {
      boost::json::object json = spec::to_json(root).as_object();
      ensure(std::string{json.at("type").as_string()}) == "https://spec.nldoc.nl/Resource/Document";
      ensure(std::string{json.at("id").as_string()}) == root.id;
      const boost::json::object& heading = json.at("children").as_array()[0].as_object();
      ensure(heading.at("level").as_int64()) == 10;
      const boost::json::object& title = heading.at("children").as_array()[0].as_object();
      ensure(std::string{title.at("type").as_string()}) == "https://spec.nldoc.nl/Resource/Text";
      ensure(title.contains("children")) == false;
      ensure(title.contains("marks")) == false;
      const boost::json::object& item = json.at("children").as_array()[3].as_object().at("children").as_array()[1].as_object();
      ensure(item.at("order").as_int64()) == 2;
      const boost::json::object& bullet_item = json.at("children").as_array()[4].as_object().at("children").as_array()[0].as_object();
      ensure(bullet_item.contains("order")) == false;
    }

    // loading: unknown types kept, aliases and unknown marks, missing level and children
    {
      spec::Node loaded = spec::parse(R"({"id":"d","type":"https://spec.nldoc.nl/Resource/Document","children":[
        {"id":"i","type":"https://spec.nldoc.nl/Resource/Image","children":[{"id":"c","type":"https://spec.nldoc.nl/Resource/Paragraph","children":[{"id":"t0","type":"https://spec.nldoc.nl/Resource/Text","text":"caption"}]}]},
        {"id":"h","type":"https://spec.nldoc.nl/Resource/Heading","children":[]},
        {"id":"p","type":"https://spec.nldoc.nl/Resource/Paragraph","children":[
          {"id":"t1","type":"https://spec.nldoc.nl/Resource/Text","text":"x","marks":[{"type":"strong"},{"type":"em"},{"type":"strike"},{"type":"underline"}]}
        ]},
        {"id":"q","type":"https://spec.nldoc.nl/Resource/Paragraph"}
      ]})");
      ensure(loaded.children.size()) == 4;
      ensure(loaded.children[0].as<spec::Unknown>().type) == "https://spec.nldoc.nl/Resource/Image";
      ensure(spec::type_tag(loaded.children[0].content)) == "https://spec.nldoc.nl/Resource/Image";
      ensure(loaded.children[1].as<spec::Heading>().level) == 20;
      ensure(loaded.children[2].children[0].as<spec::Text>() == spec::Text{"x", {mark::bold, mark::italic, mark::underline}}) == true;
      ensure(loaded.children[3].children.size()) == 0;
      ensure(html::render_fragment(loaded)) == "<p>caption</p>\n<h2></h2>\n<p><u><em><strong>x</strong></em></u></p>\n<p></p>\n";
      ensure(spec::serialize(loaded)).contains(R"("type":"https://spec.nldoc.nl/Resource/Image")");
    }

    // type tags dispatch on the last path segment
    ensure(spec::content_for_tag("https://other.example/Resource/Table") == spec::Content{spec::Table{}}) == true;
    ensure(spec::content_for_tag("TableHeaderRow") == spec::Content{spec::TableHeaderRow{}}) == true;
    ensure(spec::mark_from_name("bold") == std::optional<mark>{mark::bold}) == true;
    ensure(spec::mark_from_name("strike").has_value()) == false;
    ensure(std::string{spec::mark_name(mark::underline)}) == "underline";

    // malformed input
    for (std::string_view json : {std::string_view{"not json"}, std::string_view{"[]"}, std::string_view{R"({"id":"x"})"}, std::string_view{R"({"type":"https://spec.nldoc.nl/Resource/Document","children":[1]})"}})
    {
      bool thrown = false;
      try
      {
        spec::parse(json);
      }
      catch (const std::exception& e)
      {
        thrown = errors::contains_type<errors::uninterpretable_data>(e);
      }
      ensure(thrown) == true;
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
