#include "folio.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace folio;
  using namespace folio::docx;
  try
  {
    block::ListItem first{"one", {}};
    block::ListItem second{"two", {}};

    // a list item opens a list and emits nothing
    transition step = on_list_paragraph(NoList{}, list_kind::bullet, first);
    ensure(step.emitted.size()) == 0;
    ensure(std::holds_alternative<Building>(step.state)) == true;

    // same kind appends
    step = on_list_paragraph(std::move(step.state), list_kind::bullet, second);
    ensure(step.emitted.size()) == 0;
    ensure(std::get<Building>(step.state).items.size()) == 2;

    // other kind closes the open list and starts a new one
    step = on_list_paragraph(std::move(step.state), list_kind::ordered, first);
    ensure(step.emitted.size()) == 1;
    ensure(std::holds_alternative<block::BulletList>(step.emitted[0])) == true;
    ensure(std::get<block::BulletList>(step.emitted[0]).items.size()) == 2;
    ensure(std::get<Building>(step.state).kind) == list_kind::ordered;

    // content paragraph closes the list and comes after it
    step = on_content_paragraph(std::move(step.state), block::Paragraph{"body", {}});
    ensure(step.emitted.size()) == 2;
    ensure(std::holds_alternative<block::OrderedList>(step.emitted[0])) == true;
    ensure(std::holds_alternative<block::Paragraph>(step.emitted[1])) == true;
    ensure(std::holds_alternative<NoList>(step.state)) == true;

    // table closes the list
    step = on_list_paragraph(NoList{}, list_kind::bullet, first);
    step = on_table(std::move(step.state), block::Table{{{"a", "b"}}});
    ensure(step.emitted.size()) == 2;
    ensure(std::holds_alternative<block::BulletList>(step.emitted[0])) == true;
    ensure(std::holds_alternative<block::Table>(step.emitted[1])) == true;

    // empty paragraph closes the list, nothing else
    step = on_list_paragraph(NoList{}, list_kind::ordered, first);
    step = on_empty_paragraph(std::move(step.state));
    ensure(step.emitted.size()) == 1;
    ensure(std::holds_alternative<NoList>(step.state)) == true;
    ensure(on_empty_paragraph(NoList{}).emitted.size()) == 0;

    // finish flushes
    ensure(finish(NoList{}).size()) == 0;
    ensure(finish(Building{list_kind::ordered, {first}}).size()) == 1;

    // transitions do not depend on anything but their arguments
    ensure(on_list_paragraph(NoList{}, list_kind::bullet, first).state == on_list_paragraph(NoList{}, list_kind::bullet, first).state) == true;

    // classification helpers
    ensure(heading_level("heading 2")) == std::optional<int>{2};
    ensure(heading_level("Title")) == std::optional<int>{1};
    ensure(heading_level("Kop 3")) == std::optional<int>{3};
    ensure(heading_level("Subtitle")) == std::optional<int>{1};
    ensure(heading_level("Normal").has_value()) == false;

    for (const char* bullet : {"\xE2\x80\xA2 item", "\xE2\x97\x8F item", "\xE2\x97\x8B item", "\xE2\x96\xAA item", "- item", "* item"})
      ensure(has_bullet_prefix(bullet)) == true;
    ensure(has_bullet_prefix("item")) == false;
    for (const char* number : {"1. item", "12) item", "3: item", "1."})
      ensure(has_ordered_prefix(number)) == true;
    for (const char* text : {"1 item", "a. item", ". item", "2024"})
      ensure(has_ordered_prefix(text)) == false;

    paragraph para;
    para.text = "Some text";
    ensure(detect_list(para).has_value()) == false;
    para.numbering_id = 3;
    ensure(detect_list(para)) == std::optional<list_kind>{list_kind::bullet};
    para.numbering_id = 12;
    ensure(detect_list(para)) == std::optional<list_kind>{list_kind::ordered};
    para.numbering_id = 1;
    para.style_name = "List Number";
    ensure(detect_list(para)) == std::optional<list_kind>{list_kind::ordered};
    para.numbering_id.reset();
    para.style_name = "List Bullet";
    ensure(detect_list(para)) == std::optional<list_kind>{list_kind::bullet};
    para.style_name = "Normal";
    para.text = "2) second";
    ensure(detect_list(para)) == std::optional<list_kind>{list_kind::ordered};

    ensure(count_words("  a  b\tc\nd ")) == 4;
    paragraph label;
    label.text = "Short bold label";
    label.first_run = first_run_format{true, std::nullopt};
    ensure(is_bold_heading(label)) == true;
    label.text = "A bold sentence that is somewhat longer than eight words";
    ensure(is_bold_heading(label)) == false;
    label.first_run->size_pt = 14.0;
    ensure(is_bold_heading(label)) == true;
    label.text = "A bold sentence that is really much longer than fifteen words and keeps going on and on";
    ensure(is_bold_heading(label)) == false;
    label.text = "Short";
    label.first_run->bold = false;
    ensure(is_bold_heading(label)) == false;
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
