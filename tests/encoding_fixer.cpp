#include "folio.h"
#include <iostream>

int main(int argc, char* argv[])
{
  using namespace folio;
  try
  {
    ensure(fix_encoding("caf\xC3\x83\xC2\xA9")) == std::string{"caf\xC3\xA9"};
    ensure(fix_encoding("een \xC3\xA2\xE2\x82\xAC\xE2\x80\x9D twee")) == std::string{"een \xE2\x80\x94 twee"};
    ensure(fix_encoding("1\xC3\xA2\xE2\x82\xAC\xE2\x80\x9C" "2")) == std::string{"1\xE2\x80\x93" "2"};
    ensure(fix_encoding("it\xC3\xA2\xE2\x82\xAC\xE2\x84\xA2s")) == std::string{"it's"};
    ensure(fix_encoding("\xC3\xA2\xE2\x82\xAC\xC5\x93quoted\xC3\xA2\xE2\x82\xAC")) == std::string{"\"quoted\""};
    ensure(fix_encoding("wait\xC3\xA2\xE2\x82\xAC\xC2\xA6")) == std::string{"wait\xE2\x80\xA6"};
    ensure(fix_encoding("ge\xC3\x83\xC2\xABxtraheerd")) == std::string{"ge\xC3\xABxtraheerd"};
    ensure(fix_encoding("a\xCE\x93\xC3\x87\xC3\xB4" "b")) == std::string{"a\xE2\x80\x93" "b"};
    ensure(fix_encoding("\xEF\xBB\xBFzero\xE2\x80\x8Bwidth")) == std::string{"zerowidth"};
    ensure(fix_encoding("plain text stays")) == std::string{"plain text stays"};

    // twice mis-decoded text is only partly repaired, but stable
    std::string twice = "\xC3\x83\xC6\x92\xC3\x82\xC2\xA9";
    ensure(fix_encoding(fix_encoding(twice))) == fix_encoding(twice);

    for (std::string sample : {std::string{"x \xC3\xA2\xE2\x82\xAC\xE2\x80\x9D y \xC3\x83\xC2\xBC"}, std::string{"\xCE\x93\xC3\x87\xC2\xAA\xE2\x80\x8B"}, std::string{"geen fouten"}})
    {
      std::string once = fix_encoding(sample);
      ensure(fix_encoding(once)) == once;
    }
  }
  catch (const std::exception& e)
  {
    std::cerr << errors::diagnostic_message(e) << std::endl;
    return 1;
  }
  return 0;
}
