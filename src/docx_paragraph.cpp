/*********************************************************************************************************************************************/
/*  Folio: document conversion in C++20. Reads PDF and DOCX uploads into one canonical document tree and renders                             */
/*  that tree to HTML and TipTap JSON. Runs as a job worker over a blob store or as a command line tool.                                     */
/*  Input that cannot be interpreted degrades to an empty result instead of failing the job.                                                 */
/*                                                                                                                                           */
/*  Copyright (c) SILVERCODERS Ltd, http://silvercoders.com                                                                                  */
/*  Project: folio document conversion service                                                                                               */
/*                                                                                                                                           */
/*  SPDX-License-Identifier: GPL-2.0-only OR LicenseRef-DocWire-Commercial                                                                   */
/*********************************************************************************************************************************************/

#include "docx_paragraph.h"

#include <algorithm>
#include <array>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <cctype>

namespace folio::docx
{

namespace
{

bool is_digit(char c)
{
	return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

std::optional<int> heading_level(std::string_view style_name)
{
	std::string name = boost::algorithm::to_lower_copy(std::string{style_name});
	if (!boost::algorithm::contains(name, "heading") &&
		!boost::algorithm::contains(name, "title") &&
		!boost::algorithm::contains(name, "kop"))
		return std::nullopt;
	auto digit = std::find_if(name.begin(), name.end(), is_digit);
	if (digit == name.end())
		return 1;
	return *digit - '0';
}

bool has_bullet_prefix(std::string_view text)
{
	static constexpr std::array<std::string_view, 6> bullets { "\xE2\x80\xA2", "\xE2\x97\x8F", "\xE2\x97\x8B", "\xE2\x96\xAA", "-", "*" };
	return std::any_of(bullets.begin(), bullets.end(), [text](std::string_view bullet) { return text.starts_with(bullet); });
}

bool has_ordered_prefix(std::string_view text)
{
	auto after_digits = std::find_if_not(text.begin(), text.end(), is_digit);
	if (after_digits == text.begin() || after_digits == text.end())
		return false;
	return *after_digits == '.' || *after_digits == ')' || *after_digits == ':';
}

std::optional<list_kind> detect_list(const paragraph& para, const docx_heuristics& heuristics)
{
	std::string style = boost::algorithm::to_lower_copy(para.style_name);
	if (para.numbering_id)
	{
		bool ordered = *para.numbering_id >= heuristics.ordered_min_numbering_id || boost::algorithm::contains(style, "number");
		return ordered ? list_kind::ordered : list_kind::bullet;
	}
	if (boost::algorithm::contains(style, "list"))
	{
		bool ordered = boost::algorithm::contains(style, "number") || boost::algorithm::contains(style, "ordered");
		return ordered ? list_kind::ordered : list_kind::bullet;
	}
	if (has_bullet_prefix(para.text))
		return list_kind::bullet;
	if (has_ordered_prefix(para.text))
		return list_kind::ordered;
	return std::nullopt;
}

std::size_t count_words(std::string_view text)
{
	std::vector<std::string> words;
	boost::algorithm::split(words, std::string{text}, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
	return std::count_if(words.begin(), words.end(), [](const std::string& word) { return !word.empty(); });
}

bool is_bold_heading(const paragraph& para, const docx_heuristics& heuristics)
{
	if (!para.first_run || !para.first_run->bold)
		return false;
	std::size_t words = count_words(para.text);
	if (words >= heuristics.max_words)
		return false;
	bool large = para.first_run->size_pt && *para.first_run->size_pt >= heuristics.min_size_pt;
	return large || words < heuristics.max_words_any_size;
}

} // namespace folio::docx
