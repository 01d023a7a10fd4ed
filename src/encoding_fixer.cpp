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

#include "encoding_fixer.h"

#include <array>
#include <boost/algorithm/string/replace.hpp>
#include <utility>

namespace folio
{

namespace
{

// Longer sequences first: "â€" alone is the damaged right double quote and
// is a prefix of all the other Windows-1252 punctuation sequences.
// Every replacement is shorter than its pattern.
const std::array<std::pair<std::string_view, std::string_view>, 20> replacements
{{
	{"\xC3\xA2\xE2\x82\xAC\xE2\x80\x9D", "\xE2\x80\x94"}, // em dash
	{"\xC3\xA2\xE2\x82\xAC\xE2\x80\x9C", "\xE2\x80\x93"}, // en dash
	{"\xC3\xA2\xE2\x82\xAC\xE2\x84\xA2", "'"},
	{"\xC3\xA2\xE2\x82\xAC\xC5\x93", "\""},
	{"\xC3\xA2\xE2\x82\xAC\xC2\xA6", "\xE2\x80\xA6"}, // ellipsis
	{"\xC3\xA2\xE2\x82\xAC", "\""},
	{"\xC3\x83\xC2\xA9", "\xC3\xA9"},
	{"\xC3\x83\xC2\xA8", "\xC3\xA8"},
	{"\xC3\x83\xC2\xAB", "\xC3\xAB"},
	{"\xC3\x83\xC2\xAF", "\xC3\xAF"},
	{"\xC3\x83\xC2\xB6", "\xC3\xB6"},
	{"\xC3\x83\xC2\xBC", "\xC3\xBC"},
	{"\xC3\x83 ", "\xC3\xA0"},
	// CP437 renderings
	{"\xCE\x93\xC3\x87\xC3\xB4", "\xE2\x80\x93"},
	{"\xCE\x93\xC3\x87\xC3\xB6", "\xE2\x80\x94"},
	{"\xCE\x93\xC3\x87\xC3\xAF", ""},
	{"\xCE\x93\xC3\x87\xC2\xA3", "\""},
	{"\xCE\x93\xC3\x87\xC2\xAA", "\xE2\x80\xA6"},
	{"\xE2\x80\x8B", ""}, // zero width space
	{"\xEF\xBB\xBF", ""} // byte order mark
}};

} // anonymous namespace

std::string fix_encoding(std::string_view text)
{
	std::string fixed{text};
	for (;;)
	{
		std::string previous = fixed;
		for (const auto& [pattern, replacement] : replacements)
			boost::algorithm::replace_all(fixed, pattern, replacement);
		if (fixed == previous)
			return fixed;
	}
}

} // namespace folio
