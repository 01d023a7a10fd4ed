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

#ifndef FOLIO_DOCX_PARAGRAPH_H
#define FOLIO_DOCX_PARAGRAPH_H

#include "block.h"
#include "core_export.h"
#include "heuristics.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::docx
{

enum class list_kind { bullet, ordered };

/// @brief Formatting of the first `w:r` of a paragraph, empty or not.
struct first_run_format
{
	bool bold = false;
	std::optional<double> size_pt;
};

/**
 * @brief A `w:p` element reduced to what the classification needs.
 */
struct paragraph
{
	/// Concatenated run text, trimmed.
	std::string text;
	/// Resolved style name (not the style id), as written in styles.xml.
	std::string style_name;
	/// `w:numPr/w:numId` value when the paragraph has numbering properties.
	std::optional<int> numbering_id;
	/// Non-empty runs, hyperlink runs included.
	std::vector<Run> runs;
	std::optional<first_run_format> first_run;
};

/**
 * @brief Heading level for styles named like headings, titles or "kop" (Dutch), in any case.
 *
 * The level is the first digit of the style name, 1 when there is none.
 */
FOLIO_CORE_EXPORT std::optional<int> heading_level(std::string_view style_name);

/**
 * @brief True for text starting with a bullet glyph: • ● ○ ▪ - *
 */
FOLIO_CORE_EXPORT bool has_bullet_prefix(std::string_view text);

/**
 * @brief True for text starting with digits followed by `.`, `)` or `:`.
 */
FOLIO_CORE_EXPORT bool has_ordered_prefix(std::string_view text);

/**
 * @brief List kind of a paragraph, if it is a list item.
 *
 * Numbering properties decide first, then a style name containing "list", then the text prefix.
 */
FOLIO_CORE_EXPORT std::optional<list_kind> detect_list(const paragraph& para, const docx_heuristics& heuristics = {});

FOLIO_CORE_EXPORT std::size_t count_words(std::string_view text);

/**
 * @brief True for a short paragraph starting with a bold run that reads like a heading.
 */
FOLIO_CORE_EXPORT bool is_bold_heading(const paragraph& para, const docx_heuristics& heuristics = {});

} // namespace folio::docx

#endif // FOLIO_DOCX_PARAGRAPH_H
