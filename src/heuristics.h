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

#ifndef FOLIO_HEURISTICS_H
#define FOLIO_HEURISTICS_H

#include <cstddef>

namespace folio
{

/**
 * @brief Thresholds classifying a PDF text line by its largest font size and boldness.
 *
 * A line is a level 1 heading from `heading1_min_size`, a level 2 heading from `heading2_min_size`
 * or when bold, and a paragraph otherwise.
 */
struct pdf_heuristics
{
	double heading1_min_size = 18.0;
	double heading2_min_size = 16.0;
	bool bold_is_heading = true;
	/// Font weight from which a character counts as bold, when the font name does not say so.
	int bold_min_weight = 700;
};

/**
 * @brief Thresholds promoting a short bold DOCX paragraph to a heading.
 *
 * The first run must be bold and the paragraph shorter than `max_words` words. Then either the
 * first run is at least `min_size_pt` points or the paragraph is shorter than `max_words_any_size`.
 */
struct docx_heuristics
{
	std::size_t max_words = 15;
	double min_size_pt = 14.0;
	std::size_t max_words_any_size = 8;
	int promoted_level = 3;
	/// Numbering ids from this value on are taken as ordered lists.
	int ordered_min_numbering_id = 10;
	/// Largest uncompressed size accepted for a single package part.
	std::size_t max_part_size = 64 * 1024 * 1024;
};

} // namespace folio

#endif // FOLIO_HEURISTICS_H
