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

#ifndef FOLIO_DOCX_EXTRACTOR_H
#define FOLIO_DOCX_EXTRACTOR_H

#include "block.h"
#include "core_export.h"
#include "heuristics.h"
#include <cstddef>
#include <span>
#include <vector>

namespace folio
{

/**
 * @brief Extracts headings, paragraphs, lists and tables from an Office Open XML word processing package.
 *
 * `word/document.xml` is walked in body order. Paragraph style ids are resolved to names through
 * `word/styles.xml`. Headings are recognized by style name, lists by numbering properties, style
 * name or text prefix, and short bold paragraphs are promoted to headings (see docx_heuristics).
 * Consecutive list paragraphs of one kind are merged by the docx::list_state machine.
 */
class FOLIO_CORE_EXPORT docx_extractor
{
public:
	explicit docx_extractor(docx_heuristics heuristics = {});

	/**
	 * @brief A single page with all blocks. Damaged packages yield no pages, never an exception.
	 */
	std::vector<Page> extract(std::span<const std::byte> data) const;

	/// @throws errors::base tagged errors::uninterpretable_data
	std::vector<Page> extract_or_throw(std::span<const std::byte> data) const;

private:
	docx_heuristics m_heuristics;
};

} // namespace folio

#endif // FOLIO_DOCX_EXTRACTOR_H
