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

#ifndef FOLIO_PDF_EXTRACTOR_H
#define FOLIO_PDF_EXTRACTOR_H

#include "block.h"
#include "core_export.h"
#include "heuristics.h"
#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace folio
{

/// @brief One line of a PDF page text layer with the properties used for classification.
struct pdf_line
{
	std::string text;
	double max_font_size = 0.0;
	bool bold = false;
};

/**
 * @brief Classifies a trimmed, non-empty line as a heading or paragraph block.
 */
FOLIO_CORE_EXPORT Block classify_pdf_line(const pdf_line& line, const pdf_heuristics& heuristics = {});

/**
 * @brief Extracts headings and paragraphs from the text layer of a PDF, using PDFium.
 *
 * Characters are read in content order and grouped into lines at the line breaks PDFium generates.
 * Each line is trimmed, repaired with fix_encoding and classified with classify_pdf_line.
 *
 * @code
 * pdf_extractor extractor;
 * std::vector<Page> pages = extractor.extract(bytes);
 * @endcode
 */
class FOLIO_CORE_EXPORT pdf_extractor
{
public:
	explicit pdf_extractor(pdf_heuristics heuristics = {});

	/**
	 * @brief One page per PDF page. Malformed or encrypted documents yield no pages, never an exception.
	 */
	std::vector<Page> extract(std::span<const std::byte> data) const;

	/**
	 * @brief Same as extract() but reports failures.
	 * @throws errors::base tagged errors::uninterpretable_data or errors::file_encrypted
	 */
	std::vector<Page> extract_or_throw(std::span<const std::byte> data) const;

private:
	pdf_heuristics m_heuristics;
};

} // namespace folio

#endif // FOLIO_PDF_EXTRACTOR_H
