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

#ifndef FOLIO_SPEC_BUILDER_H
#define FOLIO_SPEC_BUILDER_H

#include "block.h"
#include "core_export.h"
#include <functional>
#include "spec_node.h"
#include <string>
#include <vector>

namespace folio::spec
{

/// @brief Source of node ids. Every call must return an id not returned before.
using id_generator = std::function<std::string()>;

/// @brief Random UUID v4 ids (Boost.Uuid).
FOLIO_CORE_EXPORT id_generator uuid_id_generator();

/// @brief Ids "<prefix>1", "<prefix>2"... for reproducible trees.
FOLIO_CORE_EXPORT id_generator sequential_id_generator(std::string prefix = "node-");

/// @brief Text of the paragraph produced when a document yields no content.
FOLIO_CORE_EXPORT std::string fallback_text(int page_count);

/**
 * @brief Converts extracted pages into a canonical tree, one subtree per block in page and block order.
 *
 * Heading levels are clamped to 1..6 and stored in tens. Paragraphs with empty text and lists or
 * tables without items or rows are dropped. The first table row becomes the TableHeaderRow.
 * Runs become Text nodes with marks in the order bold, italic, underline; blocks without runs
 * get one Text holding the block text. When nothing is produced the Document holds a single
 * Paragraph with fallback_text(page_count).
 */
FOLIO_CORE_EXPORT Node build(const std::vector<Page>& pages, int page_count, const id_generator& next_id = uuid_id_generator());

} // namespace folio::spec

#endif // FOLIO_SPEC_BUILDER_H
