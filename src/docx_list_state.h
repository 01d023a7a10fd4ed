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

#ifndef FOLIO_DOCX_LIST_STATE_H
#define FOLIO_DOCX_LIST_STATE_H

#include "block.h"
#include "core_export.h"
#include "docx_paragraph.h"
#include <variant>
#include <vector>

/**
 * @brief List accumulation while walking a DOCX body.
 *
 * Consecutive list paragraphs of the same kind are collected into one list block. Every transition
 * is a pure function of the current state and the incoming element, returning the next state and
 * the blocks completed by the step, in document order.
 */
namespace folio::docx
{

struct NoList
{
	bool operator==(const NoList&) const = default;
};

struct Building
{
	list_kind kind;
	std::vector<block::ListItem> items;
	bool operator==(const Building&) const = default;
};

using list_state = std::variant<NoList, Building>;

struct transition
{
	list_state state;
	std::vector<Block> emitted;
};

/// @brief Closes any open list, then emits the table.
FOLIO_CORE_EXPORT transition on_table(list_state state, block::Table table);

/// @brief Closes any open list.
FOLIO_CORE_EXPORT transition on_empty_paragraph(list_state state);

/// @brief Appends to the open list of the same kind, or closes it and opens a new one.
FOLIO_CORE_EXPORT transition on_list_paragraph(list_state state, list_kind kind, block::ListItem item);

/// @brief Closes any open list, then emits the heading or paragraph.
FOLIO_CORE_EXPORT transition on_content_paragraph(list_state state, Block content);

/// @brief Blocks still pending at the end of the body.
FOLIO_CORE_EXPORT std::vector<Block> finish(list_state state);

} // namespace folio::docx

#endif // FOLIO_DOCX_LIST_STATE_H
