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

#include "docx_list_state.h"

namespace folio::docx
{

namespace
{

Block to_block(Building&& list)
{
	if (list.kind == list_kind::ordered)
		return block::OrderedList{std::move(list.items)};
	return block::BulletList{std::move(list.items)};
}

} // anonymous namespace

std::vector<Block> finish(list_state state)
{
	std::vector<Block> emitted;
	if (auto* list = std::get_if<Building>(&state))
		emitted.push_back(to_block(std::move(*list)));
	return emitted;
}

transition on_table(list_state state, block::Table table)
{
	std::vector<Block> emitted = finish(std::move(state));
	emitted.push_back(std::move(table));
	return {NoList{}, std::move(emitted)};
}

transition on_empty_paragraph(list_state state)
{
	return {NoList{}, finish(std::move(state))};
}

transition on_list_paragraph(list_state state, list_kind kind, block::ListItem item)
{
	if (auto* list = std::get_if<Building>(&state); list && list->kind == kind)
	{
		list->items.push_back(std::move(item));
		return {std::move(state), {}};
	}
	return {Building{kind, {std::move(item)}}, finish(std::move(state))};
}

transition on_content_paragraph(list_state state, Block content)
{
	std::vector<Block> emitted = finish(std::move(state));
	emitted.push_back(std::move(content));
	return {NoList{}, std::move(emitted)};
}

} // namespace folio::docx
