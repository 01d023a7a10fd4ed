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

#ifndef FOLIO_BLOCK_H
#define FOLIO_BLOCK_H

#include <set>
#include <string>
#include <variant>
#include <vector>

namespace folio
{

/// @brief Inline formatting. Declaration order is the nesting order used by renderers.
enum class mark { bold, italic, underline };

/// @brief Span of text with its formatting.
struct Run
{
	std::string text;
	std::set<mark> marks;
	bool operator==(const Run&) const = default;
};

/**
 * @brief Content units produced by the extractors and consumed by spec::build.
 */
namespace block
{

struct Heading
{
	int level = 1;
	std::string text;
	std::vector<Run> runs;
	bool operator==(const Heading&) const = default;
};

struct Paragraph
{
	std::string text;
	std::vector<Run> runs;
	bool operator==(const Paragraph&) const = default;
};

struct Table
{
	std::vector<std::vector<std::string>> rows;
	bool operator==(const Table&) const = default;
};

struct ListItem
{
	std::string text;
	std::vector<Run> runs;
	bool operator==(const ListItem&) const = default;
};

struct BulletList
{
	std::vector<ListItem> items;
	bool operator==(const BulletList&) const = default;
};

struct OrderedList
{
	std::vector<ListItem> items;
	bool operator==(const OrderedList&) const = default;
};

} // namespace block

using Block = std::variant<block::Heading, block::Paragraph, block::Table, block::BulletList, block::OrderedList>;

/// @brief Blocks of one PDF page, or of a whole DOCX document.
struct Page
{
	int number = 1;
	std::vector<Block> blocks;
};

} // namespace folio

#endif // FOLIO_BLOCK_H
