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

#include "spec_builder.h"

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "log_entry.h"
#include <memory>

namespace folio::spec
{

id_generator uuid_id_generator()
{
	auto generator = std::make_shared<boost::uuids::random_generator>();
	return [generator]() { return boost::uuids::to_string((*generator)()); };
}

id_generator sequential_id_generator(std::string prefix)
{
	auto counter = std::make_shared<unsigned long long>(0);
	return [counter, prefix = std::move(prefix)]() { return prefix + std::to_string(++*counter); };
}

std::string fallback_text(int page_count)
{
	return "Dit document bevat " + std::to_string(page_count) + " pagina's maar de tekst kon niet worden ge\xC3\xABxtraheerd.";
}

namespace
{

class tree_builder
{
public:
	explicit tree_builder(const id_generator& next_id)
		: m_next_id(next_id)
	{}

	Node node(Content content, std::vector<Node> children = {}) const
	{
		return Node{m_next_id(), std::move(content), std::move(children)};
	}

	Node text(std::string text, std::vector<mark> marks = {}) const
	{
		return node(Text{std::move(text), std::move(marks)});
	}

	std::vector<Node> inline_content(const std::string& text, const std::vector<Run>& runs) const
	{
		std::vector<Node> result;
		for (const Run& run : runs)
			result.push_back(this->text(run.text, std::vector<mark>(run.marks.begin(), run.marks.end())));
		if (result.empty())
			result.push_back(this->text(boost::algorithm::trim_copy(text)));
		return result;
	}

	std::optional<Node> operator()(const block::Heading& heading) const
	{
		int level = std::clamp(heading.level, 1, 6) * 10;
		return node(Heading{level}, inline_content(heading.text, heading.runs));
	}

	std::optional<Node> operator()(const block::Paragraph& paragraph) const
	{
		if (boost::algorithm::trim_copy(paragraph.text).empty())
			return std::nullopt;
		return node(Paragraph{}, inline_content(paragraph.text, paragraph.runs));
	}

	std::optional<Node> operator()(const block::Table& table) const
	{
		if (table.rows.empty())
			return std::nullopt;
		std::vector<Node> rows;
		for (const auto& row : table.rows)
		{
			std::vector<Node> cells;
			for (const std::string& cell : row)
				cells.push_back(node(TableCell{}, {node(Paragraph{}, {text(cell)})}));
			if (rows.empty())
				rows.push_back(node(TableHeaderRow{}, std::move(cells)));
			else
				rows.push_back(node(TableRow{}, std::move(cells)));
		}
		return node(Table{}, std::move(rows));
	}

	std::optional<Node> operator()(const block::BulletList& list) const
	{
		return list_node(BulletList{}, list.items, false);
	}

	std::optional<Node> operator()(const block::OrderedList& list) const
	{
		return list_node(OrderedList{}, list.items, true);
	}

private:
	std::optional<Node> list_node(Content kind, const std::vector<block::ListItem>& items, bool ordered) const
	{
		if (items.empty())
			return std::nullopt;
		std::vector<Node> children;
		for (const block::ListItem& item : items)
		{
			ListItem list_item;
			if (ordered)
				list_item.order = static_cast<int>(children.size()) + 1;
			children.push_back(node(list_item, {node(Paragraph{}, inline_content(item.text, item.runs))}));
		}
		return node(std::move(kind), std::move(children));
	}

	const id_generator& m_next_id;
};

} // anonymous namespace

Node build(const std::vector<Page>& pages, int page_count, const id_generator& next_id)
{
	tree_builder builder{next_id};
	std::vector<Node> children;
	for (const Page& page : pages)
	{
		for (const Block& block : page.blocks)
		{
			if (std::optional<Node> child = std::visit(builder, block))
				children.push_back(std::move(*child));
		}
	}
	if (children.empty())
	{
		log_entry("No content extracted, using fallback paragraph", page_count);
		children.push_back(builder.node(Paragraph{}, {builder.text(fallback_text(page_count))}));
	}
	return builder.node(Document{}, std::move(children));
}

} // namespace folio::spec
