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

#include "tiptap_renderer.h"

#include <boost/json.hpp>
#include "spec_json.h"

namespace folio::tiptap
{

namespace
{

boost::json::object text_node(std::string_view text)
{
	return boost::json::object{{"type", "text"}, {"text", text}};
}

boost::json::object empty_paragraph()
{
	return boost::json::object{{"type", "paragraph"}, {"content", boost::json::array{text_node("")}}};
}

// Only Text children have an inline form
boost::json::array render_inline(const std::vector<spec::Node>& children)
{
	boost::json::array content;
	for (const spec::Node& child : children)
	{
		const spec::Text* text = std::get_if<spec::Text>(&child.content);
		if (!text)
			continue;
		boost::json::object node = text_node(text->text);
		boost::json::array marks;
		for (mark m : text->marks)
			marks.push_back(boost::json::object{{"type", spec::mark_name(m)}});
		if (!marks.empty())
			node["marks"] = std::move(marks);
		content.push_back(std::move(node));
	}
	if (content.empty())
		content.push_back(text_node(""));
	return content;
}

boost::json::array render_blocks(const std::vector<spec::Node>& children)
{
	boost::json::array content;
	for (const spec::Node& child : children)
	{
		if (std::optional<boost::json::object> block = render_block(child))
			content.push_back(std::move(*block));
	}
	return content;
}

boost::json::object table_row(const spec::Node& row, std::string_view cell_type)
{
	boost::json::array cells;
	for (const spec::Node& cell : row.children)
	{
		boost::json::array content = render_blocks(cell.children);
		if (content.empty())
			content.push_back(empty_paragraph());
		cells.push_back(boost::json::object{{"type", cell_type}, {"content", std::move(content)}});
	}
	return boost::json::object{{"type", "tableRow"}, {"content", std::move(cells)}};
}

boost::json::object container(std::string_view type, boost::json::array content)
{
	return boost::json::object{{"type", type}, {"content", std::move(content)}};
}

struct block_renderer
{
	const spec::Node& node;

	std::optional<boost::json::object> operator()(const spec::Heading& heading) const
	{
		return boost::json::object{
			{"type", "heading"},
			{"attrs", boost::json::object{{"level", spec::html_heading_level(heading.level)}}},
			{"content", render_inline(node.children)}
		};
	}

	std::optional<boost::json::object> operator()(const spec::Paragraph&) const { return container("paragraph", render_inline(node.children)); }
	std::optional<boost::json::object> operator()(const spec::BulletList&) const { return container("bulletList", render_blocks(node.children)); }
	std::optional<boost::json::object> operator()(const spec::OrderedList&) const { return container("orderedList", render_blocks(node.children)); }
	std::optional<boost::json::object> operator()(const spec::ListItem&) const { return container("listItem", render_blocks(node.children)); }

	std::optional<boost::json::object> operator()(const spec::Table&) const
	{
		boost::json::array rows;
		for (const spec::Node& row : node.children)
		{
			if (row.is<spec::TableHeaderRow>())
				rows.push_back(table_row(row, "tableHeader"));
			else if (row.is<spec::TableRow>())
				rows.push_back(table_row(row, "tableCell"));
		}
		return container("table", std::move(rows));
	}

	std::optional<boost::json::object> operator()(const spec::Document&) const { return std::nullopt; }
	std::optional<boost::json::object> operator()(const spec::Text&) const { return std::nullopt; }
	std::optional<boost::json::object> operator()(const spec::TableHeaderRow&) const { return std::nullopt; }
	std::optional<boost::json::object> operator()(const spec::TableRow&) const { return std::nullopt; }
	std::optional<boost::json::object> operator()(const spec::TableCell&) const { return std::nullopt; }
	std::optional<boost::json::object> operator()(const spec::Unknown&) const { return std::nullopt; }
};

} // anonymous namespace

std::optional<boost::json::object> render_block(const spec::Node& node)
{
	return std::visit(block_renderer{node}, node.content);
}

boost::json::object render(const spec::Node& root)
{
	boost::json::array content;
	if (root.is<spec::Document>())
		content = render_blocks(root.children);
	return boost::json::object{{"type", "doc"}, {"content", std::move(content)}};
}

std::string render_to_string(const spec::Node& root)
{
	return boost::json::serialize(render(root));
}

} // namespace folio::tiptap
