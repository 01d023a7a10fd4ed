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

#include "html_renderer.h"

#include <algorithm>
#include <set>

namespace folio::html
{

std::string escape(std::string_view text)
{
	std::string escaped;
	escaped.reserve(text.size());
	for (char c : text)
	{
		switch (c)
		{
			case '&': escaped += "&amp;"; break;
			case '<': escaped += "&lt;"; break;
			case '>': escaped += "&gt;"; break;
			case '"': escaped += "&quot;"; break;
			case '\'': escaped += "&#x27;"; break;
			default: escaped += c;
		}
	}
	return escaped;
}

namespace
{

std::string render_children(const std::vector<spec::Node>& children);

std::string wrap(std::string_view tag, const std::string& content)
{
	return "<" + std::string{tag} + ">" + content + "</" + std::string{tag} + ">";
}

std::string table_row(const spec::Node& row, std::string_view cell_tag)
{
	std::string cells;
	for (const spec::Node& cell : row.children)
		cells += wrap(cell_tag, render_children(cell.children));
	return "<tr>" + cells + "</tr>\n";
}

struct node_renderer
{
	const spec::Node& node;

	std::string operator()(const spec::Text& text) const
	{
		std::set<mark> marks(text.marks.begin(), text.marks.end());
		std::string result = escape(text.text);
		if (marks.contains(mark::bold))
			result = wrap("strong", result);
		if (marks.contains(mark::italic))
			result = wrap("em", result);
		if (marks.contains(mark::underline))
			result = wrap("u", result);
		return result;
	}

	std::string operator()(const spec::Heading& heading) const
	{
		std::string tag = "h" + std::to_string(spec::html_heading_level(heading.level));
		return wrap(tag, render_children(node.children)) + "\n";
	}

	std::string operator()(const spec::Paragraph&) const { return wrap("p", render_children(node.children)) + "\n"; }
	std::string operator()(const spec::BulletList&) const { return "<ul>\n" + render_children(node.children) + "</ul>\n"; }
	std::string operator()(const spec::OrderedList&) const { return "<ol>\n" + render_children(node.children) + "</ol>\n"; }
	std::string operator()(const spec::ListItem&) const { return wrap("li", render_children(node.children)) + "\n"; }
	std::string operator()(const spec::Table&) const { return "<table>\n" + render_children(node.children) + "</table>\n"; }
	std::string operator()(const spec::TableHeaderRow&) const { return table_row(node, "th"); }
	std::string operator()(const spec::TableRow&) const { return table_row(node, "td"); }
	std::string operator()(const spec::TableCell&) const { return render_children(node.children); }
	std::string operator()(const spec::Document&) const { return render_children(node.children); }
	std::string operator()(const spec::Unknown&) const { return render_children(node.children); }
};

std::string render_children(const std::vector<spec::Node>& children)
{
	std::string result;
	for (const spec::Node& child : children)
		result += render_fragment(child);
	return result;
}

constexpr std::string_view page_head =
R"(<!DOCTYPE html>
<html lang="nl">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>Geconverteerd Document</title>
    <style>
        body { font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, Oxygen, Ubuntu, sans-serif; line-height: 1.6; max-width: 800px; margin: 0 auto; padding: 2rem; color: #333; }
        h1, h2, h3, h4, h5, h6 { margin-top: 1.5em; margin-bottom: 0.5em; color: #1a1a1a; }
        h1 { font-size: 2rem; border-bottom: 2px solid #eee; padding-bottom: 0.3em; }
        h2 { font-size: 1.5rem; border-bottom: 1px solid #eee; padding-bottom: 0.2em; }
        h3 { font-size: 1.25rem; }
        p { margin: 1em 0; }
        ul, ol { margin: 1em 0; padding-left: 2em; }
        li { margin: 0.3em 0; }
        table { border-collapse: collapse; width: 100%; margin: 1em 0; }
        th, td { border: 1px solid #ddd; padding: 0.75em; text-align: left; }
        th { background-color: #f5f5f5; font-weight: bold; }
        tr:nth-child(even) { background-color: #fafafa; }
        strong { font-weight: bold; }
        em { font-style: italic; }
        u { text-decoration: underline; }
    </style>
</head>
<body>
)";

constexpr std::string_view page_tail =
R"(
</body>
</html>)";

} // anonymous namespace

std::string render_fragment(const spec::Node& node)
{
	return std::visit(node_renderer{node}, node.content);
}

std::string render(const spec::Node& root)
{
	std::string page{page_head};
	page += render_fragment(root);
	page += page_tail;
	return page;
}

} // namespace folio::html
