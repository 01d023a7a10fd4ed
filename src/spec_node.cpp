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

#include "spec_node.h"

#include <algorithm>
#include <array>

namespace folio::spec
{

namespace
{

struct type_name_visitor
{
	std::string operator()(const Document&) const { return "Document"; }
	std::string operator()(const Heading&) const { return "Heading"; }
	std::string operator()(const Paragraph&) const { return "Paragraph"; }
	std::string operator()(const Text&) const { return "Text"; }
	std::string operator()(const Table&) const { return "Table"; }
	std::string operator()(const TableHeaderRow&) const { return "TableHeaderRow"; }
	std::string operator()(const TableRow&) const { return "TableRow"; }
	std::string operator()(const TableCell&) const { return "TableCell"; }
	std::string operator()(const BulletList&) const { return "BulletList"; }
	std::string operator()(const OrderedList&) const { return "OrderedList"; }
	std::string operator()(const ListItem&) const { return "ListItem"; }
	std::string operator()(const Unknown& unknown) const { return unknown.type; }
};

const std::array<Content, 11> vocabulary
{
	Document{}, Heading{}, Paragraph{}, Text{}, Table{}, TableHeaderRow{}, TableRow{}, TableCell{},
	BulletList{}, OrderedList{}, ListItem{}
};

} // anonymous namespace

std::string type_name(const Content& content)
{
	return std::visit(type_name_visitor{}, content);
}

std::string type_tag(const Content& content)
{
	if (std::holds_alternative<Unknown>(content))
		return std::get<Unknown>(content).type;
	return std::string{type_prefix} + type_name(content);
}

Content content_for_tag(std::string_view tag)
{
	std::string_view name = tag.substr(tag.rfind('/') + 1);
	auto match = std::find_if(vocabulary.begin(), vocabulary.end(),
		[name](const Content& content) { return type_name(content) == name; });
	if (match == vocabulary.end())
		return Unknown{std::string{tag}};
	return *match;
}

int html_heading_level(int node_level)
{
	return std::clamp(node_level / 10, 1, 6);
}

std::string plain_text(const Node& node)
{
	if (const Text* text = std::get_if<Text>(&node.content))
		return text->text;
	std::string result;
	for (const Node& child : node.children)
		result += plain_text(child);
	return result;
}

} // namespace folio::spec
