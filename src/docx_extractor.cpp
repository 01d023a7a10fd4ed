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

#include "docx_extractor.h"

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <charconv>
#include <climits>
#include "diagnostic_message.h"
#include "docx_list_state.h"
#include "docx_paragraph.h"
#include "error_tags.h"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include "log_entry.h"
#include "log_scope.h"
#include <map>
#include <memory>
#include <mutex>
#include "throw_if.h"
#include "zip_reader.h"

namespace folio
{

namespace
{

constexpr const char* wordml_namespace = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

using xml_document_ptr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

xml_document_ptr parse_xml(const std::string& xml, const char* entry_name)
{
	static std::once_flag parser_init_flag;
	std::call_once(parser_init_flag, []() { xmlInitParser(); });
	throw_if(xml.size() > INT_MAX, "XML part too large", entry_name, xml.size(), errors::uninterpretable_data{});
	xmlDocPtr document = xmlReadMemory(xml.data(), static_cast<int>(xml.size()), entry_name, nullptr,
		XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
	if (!document)
	{
		const xmlError* error = xmlGetLastError();
		throw make_error("xmlReadMemory() failed", entry_name, error && error->message ? std::string{error->message} : std::string{}, errors::uninterpretable_data{});
	}
	xml_document_ptr result{document, &xmlFreeDoc};
	// OOXML parts never carry a DTD, entity declarations are refused outright
	throw_if(document->intSubset != nullptr, "XML part declares a DTD", entry_name, errors::uninterpretable_data{});
	return result;
}

bool is_w(const xmlNode* node, const char* local_name)
{
	return node && node->type == XML_ELEMENT_NODE &&
		node->ns && xmlStrEqual(node->ns->href, BAD_CAST wordml_namespace) &&
		xmlStrEqual(node->name, BAD_CAST local_name);
}

const xmlNode* w_child(const xmlNode* node, const char* local_name)
{
	for (const xmlNode* child = node ? node->children : nullptr; child; child = child->next)
	{
		if (is_w(child, local_name))
			return child;
	}
	return nullptr;
}

std::optional<std::string> w_attribute(const xmlNode* node, const char* name)
{
	if (!node)
		return std::nullopt;
	xmlChar* value = xmlGetNsProp(node, BAD_CAST name, BAD_CAST wordml_namespace);
	if (!value)
		return std::nullopt;
	std::string result{reinterpret_cast<const char*>(value)};
	xmlFree(value);
	return result;
}

std::optional<int> to_int(const std::optional<std::string>& value)
{
	if (!value)
		return std::nullopt;
	int result = 0;
	auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), result);
	if (ec != std::errc{})
		return std::nullopt;
	return result;
}

std::string text_content(const xmlNode* node)
{
	xmlChar* content = xmlNodeGetContent(node);
	if (!content)
		return {};
	std::string result{reinterpret_cast<const char*>(content)};
	xmlFree(content);
	return result;
}

// On/off properties (w:b, w:i) are on unless w:val switches them off
bool on_off_property(const xmlNode* properties, const char* local_name)
{
	const xmlNode* property = w_child(properties, local_name);
	if (!property)
		return false;
	std::optional<std::string> value = w_attribute(property, "val");
	return !value || (*value != "0" && *value != "false" && *value != "off");
}

struct style_sheet
{
	std::map<std::string, std::string> names_by_id;
	std::string default_paragraph_style;

	std::string name_of(const std::optional<std::string>& style_id) const
	{
		if (!style_id)
			return default_paragraph_style;
		auto it = names_by_id.find(*style_id);
		return it != names_by_id.end() ? it->second : *style_id;
	}
};

style_sheet read_styles(const zip_reader& package)
{
	style_sheet styles;
	std::optional<std::string> xml = package.read_if_exists("word/styles.xml");
	if (!xml)
		return styles;
	xml_document_ptr document = parse_xml(*xml, "word/styles.xml");
	const xmlNode* root = xmlDocGetRootElement(document.get());
	for (const xmlNode* style = root ? root->children : nullptr; style; style = style->next)
	{
		if (!is_w(style, "style"))
			continue;
		std::optional<std::string> id = w_attribute(style, "styleId");
		std::optional<std::string> name = w_attribute(w_child(style, "name"), "val");
		if (!id)
			continue;
		std::string style_name = name.value_or(*id);
		if (w_attribute(style, "type") == "paragraph" && w_attribute(style, "default") == "1")
			styles.default_paragraph_style = style_name;
		styles.names_by_id[*id] = std::move(style_name);
	}
	return styles;
}

struct run_content
{
	Run run;
	docx::first_run_format format;
};

run_content read_run(const xmlNode* r)
{
	run_content result;
	for (const xmlNode* child = r->children; child; child = child->next)
	{
		if (is_w(child, "t"))
			result.run.text += text_content(child);
		else if (is_w(child, "tab"))
			result.run.text += '\t';
		else if (is_w(child, "br") || is_w(child, "cr"))
			result.run.text += '\n';
	}
	const xmlNode* properties = w_child(r, "rPr");
	if (on_off_property(properties, "b"))
		result.run.marks.insert(mark::bold);
	if (on_off_property(properties, "i"))
		result.run.marks.insert(mark::italic);
	if (const xmlNode* underline = w_child(properties, "u"))
	{
		if (w_attribute(underline, "val") != "none")
			result.run.marks.insert(mark::underline);
	}
	result.format.bold = result.run.marks.contains(mark::bold);
	if (std::optional<int> half_points = to_int(w_attribute(w_child(properties, "sz"), "val")))
		result.format.size_pt = *half_points / 2.0;
	return result;
}

// Runs directly in the paragraph and inside hyperlinks, in document order
std::vector<const xmlNode*> paragraph_runs(const xmlNode* p)
{
	std::vector<const xmlNode*> runs;
	for (const xmlNode* child = p->children; child; child = child->next)
	{
		if (is_w(child, "r"))
			runs.push_back(child);
		else if (is_w(child, "hyperlink"))
		{
			for (const xmlNode* link_child = child->children; link_child; link_child = link_child->next)
			{
				if (is_w(link_child, "r"))
					runs.push_back(link_child);
			}
		}
	}
	return runs;
}

docx::paragraph read_paragraph(const xmlNode* p, const style_sheet& styles)
{
	docx::paragraph para;
	const xmlNode* properties = w_child(p, "pPr");
	para.style_name = styles.name_of(w_attribute(w_child(properties, "pStyle"), "val"));
	if (const xmlNode* numbering = w_child(properties, "numPr"))
		para.numbering_id = to_int(w_attribute(w_child(numbering, "numId"), "val")).value_or(0);

	std::string text;
	for (const xmlNode* r : paragraph_runs(p))
	{
		run_content content = read_run(r);
		if (!para.first_run && r->parent == p)
			para.first_run = content.format;
		text += content.run.text;
		if (!content.run.text.empty())
			para.runs.push_back(std::move(content.run));
	}
	para.text = boost::algorithm::trim_copy(text);
	return para;
}

std::string paragraph_text(const xmlNode* p)
{
	std::string text;
	for (const xmlNode* r : paragraph_runs(p))
		text += read_run(r).run.text;
	return text;
}

std::string cell_text(const xmlNode* tc)
{
	std::string text;
	bool first = true;
	for (const xmlNode* child = tc->children; child; child = child->next)
	{
		if (!is_w(child, "p"))
			continue;
		if (!first)
			text += '\n';
		text += paragraph_text(child);
		first = false;
	}
	return text;
}

// Merged cells are repeated once per grid column they cover: horizontally (w:gridSpan)
// and vertically (w:vMerge continuation takes the text of the cell above).
block::Table read_table(const xmlNode* tbl)
{
	block::Table table;
	for (const xmlNode* tr = tbl->children; tr; tr = tr->next)
	{
		if (!is_w(tr, "tr"))
			continue;
		const std::vector<std::string>* previous_row = table.rows.empty() ? nullptr : &table.rows.back();
		std::vector<std::string> row;
		for (const xmlNode* tc = tr->children; tc; tc = tc->next)
		{
			if (!is_w(tc, "tc"))
				continue;
			const xmlNode* properties = w_child(tc, "tcPr");
			int span = std::max(1, to_int(w_attribute(w_child(properties, "gridSpan"), "val")).value_or(1));
			std::string text = cell_text(tc);
			if (const xmlNode* vertical_merge = w_child(properties, "vMerge"))
			{
				std::size_t column = row.size();
				if (w_attribute(vertical_merge, "val") != "restart" && previous_row && column < previous_row->size())
					text = (*previous_row)[column];
			}
			row.insert(row.end(), span, text);
		}
		table.rows.push_back(std::move(row));
	}
	return table;
}

Block content_block(docx::paragraph&& para, const docx_heuristics& heuristics)
{
	if (std::optional<int> level = docx::heading_level(para.style_name))
		return block::Heading{*level, std::move(para.text), std::move(para.runs)};
	if (docx::is_bold_heading(para, heuristics))
		return block::Heading{heuristics.promoted_level, std::move(para.text), std::move(para.runs)};
	return block::Paragraph{std::move(para.text), std::move(para.runs)};
}

} // anonymous namespace

docx_extractor::docx_extractor(docx_heuristics heuristics)
	: m_heuristics(heuristics)
{}

std::vector<Page> docx_extractor::extract_or_throw(std::span<const std::byte> data) const
{
	log_scope(data.size());
	zip_reader package{data, m_heuristics.max_part_size};
	style_sheet styles = read_styles(package);
	xml_document_ptr document = parse_xml(package.read("word/document.xml"), "word/document.xml");
	const xmlNode* body = w_child(xmlDocGetRootElement(document.get()), "body");
	throw_if(!body, "word/document.xml has no w:body", errors::uninterpretable_data{});

	std::vector<Block> blocks;
	docx::list_state state = docx::NoList{};
	auto apply = [&](docx::transition&& step)
	{
		state = std::move(step.state);
		for (Block& emitted : step.emitted)
			blocks.push_back(std::move(emitted));
	};
	for (const xmlNode* element = body->children; element; element = element->next)
	{
		if (is_w(element, "tbl"))
			apply(docx::on_table(std::move(state), read_table(element)));
		else if (is_w(element, "p"))
		{
			docx::paragraph para = read_paragraph(element, styles);
			if (para.text.empty())
				apply(docx::on_empty_paragraph(std::move(state)));
			else if (docx::heading_level(para.style_name))
				apply(docx::on_content_paragraph(std::move(state), content_block(std::move(para), m_heuristics)));
			else if (std::optional<docx::list_kind> kind = docx::detect_list(para, m_heuristics))
				apply(docx::on_list_paragraph(std::move(state), *kind, block::ListItem{std::move(para.text), std::move(para.runs)}));
			else
				apply(docx::on_content_paragraph(std::move(state), content_block(std::move(para), m_heuristics)));
		}
	}
	for (Block& pending : docx::finish(std::move(state)))
		blocks.push_back(std::move(pending));
	log_entry(blocks.size());
	std::vector<Page> pages;
	pages.push_back(Page{1, std::move(blocks)});
	return pages;
}

std::vector<Page> docx_extractor::extract(std::span<const std::byte> data) const
{
	try
	{
		return extract_or_throw(data);
	}
	catch (const std::exception& e)
	{
		log_entry(log::warning{}, "DOCX extraction failed", errors::diagnostic_message(e));
		return {};
	}
}

} // namespace folio
