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

#include "pdf_extractor.h"

#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <climits>
#include "charset_converter.h"
#include "diagnostic_message.h"
#include "encoding_fixer.h"
#include "error_tags.h"
#include <fpdf_text.h>
#include <fpdfview.h>
#include "log_entry.h"
#include "log_scope.h"
#include <memory>
#include <mutex>
#include "serialization_block.h" // IWYU pragma: keep
#include "throw_if.h"
#include <type_traits>

namespace folio
{

namespace
{

// PDFium keeps global state and is not thread-safe
std::mutex pdfium_mutex;
std::once_flag pdfium_init_flag;

struct document_closer { void operator()(FPDF_DOCUMENT document) const { FPDF_CloseDocument(document); } };
struct page_closer { void operator()(FPDF_PAGE page) const { FPDF_ClosePage(page); } };
struct text_page_closer { void operator()(FPDF_TEXTPAGE text_page) const { FPDFText_ClosePage(text_page); } };

using document_ptr = std::unique_ptr<std::remove_pointer_t<FPDF_DOCUMENT>, document_closer>;
using page_ptr = std::unique_ptr<std::remove_pointer_t<FPDF_PAGE>, page_closer>;
using text_page_ptr = std::unique_ptr<std::remove_pointer_t<FPDF_TEXTPAGE>, text_page_closer>;

void init_pdfium()
{
	std::call_once(pdfium_init_flag, []() { FPDF_InitLibrary(); });
}

std::string font_name(FPDF_TEXTPAGE text_page, int index)
{
	unsigned long length = FPDFText_GetFontInfo(text_page, index, nullptr, 0, nullptr);
	if (length == 0)
		return {};
	std::string name(length, '\0');
	FPDFText_GetFontInfo(text_page, index, name.data(), length, nullptr);
	name.resize(length - 1);
	return name;
}

bool is_bold(FPDF_TEXTPAGE text_page, int index, const pdf_heuristics& heuristics)
{
	if (boost::algorithm::to_lower_copy(font_name(text_page, index)).find("bold") != std::string::npos)
		return true;
	int weight = FPDFText_GetFontWeight(text_page, index);
	return weight >= heuristics.bold_min_weight;
}

bool is_line_break(unsigned int code_unit)
{
	return code_unit == '\r' || code_unit == '\n';
}

// Line text is collected as UTF-16LE code units, surrogate pairs included
struct line_accumulator
{
	std::string utf16le;
	double max_font_size = 0.0;
	bool bold = false;

	void append(unsigned int code_unit)
	{
		utf16le.push_back(static_cast<char>(code_unit & 0xFF));
		utf16le.push_back(static_cast<char>((code_unit >> 8) & 0xFF));
	}
};

std::vector<pdf_line> read_lines(FPDF_TEXTPAGE text_page, const pdf_heuristics& heuristics)
{
	static thread_local charset_converter utf16_converter{"UTF-16LE", "UTF-8"};
	std::vector<pdf_line> lines;
	line_accumulator current;
	auto flush = [&]()
	{
		std::string text = fix_encoding(boost::algorithm::trim_copy(utf16_converter.convert(current.utf16le)));
		if (!text.empty())
			lines.push_back(pdf_line{text, current.max_font_size, current.bold});
		current = line_accumulator{};
	};
	int char_count = FPDFText_CountChars(text_page);
	throw_if(char_count < 0, "FPDFText_CountChars() failed", errors::uninterpretable_data{});
	for (int i = 0; i < char_count; ++i)
	{
		unsigned int code_unit = FPDFText_GetUnicode(text_page, i);
		if (is_line_break(code_unit))
		{
			flush();
			continue;
		}
		if (code_unit == 0)
			continue;
		current.append(code_unit);
		if (FPDFText_IsGenerated(text_page, i) == 1)
			continue;
		current.max_font_size = std::max(current.max_font_size, FPDFText_GetFontSize(text_page, i));
		current.bold = current.bold || is_bold(text_page, i, heuristics);
	}
	flush();
	return lines;
}

} // anonymous namespace

Block classify_pdf_line(const pdf_line& line, const pdf_heuristics& heuristics)
{
	if (line.max_font_size >= heuristics.heading1_min_size)
		return block::Heading{.level = 1, .text = line.text};
	if (line.max_font_size >= heuristics.heading2_min_size || (heuristics.bold_is_heading && line.bold))
		return block::Heading{.level = 2, .text = line.text};
	return block::Paragraph{.text = line.text};
}

pdf_extractor::pdf_extractor(pdf_heuristics heuristics)
	: m_heuristics(heuristics)
{}

std::vector<Page> pdf_extractor::extract_or_throw(std::span<const std::byte> data) const
{
	log_scope(data.size());
	std::lock_guard lock(pdfium_mutex);
	init_pdfium();
	throw_if(data.size() > INT_MAX, "PDF document too large", data.size(), errors::uninterpretable_data{});

	document_ptr document{FPDF_LoadMemDocument(data.data(), static_cast<int>(data.size()), nullptr)};
	if (!document)
	{
		unsigned long error_code = FPDF_GetLastError();
		throw_if(error_code == FPDF_ERR_PASSWORD, "PDF document is password protected", errors::file_encrypted{}, errors::uninterpretable_data{});
		throw make_error("FPDF_LoadMemDocument() failed", error_code, errors::uninterpretable_data{});
	}

	int page_count = FPDF_GetPageCount(document.get());
	std::vector<Page> pages;
	pages.reserve(page_count);
	for (int page_index = 0; page_index < page_count; ++page_index)
	{
		page_ptr page{FPDF_LoadPage(document.get(), page_index)};
		throw_if(!page, "FPDF_LoadPage() failed", page_index, errors::uninterpretable_data{});
		text_page_ptr text_page{FPDFText_LoadPage(page.get())};
		throw_if(!text_page, "FPDFText_LoadPage() failed", page_index, errors::uninterpretable_data{});

		Page result{.number = page_index + 1};
		for (const pdf_line& line : read_lines(text_page.get(), m_heuristics))
			result.blocks.push_back(classify_pdf_line(line, m_heuristics));
		log_entry(result.number, result.blocks.size());
		pages.push_back(std::move(result));
	}
	return pages;
}

std::vector<Page> pdf_extractor::extract(std::span<const std::byte> data) const
{
	try
	{
		return extract_or_throw(data);
	}
	catch (const std::exception& e)
	{
		log_entry(log::warning{}, "PDF extraction failed", errors::diagnostic_message(e));
		return {};
	}
}

} // namespace folio
