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

#include "file_type.h"

#include <algorithm>
#include <array>

namespace folio
{

namespace
{

template <std::size_t N>
bool starts_with(std::span<const std::byte> data, const std::array<unsigned char, N>& magic)
{
	return data.size() >= N &&
		std::equal(magic.begin(), magic.end(), data.begin(),
			[](unsigned char m, std::byte b) { return std::byte{m} == b; });
}

constexpr std::array<unsigned char, 4> pdf_magic { '%', 'P', 'D', 'F' };
constexpr std::array<unsigned char, 4> zip_magic { 'P', 'K', 0x03, 0x04 };

} // anonymous namespace

file_type detect_file_type(std::span<const std::byte> prefix)
{
	if (starts_with(prefix, pdf_magic))
		return file_type::pdf;
	if (starts_with(prefix, zip_magic))
		return file_type::docx;
	return file_type::unknown;
}

} // namespace folio
