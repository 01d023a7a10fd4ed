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

#ifndef FOLIO_CHARSET_CONVERTER_H
#define FOLIO_CHARSET_CONVERTER_H

#include "core_export.h"
#include "pimpl.h"
#include <string>
#include <string_view>

namespace folio
{

/**
 * @brief Converts text between character sets using iconv.
 *
 * Used for the UTF-16LE strings returned by PDFium.
 */
class FOLIO_CORE_EXPORT charset_converter : public with_pimpl<charset_converter>
{
public:
	charset_converter(const std::string& from, const std::string& to);
	~charset_converter();

	/// @throws errors::base when the input is not valid in the source charset
	std::string convert(std::string_view input) const;
};

} // namespace folio

#endif // FOLIO_CHARSET_CONVERTER_H
