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

#ifndef FOLIO_ENCODING_FIXER_H
#define FOLIO_ENCODING_FIXER_H

#include "core_export.h"
#include <string>
#include <string_view>

namespace folio
{

/**
 * @brief Repairs UTF-8 text that was decoded as Windows-1252 or CP437 somewhere upstream.
 *
 * Replaces mojibake of dashes, curly quotes, ellipsis and the accented letters common in Dutch text
 * with the intended characters and strips zero-width spaces and byte-order marks.
 * Replacements are repeated until the text stops changing, so fix_encoding(fix_encoding(x)) == fix_encoding(x).
 */
FOLIO_CORE_EXPORT std::string fix_encoding(std::string_view text);

} // namespace folio

#endif // FOLIO_ENCODING_FIXER_H
