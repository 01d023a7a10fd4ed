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

#ifndef FOLIO_ERROR_TAGS_H
#define FOLIO_ERROR_TAGS_H

#include <string_view>

namespace folio::errors
{

/// @brief Input bytes could not be interpreted as the expected document format.
struct uninterpretable_data { static constexpr std::string_view string() { return "uninterpretable data"; } };

/// @brief Document is password protected.
struct file_encrypted { static constexpr std::string_view string() { return "file encrypted"; } };

/// @brief Blob store read or write failed.
struct storage_failure { static constexpr std::string_view string() { return "storage failure"; } };

/// @brief Internal inconsistency, a bug in the calling code.
struct program_logic { static constexpr std::string_view string() { return "program logic"; } };

} // namespace folio::errors

#endif // FOLIO_ERROR_TAGS_H
