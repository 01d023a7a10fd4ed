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

#ifndef FOLIO_FILE_TYPE_H
#define FOLIO_FILE_TYPE_H

#include "core_export.h"
#include <cstddef>
#include <span>

namespace folio
{

enum class file_type { pdf, docx, unknown };

/// @brief Number of leading bytes needed by detect_file_type.
constexpr std::size_t file_type_prefix_size = 8;

/**
 * @brief Classifies a document by its magic bytes.
 *
 * `%PDF` is a PDF, a local ZIP file header `PK\x03\x04` is taken as DOCX. Never fails.
 */
FOLIO_CORE_EXPORT file_type detect_file_type(std::span<const std::byte> prefix);

} // namespace folio

#endif // FOLIO_FILE_TYPE_H
