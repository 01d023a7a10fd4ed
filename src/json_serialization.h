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

#ifndef FOLIO_JSON_SERIALIZATION_H
#define FOLIO_JSON_SERIALIZATION_H

#include "core_export.h"
#include "serialization_base.h"
#include <string>

namespace folio::serialization
{

/**
 * @brief Converts a `serialization::value` to a compact JSON string.
 */
FOLIO_CORE_EXPORT std::string to_json(const value& s_val);

} // namespace folio::serialization

#endif // FOLIO_JSON_SERIALIZATION_H
