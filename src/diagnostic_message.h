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

#ifndef FOLIO_DIAGNOSTIC_MESSAGE_H
#define FOLIO_DIAGNOSTIC_MESSAGE_H

#include "core_export.h"
#include <exception>
#include <string>

namespace folio::errors
{

/**
 * @brief Generates a diagnostic message for the given nested exceptions chain.
 */
FOLIO_CORE_EXPORT std::string diagnostic_message(const std::exception& e);

/**
 * @brief Generates a diagnostic message for the given nested exceptions chain.
 */
FOLIO_CORE_EXPORT std::string diagnostic_message(std::exception_ptr eptr);

} // namespace folio::errors

#endif // FOLIO_DIAGNOSTIC_MESSAGE_H
