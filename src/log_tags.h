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

#ifndef FOLIO_LOG_TAGS_H
#define FOLIO_LOG_TAGS_H

#include <string_view>

namespace folio::log
{

/**
 * @brief Tag for operational events that must be logged in release builds too.
 *
 * Example: `log_entry(log::audit{}, "Conversion finished", document_id);`
 */
struct audit { static constexpr std::string_view string() { return "audit"; } };

/// @brief Tag added to a log entry when a `log_scope` is entered.
struct scope_enter { static constexpr std::string_view string() { return "scope_enter"; } };

/// @brief Tag added to a log entry when a `log_scope` is exited.
struct scope_exit { static constexpr std::string_view string() { return "scope_exit"; } };

/// @brief Tag for log entries describing a recoverable problem.
struct warning { static constexpr std::string_view string() { return "warning"; } };

} // namespace folio::log

#endif // FOLIO_LOG_TAGS_H
