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

#ifndef FOLIO_LOG_CORE_H
#define FOLIO_LOG_CORE_H

#include "core_export.h"
#include <functional>
#include "serialization_base.h"
#include "source_location.h"
#include <span>
#include <string>
#include <string_view>

/**
 * @brief Structured logging.
 *
 * Log entries capture named variables and tags as a serialized array. Nothing is logged until a sink
 * is set with `set_sink` and a filter with `set_filter`. The filter is a list of rules separated by
 * commas, semicolons or spaces:
 * - `*` enables everything,
 * - `tag_name` enables entries carrying a tag (wildcards `*` and `?` allowed),
 * - `@file:name.cpp` and `@func:*pattern*` enable entries by source file or function,
 * - a leading `-` turns a rule into a deny rule, evaluated first.
 *
 * In release builds only entries carrying a persistent tag (log::audit) are compiled in.
 */
namespace folio::log
{

class FOLIO_CORE_EXPORT record
{
public:
	record(source_location location, serialization::array&& context);
	~record();

	record(const record&) = delete;
	record& operator=(const record&) = delete;

	source_location m_location;
	serialization::array m_context;
};

FOLIO_CORE_EXPORT void set_filter(const std::string& filter_spec);

FOLIO_CORE_EXPORT std::string get_filter();

/**
 * @brief Sets the callback receiving every enabled log record. An empty function disables logging.
 * @see json_stream_sink
 */
FOLIO_CORE_EXPORT void set_sink(std::function<void(const record&)> callback);

FOLIO_CORE_EXPORT std::function<void(const record&)> get_sink();

/**
 * @brief Creates the common part of a log record: timestamp, file, line, function and thread id.
 */
FOLIO_CORE_EXPORT serialization::object create_base_metadata(source_location location);

namespace detail
{
FOLIO_CORE_EXPORT bool is_enabled(const source_location& location, std::span<const std::string_view> entry_tags);
FOLIO_CORE_EXPORT bool is_logging_enabled();
}

} // namespace folio::log

#endif // FOLIO_LOG_CORE_H
