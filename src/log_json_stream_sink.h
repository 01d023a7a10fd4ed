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

#ifndef FOLIO_LOG_JSON_STREAM_SINK_H
#define FOLIO_LOG_JSON_STREAM_SINK_H

#include "core_export.h"
#include <functional>
#include "log_core.h"
#include <memory>
#include <ostream>

namespace folio::log
{

/**
 * @brief Sink writing records as a JSON array to a stream the caller keeps alive.
 */
FOLIO_CORE_EXPORT std::function<void(const record&)> json_stream_sink(std::ostream& stream);

/**
 * @brief Sink writing records as a JSON array to a stream owned by the sink (e.g. a log file).
 */
FOLIO_CORE_EXPORT std::function<void(const record&)> json_stream_sink(std::shared_ptr<std::ostream> stream);

}

#endif // FOLIO_LOG_JSON_STREAM_SINK_H
