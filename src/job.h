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

#ifndef FOLIO_JOB_H
#define FOLIO_JOB_H

#include <boost/json/object.hpp>
#include "core_export.h"
#include <string>
#include <string_view>

namespace folio
{

/**
 * @brief One conversion request: which document to convert and into what.
 */
struct job
{
	std::string document_id;
	std::string job_id;
	std::string trace_id;
	/// Bucket and key of the source document.
	std::string bucket_name = "files";
	std::string filename;
	/// Content type of the requested output: text/html or the TipTap content type.
	std::string target_file_type = "text/html";
	/// Page count reported by earlier processing, used in the fallback paragraph.
	int page_count = 10;
};

/**
 * @brief Reads a job message.
 *
 * The document id is the part of `recordId` after `|||` (the filename without one). `jobId`
 * defaults to a random UUID, `traceId` to the document id, `filename` to the document id.
 * The page count comes from `attributes.pageCount.values[0].stringResult`.
 *
 * @throws errors::base tagged errors::uninterpretable_data for invalid JSON or a non numeric page count
 */
FOLIO_CORE_EXPORT job parse_job(std::string_view json);

/**
 * @brief Outcome of a job, sent back to the scheduler and announced to clients.
 */
struct job_result
{
	std::string trace_id;
	std::string record_id;
	std::string job_id;
	/// UTC, ISO 8601 with a Z suffix.
	std::string timestamp;
	bool success = true;
	/// Where the canonical tree was stored.
	std::string bucket_name;
	std::string filename;
	/// Primary output for clients: the TipTap document when requested, the HTML page otherwise.
	std::string done_location;
	std::string done_content_type;
};

/// @brief `{"resultType":"fileWorkerResult", "traceId", "recordId", "jobId", "timestamp", "success", "bucketName", "filename"}`
FOLIO_CORE_EXPORT boost::json::object result_record(const job_result& result);

/// @brief Event telling clients that the output at `done_location` is ready.
FOLIO_CORE_EXPORT boost::json::object done_event(const job_result& result);

FOLIO_CORE_EXPORT std::string utc_timestamp();

} // namespace folio

#endif // FOLIO_JOB_H
