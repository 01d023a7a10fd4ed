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

#include "job.h"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/json.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <charconv>
#include "error_tags.h"
#include "throw_if.h"

namespace folio
{

namespace
{

const boost::json::value* find_path(const boost::json::value& root, std::initializer_list<std::string_view> keys)
{
	const boost::json::value* current = &root;
	for (std::string_view key : keys)
	{
		if (!current->is_object())
			return nullptr;
		current = current->as_object().if_contains(key);
		if (!current)
			return nullptr;
	}
	return current;
}

std::optional<std::string> string_field(const boost::json::object& object, std::string_view key)
{
	const boost::json::value* field = object.if_contains(key);
	if (!field || !field->is_string())
		return std::nullopt;
	return std::string{field->as_string()};
}

std::optional<std::string> page_count_field(const boost::json::value& root)
{
	const boost::json::value* values = find_path(root, {"attributes", "pageCount", "values"});
	if (!values || !values->is_array() || values->as_array().empty())
		return std::nullopt;
	const boost::json::value& first = values->as_array().front();
	if (!first.is_object())
		return std::nullopt;
	return string_field(first.as_object(), "stringResult");
}

} // anonymous namespace

job parse_job(std::string_view json)
{
	boost::json::error_code error;
	boost::json::value root = boost::json::parse(json, error);
	throw_if(error, "invalid job JSON", error.message(), errors::uninterpretable_data{});
	throw_if(!root.is_object(), "job is not a JSON object", errors::uninterpretable_data{});
	const boost::json::object& object = root.as_object();

	job result;
	std::string record_id = string_field(object, "recordId").value_or("");
	std::optional<std::string> filename = string_field(object, "filename");
	if (std::size_t separator = record_id.rfind("|||"); separator != std::string::npos)
		result.document_id = record_id.substr(separator + 3);
	else
		result.document_id = filename.value_or("unknown");
	result.job_id = string_field(object, "jobId").value_or(boost::uuids::to_string(boost::uuids::random_generator()()));
	result.trace_id = string_field(object, "traceId").value_or(result.document_id);
	result.bucket_name = string_field(object, "bucketName").value_or("files");
	result.filename = filename.value_or(result.document_id);
	result.target_file_type = string_field(object, "targetFileType").value_or("text/html");
	if (std::optional<std::string> page_count = page_count_field(root))
	{
		auto [ptr, ec] = std::from_chars(page_count->data(), page_count->data() + page_count->size(), result.page_count);
		throw_if(ec != std::errc{} || ptr != page_count->data() + page_count->size(), "invalid page count", *page_count, errors::uninterpretable_data{});
	}
	return result;
}

boost::json::object result_record(const job_result& result)
{
	return boost::json::object{
		{"resultType", "fileWorkerResult"},
		{"traceId", result.trace_id},
		{"recordId", result.record_id},
		{"jobId", result.job_id},
		{"timestamp", result.timestamp},
		{"success", result.success},
		{"bucketName", result.bucket_name},
		{"filename", result.filename}
	};
}

boost::json::object done_event(const job_result& result)
{
	return boost::json::object{
		{"type", "https://event.spec.nldoc.nl/done"},
		{"timestamp", result.timestamp},
		{"traceId", result.trace_id},
		{"context", boost::json::object{
			{"contentType", result.done_content_type},
			{"location", result.done_location}
		}}
	};
}

std::string utc_timestamp()
{
	return boost::posix_time::to_iso_extended_string(boost::posix_time::microsec_clock::universal_time()) + "Z";
}

} // namespace folio
