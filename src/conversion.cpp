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

#include "conversion.h"

#include "diagnostic_message.h"
#include "docx_extractor.h"
#include "environment.h"
#include <exception>
#include "html_renderer.h"
#include "log_entry.h"
#include "log_scope.h"
#include "make_error.h"
#include "pdf_extractor.h"
#include "serialization_enum.h" // IWYU pragma: keep
#include "spec_json.h"
#include "tiptap_renderer.h"

namespace folio::conversion
{

settings settings::from_environment()
{
	settings config;
	config.spec_bucket = environment::get_or("FOLIO_SPEC_BUCKET", config.spec_bucket);
	config.output_bucket = environment::get_or("FOLIO_OUTPUT_BUCKET", config.output_bucket);
	return config;
}

file_type sniff(const blob_store& store, const std::string& bucket, const std::string& key)
{
	try
	{
		std::vector<std::byte> prefix = store.get(bucket, key, byte_range{0, file_type_prefix_size});
		return detect_file_type(prefix);
	}
	catch (const std::exception& e)
	{
		log_entry(log::warning{}, "Cannot read document header", bucket, key, errors::diagnostic_message(e));
		return file_type::unknown;
	}
}

std::vector<Page> extract(std::span<const std::byte> data, file_type type, const settings& config)
{
	log_scope(type, data.size());
	switch (type)
	{
		case file_type::pdf:
			return pdf_extractor{config.pdf}.extract(data);
		case file_type::docx:
			return docx_extractor{config.docx}.extract(data);
		case file_type::unknown:
			break;
	}
	std::vector<Page> pages = pdf_extractor{config.pdf}.extract(data);
	if (pages.empty())
		pages = docx_extractor{config.docx}.extract(data);
	return pages;
}

namespace
{

void store_results(blob_store& store, const job& request, const spec::Node& tree, const settings& config, job_result& result)
{
	std::string spec_key = request.document_id + ".spec.json";
	store.put(config.spec_bucket, spec_key, to_bytes(spec::serialize(tree)), "application/json");

	std::string html_key = request.document_id + ".html";
	store.put(config.output_bucket, html_key, to_bytes(html::render(tree)), "text/html; charset=utf-8");
	result.done_location = html_key;

	if (request.target_file_type == tiptap::content_type)
	{
		std::string tiptap_key = request.document_id + ".json";
		store.put(config.output_bucket, tiptap_key, to_bytes(tiptap::render_to_string(tree)),
			std::string{tiptap::content_type} + "; charset=utf-8");
		result.done_location = tiptap_key;
	}
	result.bucket_name = config.spec_bucket;
	result.filename = spec_key;
}

} // anonymous namespace

job_result run_job(blob_store& store, const job& request, const settings& config, const spec::id_generator& next_id)
{
	log_scope(request.document_id, request.job_id, request.filename, request.target_file_type);
	try
	{
		file_type type = sniff(store, request.bucket_name, request.filename);
		std::vector<std::byte> data = store.get(request.bucket_name, request.filename);
		std::vector<Page> pages = extract(data, type, config);
		spec::Node tree = spec::build(pages, request.page_count, next_id);

		job_result result;
		result.trace_id = request.trace_id;
		result.record_id = "folio|||" + request.document_id;
		result.job_id = request.job_id;
		result.timestamp = utc_timestamp();
		result.success = true;
		result.done_content_type = request.target_file_type;
		store_results(store, request, tree, config, result);
		log_entry(log::audit{}, "Conversion finished", request.document_id, pages.size());
		return result;
	}
	catch (const std::exception&)
	{
		std::throw_with_nested(make_error("Conversion job failed", request.document_id, request.job_id));
	}
}

} // namespace folio::conversion
