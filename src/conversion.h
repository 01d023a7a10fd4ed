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

#ifndef FOLIO_CONVERSION_H
#define FOLIO_CONVERSION_H

#include "blob_store.h"
#include "block.h"
#include "core_export.h"
#include "file_type.h"
#include "heuristics.h"
#include "job.h"
#include "spec_builder.h"
#include <span>
#include <string>
#include <vector>

/**
 * @brief The document conversion: sniff, extract, build the canonical tree, render and store the results.
 */
namespace folio::conversion
{

struct settings
{
	/// Bucket receiving `<document id>.spec.json`.
	std::string spec_bucket = "files";
	/// Bucket receiving the rendered HTML page and TipTap document.
	std::string output_bucket = "output";
	pdf_heuristics pdf;
	docx_heuristics docx;

	/// @brief Defaults overridden by FOLIO_SPEC_BUCKET and FOLIO_OUTPUT_BUCKET.
	FOLIO_CORE_EXPORT static settings from_environment();
};

/**
 * @brief Type of a stored document from its first bytes. Read failures give file_type::unknown.
 */
FOLIO_CORE_EXPORT file_type sniff(const blob_store& store, const std::string& bucket, const std::string& key);

/**
 * @brief Pages of a document in memory.
 *
 * Unknown types are tried as PDF, then as DOCX; the first extractor returning pages wins.
 * Malformed documents give no pages.
 */
FOLIO_CORE_EXPORT std::vector<Page> extract(std::span<const std::byte> data, file_type type, const settings& config = {});

/**
 * @brief Converts the document of a job and stores the tree, the HTML page and, when requested, the TipTap document.
 *
 * @throws errors::base with the cause nested. Store errors in the chain are tagged errors::storage_failure.
 */
FOLIO_CORE_EXPORT job_result run_job(blob_store& store, const job& request, const settings& config = {},
	const spec::id_generator& next_id = spec::uuid_id_generator());

} // namespace folio::conversion

#endif // FOLIO_CONVERSION_H
