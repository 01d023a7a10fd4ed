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

#ifndef FOLIO_H
#define FOLIO_H

#include "blob_store.h"
#include "block.h"
#include "charset_converter.h"
#include "contains_type.h"
#include "conversion.h"
#include "diagnostic_message.h"
#include "docx_extractor.h"
#include "docx_list_state.h"
#include "docx_paragraph.h"
#include "encoding_fixer.h"
#include "ensure.h"
#include "environment.h"
#include "error_tags.h"
#include "file_type.h"
#include "filesystem_blob_store.h"
#include "heuristics.h"
#include "html_renderer.h"
#include "job.h"
#include "log_core.h"
#include "log_entry.h"
#include "log_json_stream_sink.h"
#include "log_scope.h"
#include "log_state_saver.h"
#include "make_error.h"
#include "memory_blob_store.h"
#include "pdf_extractor.h"
#include "serialization_block.h"
#include "serialization_enum.h"
#include "spec_builder.h"
#include "spec_json.h"
#include "spec_node.h"
#include "throw_if.h"
#include "tiptap_renderer.h"
#include "zip_reader.h"

#endif // FOLIO_H
