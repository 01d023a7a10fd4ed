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

#ifndef FOLIO_TIPTAP_RENDERER_H
#define FOLIO_TIPTAP_RENDERER_H

#include <boost/json/value.hpp>
#include "core_export.h"
#include <optional>
#include "spec_node.h"
#include <string>
#include <string_view>

/**
 * @brief Conversion of the canonical tree into a TipTap (ProseMirror) editor document.
 */
namespace folio::tiptap
{

/// @brief Content type of serialized TipTap documents.
constexpr std::string_view content_type = "application/vnd.nldoc.tiptap+json";

/**
 * @brief TipTap node for a block-level tree node, or nothing for nodes TipTap has no block for
 * (Text, TableCell outside a table, unknown types).
 */
FOLIO_CORE_EXPORT std::optional<boost::json::object> render_block(const spec::Node& node);

/**
 * @brief `{"type":"doc","content":[...]}` with the rendered children of the Document root.
 *
 * A root that is not a Document gives an empty document.
 */
FOLIO_CORE_EXPORT boost::json::object render(const spec::Node& root);

FOLIO_CORE_EXPORT std::string render_to_string(const spec::Node& root);

} // namespace folio::tiptap

#endif // FOLIO_TIPTAP_RENDERER_H
