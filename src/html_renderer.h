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

#ifndef FOLIO_HTML_RENDERER_H
#define FOLIO_HTML_RENDERER_H

#include "core_export.h"
#include "spec_node.h"
#include <string>
#include <string_view>

namespace folio::html
{

/// @brief Escapes & < > " and ' for use in HTML text and attribute values.
FOLIO_CORE_EXPORT std::string escape(std::string_view text);

/**
 * @brief HTML fragment for a subtree.
 *
 * Headings, paragraphs, lists, list items, tables and table rows end with a newline.
 * Text is escaped and wrapped in `<strong>`, then `<em>`, then `<u>` for its marks.
 * Nodes of unknown type render their children.
 */
FOLIO_CORE_EXPORT std::string render_fragment(const spec::Node& node);

/**
 * @brief Complete HTML5 page (Dutch language, inline stylesheet) with the rendered tree as body.
 */
FOLIO_CORE_EXPORT std::string render(const spec::Node& root);

} // namespace folio::html

#endif // FOLIO_HTML_RENDERER_H
