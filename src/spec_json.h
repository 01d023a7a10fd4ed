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

#ifndef FOLIO_SPEC_JSON_H
#define FOLIO_SPEC_JSON_H

#include <boost/json/value.hpp>
#include "core_export.h"
#include "spec_node.h"
#include <string>
#include <string_view>

/**
 * @brief JSON form of the canonical tree.
 *
 * A node is `{"id", "type", "children", "level"?, "order"?, "text"?, "marks"?}` where `type` is the
 * full type tag and marks are `[{"type":"bold"}, ...]`. Text nodes carry no children.
 */
namespace folio::spec
{

FOLIO_CORE_EXPORT boost::json::value to_json(const Node& node);

/**
 * @brief Loads a tree. Types outside the vocabulary become Unknown nodes, unknown marks are dropped,
 * `strong` and `em` are read as bold and italic.
 * @throws errors::base tagged errors::uninterpretable_data when a node is not an object or has no type
 */
FOLIO_CORE_EXPORT Node from_json(const boost::json::value& json);

FOLIO_CORE_EXPORT std::string serialize(const Node& node);

/// @throws errors::base tagged errors::uninterpretable_data
FOLIO_CORE_EXPORT Node parse(std::string_view json);

/// @brief Mark name used on the wire and in TipTap documents.
FOLIO_CORE_EXPORT std::string_view mark_name(mark m);

/// @brief Mark for a wire or TipTap mark name, accepting the `strong` and `em` aliases.
FOLIO_CORE_EXPORT std::optional<mark> mark_from_name(std::string_view name);

} // namespace folio::spec

#endif // FOLIO_SPEC_JSON_H
