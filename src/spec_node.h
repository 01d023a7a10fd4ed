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

#ifndef FOLIO_SPEC_NODE_H
#define FOLIO_SPEC_NODE_H

#include "block.h"
#include "core_export.h"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @brief Canonical document tree, the format independent result of a conversion.
 *
 * Every node has an id unique within its tree, a typed content and ordered children.
 * Text nodes are leaves. The root is a Document. Renderers only read the tree.
 */
namespace folio::spec
{

/// @brief Prefix of the node type tags in the JSON form of the tree.
constexpr std::string_view type_prefix = "https://spec.nldoc.nl/Resource/";

struct Document { bool operator==(const Document&) const = default; };

/// @brief Level is 10 for a top level heading up to 60, in steps of 10.
struct Heading
{
	int level = 20;
	bool operator==(const Heading&) const = default;
};

struct Paragraph { bool operator==(const Paragraph&) const = default; };

struct Text
{
	std::string text;
	std::vector<mark> marks;
	bool operator==(const Text&) const = default;
};

struct Table { bool operator==(const Table&) const = default; };
struct TableHeaderRow { bool operator==(const TableHeaderRow&) const = default; };
struct TableRow { bool operator==(const TableRow&) const = default; };
struct TableCell { bool operator==(const TableCell&) const = default; };
struct BulletList { bool operator==(const BulletList&) const = default; };
struct OrderedList { bool operator==(const OrderedList&) const = default; };

/// @brief Order is 1-based and present for items of an OrderedList.
struct ListItem
{
	std::optional<int> order;
	bool operator==(const ListItem&) const = default;
};

/// @brief Node of a type outside the vocabulary, kept when loading a tree from JSON.
struct Unknown
{
	std::string type;
	bool operator==(const Unknown&) const = default;
};

using Content = std::variant<Document, Heading, Paragraph, Text, Table, TableHeaderRow, TableRow, TableCell,
	BulletList, OrderedList, ListItem, Unknown>;

struct Node
{
	std::string id;
	Content content;
	std::vector<Node> children;

	bool operator==(const Node&) const = default;

	template <typename T>
	bool is() const { return std::holds_alternative<T>(content); }

	template <typename T>
	const T& as() const { return std::get<T>(content); }
};

/**
 * @brief Short type name ("Heading", "TableHeaderRow"), or the stored tag of an Unknown node.
 */
FOLIO_CORE_EXPORT std::string type_name(const Content& content);

/**
 * @brief Full type tag: type_prefix followed by the short name. Unknown nodes keep their tag unchanged.
 */
FOLIO_CORE_EXPORT std::string type_tag(const Content& content);

/**
 * @brief Content for a type tag, dispatching on the part after the last '/'.
 *
 * Tags outside the vocabulary become Unknown. Fields of the content (level, text...) are left default.
 */
FOLIO_CORE_EXPORT Content content_for_tag(std::string_view tag);

/// @brief Heading level between 1 and 6 for a node level in tens.
FOLIO_CORE_EXPORT int html_heading_level(int node_level);

/// @brief Concatenated text of all Text nodes below the node.
FOLIO_CORE_EXPORT std::string plain_text(const Node& node);

} // namespace folio::spec

#endif // FOLIO_SPEC_NODE_H
