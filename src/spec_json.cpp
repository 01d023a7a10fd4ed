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

#include "spec_json.h"

#include <boost/json.hpp>
#include "error_tags.h"
#include <magic_enum/magic_enum.hpp>
#include "throw_if.h"

namespace folio::spec
{

std::string_view mark_name(mark m)
{
	return magic_enum::enum_name(m);
}

std::optional<mark> mark_from_name(std::string_view name)
{
	if (name == "strong")
		return mark::bold;
	if (name == "em")
		return mark::italic;
	return magic_enum::enum_cast<mark>(name);
}

namespace
{

struct fields_writer
{
	boost::json::object& json;

	void operator()(const Heading& heading) const { json["level"] = heading.level; }

	void operator()(const Text& text) const
	{
		json["text"] = text.text;
		if (text.marks.empty())
			return;
		boost::json::array marks;
		for (mark m : text.marks)
			marks.push_back(boost::json::object{{"type", mark_name(m)}});
		json["marks"] = std::move(marks);
	}

	void operator()(const ListItem& item) const
	{
		if (item.order)
			json["order"] = *item.order;
	}

	template <typename T>
	void operator()(const T&) const {}
};

std::optional<std::int64_t> int_field(const boost::json::object& json, std::string_view key)
{
	const boost::json::value* field = json.if_contains(key);
	if (!field)
		return std::nullopt;
	if (field->is_int64())
		return field->as_int64();
	if (field->is_uint64())
		return static_cast<std::int64_t>(field->as_uint64());
	if (field->is_double())
		return static_cast<std::int64_t>(field->as_double());
	return std::nullopt;
}

std::string string_field(const boost::json::object& json, std::string_view key)
{
	const boost::json::value* field = json.if_contains(key);
	if (!field || !field->is_string())
		return {};
	return std::string{field->as_string()};
}

std::vector<mark> read_marks(const boost::json::object& json)
{
	std::vector<mark> marks;
	const boost::json::value* field = json.if_contains("marks");
	if (!field || !field->is_array())
		return marks;
	for (const boost::json::value& entry : field->as_array())
	{
		if (!entry.is_object())
			continue;
		if (std::optional<mark> m = mark_from_name(string_field(entry.as_object(), "type")))
			marks.push_back(*m);
	}
	return marks;
}

} // anonymous namespace

boost::json::value to_json(const Node& node)
{
	boost::json::object json;
	json["id"] = node.id;
	json["type"] = type_tag(node.content);
	std::visit(fields_writer{json}, node.content);
	if (!node.is<Text>())
	{
		boost::json::array children;
		for (const Node& child : node.children)
			children.push_back(to_json(child));
		json["children"] = std::move(children);
	}
	return json;
}

Node from_json(const boost::json::value& json)
{
	throw_if(!json.is_object(), "tree node is not a JSON object", errors::uninterpretable_data{});
	const boost::json::object& object = json.as_object();
	const boost::json::value* type = object.if_contains("type");
	throw_if(!type || !type->is_string(), "tree node has no type", errors::uninterpretable_data{});

	Node node;
	node.id = string_field(object, "id");
	node.content = content_for_tag(std::string_view{type->as_string()});
	if (Heading* heading = std::get_if<Heading>(&node.content))
	{
		if (std::optional<std::int64_t> level = int_field(object, "level"))
			heading->level = static_cast<int>(*level);
	}
	else if (Text* text = std::get_if<Text>(&node.content))
	{
		text->text = string_field(object, "text");
		text->marks = read_marks(object);
	}
	else if (ListItem* item = std::get_if<ListItem>(&node.content))
	{
		if (std::optional<std::int64_t> order = int_field(object, "order"))
			item->order = static_cast<int>(*order);
	}
	if (const boost::json::value* children = object.if_contains("children"); children && children->is_array())
	{
		for (const boost::json::value& child : children->as_array())
			node.children.push_back(from_json(child));
	}
	return node;
}

std::string serialize(const Node& node)
{
	return boost::json::serialize(to_json(node));
}

Node parse(std::string_view json)
{
	boost::json::error_code error;
	boost::json::value value = boost::json::parse(json, error);
	throw_if(error, "invalid JSON", error.message(), errors::uninterpretable_data{});
	return from_json(value);
}

} // namespace folio::spec
