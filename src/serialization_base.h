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

#ifndef FOLIO_SERIALIZATION_BASE_H
#define FOLIO_SERIALIZATION_BASE_H

#include "concepts.h"
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "type_name.h"

namespace folio
{

/**
 * @brief Generic, concept-based conversion of C++ values into a structured representation.
 *
 * A value is converted by the `serializer<T>` specialization selected for its type. The framework
 * provides specializations for primitives, strings, containers, pointers and variants; other modules
 * add specializations for their own types (blocks, pages, enums). Logging and error context use it
 * to capture the state of variables.
 */
namespace serialization
{

struct object;
struct array;

/**
 * @brief A variant type representing any serialized value.
 */
using value = std::variant<
	std::nullptr_t,
	bool,
	std::int64_t,
	std::uint64_t,
	double,
	std::string,
	array,
	object
>;

/// @brief Represents a serialized array (list of values).
struct array { std::vector<value> v; };

/// @brief Represents a serialized object (map of string keys to values).
struct object { std::map<std::string, value> v; };

/// @brief Helper to decorate a serialized value with a typeid string.
inline value decorate_with_typeid(const value& base_val, const std::string& typeid_str)
{
	return object{{
		{"typeid", typeid_str},
		{"value", base_val}
	}};
}

template <typename T>
struct serializer;

/**
 * @brief Serializes a value of type T into a `serialization::value`.
 */
template <typename T>
value full(const T& value) { return serializer<T>{}.full(value); }

/**
 * @brief Serializes a value of type T together with its type name.
 */
template <typename T>
value typed_summary(const T& value) { return serializer<T>{}.typed_summary(value); }

template <typename T>
concept value_alternative = variant_alternative<T, value>;

template <value_alternative T>
struct serializer<T>
{
	value full(const T& value) const { return value; }
	value typed_summary(const T& value) const { return decorate_with_typeid(full(value), type_name::pretty<T>()); }
};

template <typename T> requires(std::is_arithmetic_v<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& value) const
	{
		if constexpr (std::is_integral_v<T> && std::is_signed_v<T>)
			return static_cast<std::int64_t>(value);
		else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>)
			return static_cast<std::uint64_t>(value);
		else
			return static_cast<double>(value);
	}
	value typed_summary(const T& value) const { return decorate_with_typeid(full(value), type_name::pretty<T>()); }
};

template <typename T> requires string_like<T> && (!value_alternative<T>)
struct serializer<T>
{
	value full(const T& val) const
	{
		if constexpr (std::is_pointer_v<std::decay_t<T>>)
		{
			if (val == nullptr)
				return nullptr;
		}
		return std::string(val);
	}
	value typed_summary(const T& val) const { return decorate_with_typeid(full(val), type_name::pretty<T>()); }
};

/**
 * @brief Specialization for empty structs, used for tags.
 */
template <empty T>
struct serializer<T>
{
	value full(const T&) const { return object{}; }
	value typed_summary(const T& val) const { return decorate_with_typeid(full(val), type_name::pretty<T>()); }
};

/**
 * @brief Specialization for pointers, smart pointers and optionals.
 *
 * Serializes to `nullptr` if empty, otherwise serializes the dereferenced object.
 */
template <typename T>
requires (dereferenceable<T> && !container<T> && !string_like<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& dereferenceable) const
	{
		if (dereferenceable)
			return serialization::full(*dereferenceable);
		return nullptr;
	}
	value typed_summary(const T& dereferenceable) const
	{
		if (dereferenceable)
			return decorate_with_typeid(serialization::typed_summary(*dereferenceable), type_name::pretty<T>());
		return decorate_with_typeid(nullptr, type_name::pretty<T>());
	}
};

/**
 * @brief Specialization for iterable types (std::vector, std::set, ...).
 */
template <typename T> requires (container<T> && !string_like<T> && !value_alternative<T>)
struct serializer<T>
{
	value full(const T& container) const
	{
		array arr;
		for (const auto& item : container)
			arr.v.push_back(serialization::full(item));
		return arr;
	}
	value typed_summary(const T& container) const
	{
		array arr;
		for (const auto& item : container)
			arr.v.push_back(serialization::typed_summary(item));
		return decorate_with_typeid(arr, type_name::pretty<T>());
	}
};

/**
 * @brief Specialization for std::variant. Serializes the currently held alternative.
 */
template<typename... Ts>
struct serializer<std::variant<Ts...>>
{
	value full(const std::variant<Ts...>& variant) const
	{
		return std::visit([](const auto& value) { return serialization::full(value); }, variant);
	}
	value typed_summary(const std::variant<Ts...>& variant) const
	{
		return std::visit([](const auto& value) { return serialization::typed_summary(value); }, variant);
	}
};

} // namespace serialization

} // namespace folio

#endif // FOLIO_SERIALIZATION_BASE_H
