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

#ifndef FOLIO_CONCEPTS_H
#define FOLIO_CONCEPTS_H

#include <concepts>
#include <iterator>
#include <string_view>
#include <type_traits>
#include <variant>

namespace folio
{

/**
 * @brief Concept for string-like types that can be converted to a string view.
 */
template<typename T>
concept string_like = std::is_convertible_v<T, std::string_view>;

/**
 * @brief Concept to detect if a type is a container (iterable and not self-recursive).
 */
template<typename T>
concept container = requires(const T& t) {
	{ std::begin(t) } -> std::input_iterator;
	{ std::end(t) } -> std::input_iterator;
	requires !std::is_same_v<std::remove_cvref_t<T>, std::remove_cvref_t<typename std::iterator_traits<decltype(std::begin(t))>::value_type>>;
};

/**
 * @brief Concept to detect if a type is dereferenceable like a pointer.
 */
template<typename T>
concept dereferenceable = requires(const T& t) { *t; !t; };

/**
 * @brief Concept for empty structs (tags).
 */
template<typename T>
concept empty = std::is_empty_v<T>;

template <typename T, typename Variant>
struct is_variant_alternative_trait : std::false_type {};

template <typename T, typename... Us>
struct is_variant_alternative_trait<T, std::variant<Us...>> : std::bool_constant<(std::is_same_v<T, Us> || ...)> {};

template <typename T, typename Variant>
concept variant_alternative = is_variant_alternative_trait<T, Variant>::value;

} // namespace folio

#endif // FOLIO_CONCEPTS_H
