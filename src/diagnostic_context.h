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

#ifndef FOLIO_DIAGNOSTIC_CONTEXT_H
#define FOLIO_DIAGNOSTIC_CONTEXT_H

#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace folio
{

/**
 * @brief Empty type carrying a static name, passed through errors and log entries unnamed.
 */
template <typename T>
concept context_tag = std::is_empty_v<T> && requires { { T::string() } -> std::convertible_to<std::string_view>; };

namespace diagnostic_context
{

/**
 * @brief Creates a (variable name, value) context item.
 */
template<typename T>
auto make_context_item(const char* name, T&& v) -> std::pair<std::string, std::decay_t<T>>
{
	return {name, std::forward<T>(v)};
}

/**
 * @brief Tags are passed through without a name.
 */
template <context_tag T>
std::decay_t<T> make_context_item(const char*, T&& v)
{
	return std::forward<T>(v);
}

/**
 * @brief String literals are anonymous messages and are passed through without a name.
 */
template <size_t N>
const char* make_context_item(const char*, const char (&v)[N])
{
	return v;
}

} // namespace diagnostic_context

#define FOLIO_DIAGNOSTIC_CONTEXT_MAKE_TUPLE_ELEM(r, data, i, elem) \
	BOOST_PP_COMMA_IF(i) folio::diagnostic_context::make_context_item(BOOST_PP_STRINGIZE(elem), elem)

#define FOLIO_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(...) \
	__VA_OPT__(BOOST_PP_SEQ_FOR_EACH_I(FOLIO_DIAGNOSTIC_CONTEXT_MAKE_TUPLE_ELEM, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))

#define FOLIO_DIAGNOSTIC_CONTEXT_GET_TYPE_ELEM(r, data, i, elem) \
	BOOST_PP_COMMA_IF(i) decltype(folio::diagnostic_context::make_context_item(BOOST_PP_STRINGIZE(elem), elem))

#define FOLIO_DIAGNOSTIC_CONTEXT_GET_TYPES(...) \
	__VA_OPT__(BOOST_PP_SEQ_FOR_EACH_I(FOLIO_DIAGNOSTIC_CONTEXT_GET_TYPE_ELEM, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))

} // namespace folio

#endif // FOLIO_DIAGNOSTIC_CONTEXT_H
