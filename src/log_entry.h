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

#ifndef FOLIO_LOG_ENTRY_H
#define FOLIO_LOG_ENTRY_H

#include "diagnostic_context.h"
#include "log_core.h"
#include "log_tags.h"
#include "serialization_pair.h" // IWYU pragma: keep
#include <tuple>
#include <vector>

namespace folio::log
{

namespace detail
{

template <typename T>
constexpr bool is_persistent_tag()
{
	return std::is_same_v<std::remove_cvref_t<T>, audit>;
}

/**
 * @brief True if any of the entry items makes it survive release builds.
 */
template <typename... Ts>
constexpr bool should_log_in_release()
{
	return (is_persistent_tag<Ts>() || ...);
}

template <typename T>
void append_tag(std::vector<std::string_view>& tags)
{
	if constexpr (context_tag<std::remove_cvref_t<T>>)
		tags.push_back(std::remove_cvref_t<T>::string());
}

template <typename T>
serialization::value serialize_item(const T& item)
{
	if constexpr (context_tag<T>)
		return std::string{T::string()};
	else
		return serialization::full(item);
}

} // namespace detail

/**
 * @brief Writes a log entry if the filter enables it for the location or any of the entry tags.
 */
template <typename... Args>
void entry(source_location location, const std::tuple<Args...>& args)
{
	std::vector<std::string_view> tags;
	(detail::append_tag<Args>(tags), ...);
	if (!detail::is_enabled(location, tags))
		return;
	serialization::array context;
	std::apply([&](const auto&... items) { (context.v.push_back(detail::serialize_item(items)), ...); }, args);
	record{location, std::move(context)};
}

} // namespace folio::log

#define FOLIO_LOG_GET_TYPES(...) FOLIO_DIAGNOSTIC_CONTEXT_GET_TYPES(__VA_ARGS__)

#ifdef NDEBUG
	#define FOLIO_LOG_ENTRY(...) \
		do { \
			if constexpr (folio::log::detail::should_log_in_release<FOLIO_LOG_GET_TYPES(__VA_ARGS__)>()) { \
				if (folio::log::detail::is_logging_enabled()) \
					folio::log::entry(folio::source_location::current(), std::make_tuple(FOLIO_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
			} \
		} while (false)
#else
	#define FOLIO_LOG_ENTRY(...) \
		do { \
			if (folio::log::detail::is_logging_enabled()) \
				folio::log::entry(folio::source_location::current(), std::make_tuple(FOLIO_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
		} while (false)
#endif

#ifdef FOLIO_ENABLE_SHORT_MACRO_NAMES
	#define log_entry(...) FOLIO_LOG_ENTRY(__VA_ARGS__)
#endif

#endif // FOLIO_LOG_ENTRY_H
