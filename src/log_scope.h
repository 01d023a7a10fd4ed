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

#ifndef FOLIO_LOG_SCOPE_H
#define FOLIO_LOG_SCOPE_H

#include <boost/preprocessor/cat.hpp>
#include "log_entry.h"
#include <optional> // IWYU pragma: keep

namespace folio::log::detail
{

/**
 * @brief Logs the same context items on construction (scope_enter) and destruction (scope_exit).
 */
template <typename... Args>
class scope
{
public:
	scope(source_location location, std::tuple<Args...>&& args_tuple)
		: m_location(location), m_args_tuple(std::move(args_tuple))
	{
		folio::log::entry(m_location, std::tuple_cat(std::make_tuple(log::scope_enter{}), m_args_tuple));
	}

	~scope() noexcept
	{
		try
		{
			folio::log::entry(m_location, std::tuple_cat(std::make_tuple(log::scope_exit{}), m_args_tuple));
		}
		catch (const std::exception&)
		{
		}
	}

private:
	source_location m_location;
	std::tuple<Args...> m_args_tuple;
};

} // namespace folio::log::detail

#define FOLIO_LOG_SCOPE_MAKE(...) \
	[&](const auto& loc) { \
		if (folio::log::detail::is_logging_enabled()) \
			return std::optional<folio::log::detail::scope<FOLIO_LOG_GET_TYPES(__VA_ARGS__)>>(std::in_place, loc, std::make_tuple(FOLIO_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
		return std::optional<folio::log::detail::scope<FOLIO_LOG_GET_TYPES(__VA_ARGS__)>>{}; \
	}(folio::source_location::current())

#ifdef NDEBUG
	#define FOLIO_LOG_SCOPE(...) \
		[[maybe_unused]] auto BOOST_PP_CAT(folio_log_scope_object_at_line_, __LINE__) = \
			[&](const auto& loc) { \
				if constexpr (folio::log::detail::should_log_in_release<folio::log::scope_enter __VA_OPT__(,) FOLIO_LOG_GET_TYPES(__VA_ARGS__)>()) { \
					if (folio::log::detail::is_logging_enabled()) \
						return std::optional<folio::log::detail::scope<FOLIO_LOG_GET_TYPES(__VA_ARGS__)>>(std::in_place, loc, std::make_tuple(FOLIO_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__))); \
				} \
				return std::optional<folio::log::detail::scope<FOLIO_LOG_GET_TYPES(__VA_ARGS__)>>{}; \
			}(folio::source_location::current())
#else
	#define FOLIO_LOG_SCOPE(...) \
		[[maybe_unused]] auto BOOST_PP_CAT(folio_log_scope_object_at_line_, __LINE__) = FOLIO_LOG_SCOPE_MAKE(__VA_ARGS__)
#endif

#ifdef FOLIO_ENABLE_SHORT_MACRO_NAMES
	#define log_scope(...) FOLIO_LOG_SCOPE(__VA_ARGS__)
#endif

#endif // FOLIO_LOG_SCOPE_H
