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

#ifndef FOLIO_MAKE_ERROR_H
#define FOLIO_MAKE_ERROR_H

#include "diagnostic_context.h"
#include "error.h" // IWYU pragma: keep
#include <tuple> // IWYU pragma: keep
#include <type_traits> // IWYU pragma: keep

#define FOLIO_MAKE_ERROR_AT_LOCATION(explicit_location, ...) \
	[&](const auto& location) { \
		auto context_tuple = std::make_tuple(FOLIO_DIAGNOSTIC_CONTEXT_MAKE_TUPLE(__VA_ARGS__)); \
		return std::apply([&](auto&&... args) { \
			return folio::errors::impl<std::remove_cvref_t<decltype(args)>...>(context_tuple, location); \
		}, context_tuple); \
	}(explicit_location)

#define FOLIO_MAKE_ERROR(...) \
	FOLIO_MAKE_ERROR_AT_LOCATION(folio::source_location::current() __VA_OPT__(,) __VA_ARGS__)

#define FOLIO_MAKE_ERROR_PTR(...) \
	std::make_exception_ptr(FOLIO_MAKE_ERROR(__VA_ARGS__))

#ifdef FOLIO_ENABLE_SHORT_MACRO_NAMES
#define make_error FOLIO_MAKE_ERROR
#define make_error_ptr FOLIO_MAKE_ERROR_PTR
#endif

#endif // FOLIO_MAKE_ERROR_H
