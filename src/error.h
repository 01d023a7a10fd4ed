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

#ifndef FOLIO_ERROR_H
#define FOLIO_ERROR_H

#include "core_export.h"
#include "diagnostic_context.h" // IWYU pragma: keep
#include <exception>
#include "source_location.h"
#include "stringification.h"
#include <tuple>
#include <typeinfo>
#include <utility>

/**
 * @brief Reporting and handling errors with context data using nested exceptions.
 */
namespace folio::errors
{

/**
 * @brief Base class for all exceptions thrown by the library.
 *
 * Holds the source location of the throw and gives access to any number of context items
 * (messages, name-value pairs, tags) attached when the error was created.
 *
 * what() returns the exception type only. Context may contain document content, so it is
 * formatted on request by errors::diagnostic_message.
 *
 * @code
 * try {
 *   folio::conversion::run_job(store, job);
 * } catch (const std::exception& e) {
 *   std::cerr << errors::diagnostic_message(e) << std::endl;
 * }
 * @endcode
 *
 * @see errors::impl
 * @see FOLIO_MAKE_ERROR
 */
struct FOLIO_CORE_EXPORT base : public std::exception
{
	/// @brief The source location where the exception was created.
	source_location location;

	base(const source_location& location = source_location::current());

	/// @brief Type of the context item at the given index.
	virtual std::type_info const& context_type(size_t index) const noexcept = 0;

	/// @brief String representation of the context item at the given index.
	virtual std::string context_string(size_t index) const = 0;

	virtual size_t context_count() const noexcept = 0;

	/// @brief Returns the exception type name, never the context.
	const char* what() const noexcept override;
};

/**
 * @brief Error carrying a tuple of context items of arbitrary types.
 *
 * Use the FOLIO_MAKE_ERROR macro (make_error) instead of constructing it directly.
 */
template <typename... T>
struct impl : public base
{
private:
	template<size_t I>
	std::string context_string_impl() const
	{
		return stringify(std::get<I>(context));
	}

	template<size_t I>
	const std::type_info& context_type_impl() const noexcept
	{
		return typeid(std::get<I>(context));
	}

	template <size_t... Is>
	std::string context_string_at(size_t index, std::index_sequence<Is...>) const
	{
		using FuncType = std::string(impl::*)() const;
		static constexpr FuncType funcs[] = { &impl::template context_string_impl<Is>... };
		return (this->*funcs[index])();
	}

	template <size_t... Is>
	const std::type_info& context_type_at(size_t index, std::index_sequence<Is...>) const noexcept
	{
		using FuncType = const std::type_info&(impl::*)() const noexcept;
		static constexpr FuncType funcs[] = { &impl::template context_type_impl<Is>... };
		return (this->*funcs[index])();
	}

public:
	std::tuple<T...> context;

	explicit impl(const std::tuple<T...>& context_tuple, const source_location& location = source_location::current())
		: base(location), context(context_tuple)
	{
	}

	std::type_info const& context_type(size_t index) const noexcept override
	{
		return context_type_at(index, std::make_index_sequence<sizeof...(T)>{});
	}

	std::string context_string(size_t index) const override
	{
		return context_string_at(index, std::make_index_sequence<sizeof...(T)>{});
	}

	size_t context_count() const noexcept override
	{
		return sizeof...(T);
	}
};

} // namespace folio::errors

#endif // FOLIO_ERROR_H
