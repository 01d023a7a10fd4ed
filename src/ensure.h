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

#ifndef FOLIO_ENSURE_H
#define FOLIO_ENSURE_H

#include <cassert>
#include <initializer_list>
#include <string_view>
#include "source_location.h"
#include "throw_if.h"

namespace folio
{

/**
 * @brief Fluent, exception-throwing check of a value.
 *
 * @code
 * folio::ensure(node_count) == 3;
 * folio::ensure(html).contains("<h1>Title</h1>");
 * @endcode
 *
 * A failed comparison throws an error carrying both values and the location of the check.
 * In debug builds the destructor asserts that a comparison was actually performed, which
 * catches `ensure(a == b);` written by mistake.
 */
template<typename T>
class [[nodiscard]] ensure
{
public:
	explicit ensure(const T& value, const source_location& loc = source_location::current())
		: m_value(value), m_location(loc)
	{}

	~ensure()
	{
		assert(m_comparison_performed && "folio::ensure() was called without a comparison operator.");
	}

	template<typename U>
	void operator==(const U& other) const
	{
		m_comparison_performed = true;
		FOLIO_THROW_IF_AT_LOCATION(!(m_value == other), m_location, m_value, other);
	}

	template<typename U>
	void operator!=(const U& other) const
	{
		m_comparison_performed = true;
		FOLIO_THROW_IF_AT_LOCATION(!(m_value != other), m_location, m_value, other);
	}

	template<typename U>
	void operator>(const U& other) const
	{
		m_comparison_performed = true;
		FOLIO_THROW_IF_AT_LOCATION(!(m_value > other), m_location, m_value, other);
	}

	template<typename U>
	void operator>=(const U& other) const
	{
		m_comparison_performed = true;
		FOLIO_THROW_IF_AT_LOCATION(!(m_value >= other), m_location, m_value, other);
	}

	template<typename U>
	void operator<(const U& other) const
	{
		m_comparison_performed = true;
		FOLIO_THROW_IF_AT_LOCATION(!(m_value < other), m_location, m_value, other);
	}

	template<typename U>
	void operator<=(const U& other) const
	{
		m_comparison_performed = true;
		FOLIO_THROW_IF_AT_LOCATION(!(m_value <= other), m_location, m_value, other);
	}

	/**
	 * @brief Checks that the held string-like value contains a substring.
	 */
	template<typename U>
	requires string_like<T> && string_like<U>
	void contains(const U& substring) const
	{
		m_comparison_performed = true;
		FOLIO_THROW_IF_AT_LOCATION(std::string_view(m_value).find(substring) == std::string_view::npos, m_location, m_value, substring);
	}

	/**
	 * @brief Checks that the held value is one of the given values.
	 */
	void is_one_of(std::initializer_list<T> expected_values) const
	{
		m_comparison_performed = true;
		for (const auto& expected : expected_values)
		{
			if (m_value == expected)
				return;
		}
		FOLIO_THROW_IF_AT_LOCATION(true, m_location, m_value, expected_values);
	}

private:
	const T& m_value;
	source_location m_location;
	mutable bool m_comparison_performed = false;
};

template<typename T>
ensure(const T&, const source_location&) -> ensure<T>;

} // namespace folio

#endif // FOLIO_ENSURE_H
