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

#ifndef FOLIO_STRINGIFICATION_H
#define FOLIO_STRINGIFICATION_H

#include "json_serialization.h"
#include "serialization_pair.h" // IWYU pragma: keep
#include <string>

namespace folio
{

/**
 * @brief Converts any serializable value to a human readable string.
 *
 * String-like values are returned as they are, everything else is serialized to JSON.
 * Used to present error context items and failed `ensure` checks.
 */
template <typename T>
std::string stringify(const T& value)
{
	if constexpr (requires { { T::string() } -> std::convertible_to<std::string_view>; })
		return std::string{T::string()};
	else if constexpr (string_like<T>)
	{
		if constexpr (std::is_pointer_v<std::decay_t<T>>)
			return value ? std::string{value} : std::string{"null"};
		else
			return std::string{value};
	}
	else
		return serialization::to_json(serialization::full(value));
}

} // namespace folio

#endif // FOLIO_STRINGIFICATION_H
