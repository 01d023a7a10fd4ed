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

#include "json_serialization.h"

#include <boost/json.hpp>

namespace folio::serialization
{

namespace
{

boost::json::value to_json_value(const value& s_val)
{
	return std::visit(
		[](const auto& arg) -> boost::json::value {
			using T = std::decay_t<decltype(arg)>;
			if constexpr (std::is_same_v<T, object>)
			{
				boost::json::object obj;
				for (const auto& [key, val] : arg.v)
					obj[key] = to_json_value(val);
				return obj;
			}
			else if constexpr (std::is_same_v<T, array>)
			{
				boost::json::array arr;
				arr.reserve(arg.v.size());
				for (const auto& val : arg.v)
					arr.push_back(to_json_value(val));
				return arr;
			}
			else
				return boost::json::value_from(arg);
		},
		s_val);
}

} // anonymous namespace

std::string to_json(const value& s_val)
{
	return boost::json::serialize(to_json_value(s_val));
}

} // namespace folio::serialization
