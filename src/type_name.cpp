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

#include "type_name.h"

#include <boost/algorithm/string.hpp>
#include <boost/core/demangle.hpp>

namespace folio::type_name
{

namespace
{

std::string normalize_name(const std::string& name)
{
	std::string normalized = name;
	boost::algorithm::erase_all(normalized, "class ");
	boost::algorithm::erase_all(normalized, "struct ");
	boost::algorithm::replace_all(normalized, "::__cxx11", ""); // libstdc++ ABI tag
	boost::algorithm::replace_all(normalized, "std::__1::", "std::"); // libc++ inline namespace
	boost::algorithm::replace_all(normalized, "(void)", "()");
	boost::algorithm::replace_all(normalized, ", ", ",");
	boost::algorithm::replace_all(normalized, " >", ">");
	return normalized;
}

} // anonymous namespace

std::string from_type_index(std::type_index t)
{
	return normalize_name(boost::core::demangle(t.name()));
}

std::string pretty_function(const std::string& function_name)
{
	return normalize_name(function_name);
}

} // namespace folio::type_name
