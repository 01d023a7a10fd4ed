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

#include "environment.h"

#include <cstdlib>

std::optional<std::string> folio::environment::get(std::string_view name)
{
	// std::getenv needs a null-terminated name
	const std::string name_str(name);
	const char* value = std::getenv(name_str.c_str());
	if (value)
		return std::string(value);
	return std::nullopt;
}

std::string folio::environment::get_or(std::string_view name, std::string_view fallback)
{
	std::optional<std::string> value = get(name);
	if (!value || value->empty())
		return std::string{fallback};
	return *value;
}
