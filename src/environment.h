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

#ifndef FOLIO_ENVIRONMENT_H
#define FOLIO_ENVIRONMENT_H

#include "core_export.h"
#include <optional>
#include <string>
#include <string_view>

namespace folio::environment
{
	FOLIO_CORE_EXPORT std::optional<std::string> get(std::string_view name);

	/// @brief Value of the variable, or the fallback when it is unset or empty.
	FOLIO_CORE_EXPORT std::string get_or(std::string_view name, std::string_view fallback);
}

#endif // FOLIO_ENVIRONMENT_H
