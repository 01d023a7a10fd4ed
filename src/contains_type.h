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

#ifndef FOLIO_CONTAINS_TYPE_H
#define FOLIO_CONTAINS_TYPE_H

#include "error.h"
#include <exception>

namespace folio::errors
{

/**
 * @brief Checks if any error in the nested exceptions chain carries a context item of type T.
 *
 * @code
 * catch (const std::exception& e) {
 *   if (errors::contains_type<errors::storage_failure>(e)) ...
 * }
 * @endcode
 */
template <typename T>
bool contains_type(const std::exception& e)
{
	if (const auto* error = dynamic_cast<const errors::base*>(&e))
	{
		for (size_t i = 0; i < error->context_count(); ++i)
		{
			if (error->context_type(i) == typeid(T))
				return true;
		}
	}
	try
	{
		std::rethrow_if_nested(e);
	}
	catch (const std::exception& nested)
	{
		return contains_type<T>(nested);
	}
	catch (...)
	{
		return false;
	}
	return false;
}

} // namespace folio::errors

#endif // FOLIO_CONTAINS_TYPE_H
