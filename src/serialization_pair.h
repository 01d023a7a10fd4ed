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

#ifndef FOLIO_SERIALIZATION_PAIR_H
#define FOLIO_SERIALIZATION_PAIR_H

#include "serialization_base.h"
#include <string>
#include <utility>

namespace folio::serialization
{

/**
 * @brief Named context items (variable name, value) serialize to a single-key object.
 */
template <typename T>
struct serializer<std::pair<std::string, T>>
{
	value full(const std::pair<std::string, T>& pair) const
	{
		return object{{{pair.first, serialization::full(pair.second)}}};
	}

	value typed_summary(const std::pair<std::string, T>& pair) const
	{
		return object{{{pair.first, serialization::typed_summary(pair.second)}}};
	}
};

} // namespace folio::serialization

#endif // FOLIO_SERIALIZATION_PAIR_H
