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

#ifndef FOLIO_TYPE_NAME_H
#define FOLIO_TYPE_NAME_H

#include "core_export.h"
#include <string>
#include <typeindex>
#include <vector>

namespace folio::type_name
{

FOLIO_CORE_EXPORT std::string from_type_index(std::type_index t);

template<typename T>
struct pretty_impl {
	std::string operator()() const {
		return from_type_index(typeid(T));
	}
};

template<typename T>
std::string pretty();

template<>
struct pretty_impl<std::string> {
	std::string operator()() const { return "std::string"; }
};

template<typename T>
struct pretty_impl<std::vector<T>> {
	std::string operator()() const { return "std::vector<" + pretty<T>() + ">"; }
};

template<typename T>
inline std::string pretty() { return pretty_impl<T>{}(); }

/**
 * @brief Normalizes a compiler provided function signature (e.g. from source_location) for logs.
 */
FOLIO_CORE_EXPORT std::string pretty_function(const std::string& function_name);

} // namespace folio::type_name

#endif // FOLIO_TYPE_NAME_H
