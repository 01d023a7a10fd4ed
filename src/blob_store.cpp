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

#include "blob_store.h"

#include <algorithm>

namespace folio
{

std::vector<std::byte> to_bytes(std::string_view text)
{
	std::vector<std::byte> data(text.size());
	std::transform(text.begin(), text.end(), data.begin(), [](char c) { return static_cast<std::byte>(c); });
	return data;
}

std::string to_string(const std::vector<std::byte>& data)
{
	return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

} // namespace folio
