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

#ifndef FOLIO_BLOB_STORE_H
#define FOLIO_BLOB_STORE_H

#include "core_export.h"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio
{

/// @brief Part of a blob to read: `length` bytes from `offset`, fewer at the end of the blob.
struct byte_range
{
	std::size_t offset = 0;
	std::size_t length = 0;
};

/**
 * @brief Object storage holding the input documents and receiving the conversion results.
 *
 * Objects are addressed by bucket and key. Failures are reported as errors tagged errors::storage_failure.
 */
class FOLIO_CORE_EXPORT blob_store
{
public:
	virtual ~blob_store() = default;

	virtual std::vector<std::byte> get(const std::string& bucket, const std::string& key, std::optional<byte_range> range = std::nullopt) const = 0;

	virtual void put(const std::string& bucket, const std::string& key, const std::vector<std::byte>& data, const std::string& content_type) = 0;
};

/// @brief Bytes of a UTF-8 string, for put().
FOLIO_CORE_EXPORT std::vector<std::byte> to_bytes(std::string_view text);

FOLIO_CORE_EXPORT std::string to_string(const std::vector<std::byte>& data);

} // namespace folio

#endif // FOLIO_BLOB_STORE_H
