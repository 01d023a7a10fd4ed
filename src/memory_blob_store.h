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

#ifndef FOLIO_MEMORY_BLOB_STORE_H
#define FOLIO_MEMORY_BLOB_STORE_H

#include "blob_store.h"
#include <map>
#include <mutex>
#include <utility>

namespace folio
{

/**
 * @brief Blob store keeping objects in memory, for tests and embedding.
 */
class FOLIO_CORE_EXPORT memory_blob_store : public blob_store
{
public:
	struct object
	{
		std::vector<std::byte> data;
		std::string content_type;
	};

	std::vector<std::byte> get(const std::string& bucket, const std::string& key, std::optional<byte_range> range = std::nullopt) const override;
	void put(const std::string& bucket, const std::string& key, const std::vector<std::byte>& data, const std::string& content_type) override;

	std::optional<object> find(const std::string& bucket, const std::string& key) const;
	std::size_t size() const;

private:
	mutable std::mutex m_mutex;
	std::map<std::pair<std::string, std::string>, object> m_objects;
};

} // namespace folio

#endif // FOLIO_MEMORY_BLOB_STORE_H
