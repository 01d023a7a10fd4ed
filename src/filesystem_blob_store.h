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

#ifndef FOLIO_FILESYSTEM_BLOB_STORE_H
#define FOLIO_FILESYSTEM_BLOB_STORE_H

#include "blob_store.h"
#include <filesystem>

namespace folio
{

/**
 * @brief Blob store in a local directory: a bucket is a subdirectory of the root, a key a file path in it.
 *
 * The content type of an object is kept beside it in `<key>.content-type`.
 * Keys leaving the bucket directory are rejected.
 */
class FOLIO_CORE_EXPORT filesystem_blob_store : public blob_store
{
public:
	explicit filesystem_blob_store(std::filesystem::path root);

	std::vector<std::byte> get(const std::string& bucket, const std::string& key, std::optional<byte_range> range = std::nullopt) const override;
	void put(const std::string& bucket, const std::string& key, const std::vector<std::byte>& data, const std::string& content_type) override;

	/// @brief Content type stored with the object, if any.
	std::optional<std::string> content_type(const std::string& bucket, const std::string& key) const;

	/// @throws errors::base tagged errors::storage_failure for bucket names or keys leaving the root
	std::filesystem::path object_path(const std::string& bucket, const std::string& key) const;

private:
	std::filesystem::path m_root;
};

} // namespace folio

#endif // FOLIO_FILESYSTEM_BLOB_STORE_H
