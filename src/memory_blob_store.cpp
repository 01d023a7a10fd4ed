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

#include "memory_blob_store.h"

#include <algorithm>
#include "error_tags.h"
#include "throw_if.h"

namespace folio
{

std::vector<std::byte> memory_blob_store::get(const std::string& bucket, const std::string& key, std::optional<byte_range> range) const
{
	std::lock_guard lock(m_mutex);
	auto it = m_objects.find({bucket, key});
	throw_if(it == m_objects.end(), "object not found", bucket, key, errors::storage_failure{});
	const std::vector<std::byte>& data = it->second.data;
	if (!range)
		return data;
	std::size_t begin = std::min(range->offset, data.size());
	std::size_t end = begin + std::min(range->length, data.size() - begin);
	return std::vector<std::byte>(data.begin() + begin, data.begin() + end);
}

void memory_blob_store::put(const std::string& bucket, const std::string& key, const std::vector<std::byte>& data, const std::string& content_type)
{
	std::lock_guard lock(m_mutex);
	m_objects[{bucket, key}] = object{data, content_type};
}

std::optional<memory_blob_store::object> memory_blob_store::find(const std::string& bucket, const std::string& key) const
{
	std::lock_guard lock(m_mutex);
	auto it = m_objects.find({bucket, key});
	if (it == m_objects.end())
		return std::nullopt;
	return it->second;
}

std::size_t memory_blob_store::size() const
{
	std::lock_guard lock(m_mutex);
	return m_objects.size();
}

} // namespace folio
