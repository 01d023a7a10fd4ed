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

#include "filesystem_blob_store.h"

#include <algorithm>
#include "error_tags.h"
#include <fstream>
#include <iterator>
#include "log_entry.h"
#include "throw_if.h"

namespace folio
{

namespace
{

bool is_contained(const std::filesystem::path& relative)
{
	std::filesystem::path normal = relative.lexically_normal();
	return !relative.empty() && !normal.is_absolute() && !normal.has_root_name() &&
		(normal.empty() || *normal.begin() != "..") && normal != ".";
}

std::filesystem::path content_type_path(std::filesystem::path object)
{
	object += ".content-type";
	return object;
}

void write_file(const std::filesystem::path& path, const char* data, std::size_t size)
{
	std::ofstream stream(path, std::ios::binary | std::ios::trunc);
	throw_if(!stream, "cannot open file for writing", path.string(), errors::storage_failure{});
	stream.write(data, static_cast<std::streamsize>(size));
	stream.close();
	throw_if(!stream, "write failed", path.string(), errors::storage_failure{});
}

} // anonymous namespace

filesystem_blob_store::filesystem_blob_store(std::filesystem::path root)
	: m_root(std::move(root))
{}

std::filesystem::path filesystem_blob_store::object_path(const std::string& bucket, const std::string& key) const
{
	throw_if(!is_contained(bucket) || std::filesystem::path{bucket}.lexically_normal().has_parent_path(),
		"invalid bucket name", bucket, errors::storage_failure{});
	throw_if(!is_contained(key), "invalid object key", key, errors::storage_failure{});
	return (m_root / bucket / key).lexically_normal();
}

std::vector<std::byte> filesystem_blob_store::get(const std::string& bucket, const std::string& key, std::optional<byte_range> range) const
{
	std::filesystem::path path = object_path(bucket, key);
	try
	{
		std::ifstream stream(path, std::ios::binary);
		throw_if(!stream, "cannot open object", path.string(), errors::storage_failure{});
		std::uintmax_t file_size = std::filesystem::file_size(path);
		std::size_t offset = range ? std::min<std::uintmax_t>(range->offset, file_size) : 0;
		std::size_t length = range ? std::min<std::uintmax_t>(range->length, file_size - offset) : file_size;
		std::vector<std::byte> data(length);
		stream.seekg(static_cast<std::streamoff>(offset));
		stream.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
		throw_if(stream.gcount() != static_cast<std::streamsize>(length), "short read", path.string(), errors::storage_failure{});
		return data;
	}
	catch (const std::filesystem::filesystem_error&)
	{
		std::throw_with_nested(make_error("cannot read object", bucket, key, errors::storage_failure{}));
	}
}

void filesystem_blob_store::put(const std::string& bucket, const std::string& key, const std::vector<std::byte>& data, const std::string& content_type)
{
	std::filesystem::path path = object_path(bucket, key);
	try
	{
		std::filesystem::create_directories(path.parent_path());
		write_file(path, reinterpret_cast<const char*>(data.data()), data.size());
		write_file(content_type_path(path), content_type.data(), content_type.size());
		log_entry(path.string(), data.size(), content_type);
	}
	catch (const std::filesystem::filesystem_error&)
	{
		std::throw_with_nested(make_error("cannot write object", bucket, key, errors::storage_failure{}));
	}
}

std::optional<std::string> filesystem_blob_store::content_type(const std::string& bucket, const std::string& key) const
{
	std::ifstream stream(content_type_path(object_path(bucket, key)), std::ios::binary);
	if (!stream)
		return std::nullopt;
	return std::string{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
}

} // namespace folio
