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

#include "zip_reader.h"

#include "error_tags.h"
#include "throw_if.h"
#include <zip.h>

namespace folio
{

template<>
struct pimpl_impl<zip_reader> : pimpl_impl_base
{
	zip_t* m_archive = nullptr;
	std::size_t m_max_entry_size;

	pimpl_impl(std::span<const std::byte> archive, std::size_t max_entry_size)
		: m_max_entry_size(max_entry_size)
	{
		zip_error_t error;
		zip_error_init(&error);
		zip_source_t* source = zip_source_buffer_create(archive.data(), archive.size(), 0, &error);
		if (!source)
		{
			std::string message = zip_error_strerror(&error);
			zip_error_fini(&error);
			throw make_error("zip_source_buffer_create() failed", message, errors::uninterpretable_data{});
		}
		m_archive = zip_open_from_source(source, ZIP_RDONLY, &error);
		if (!m_archive)
		{
			zip_source_free(source);
			std::string message = zip_error_strerror(&error);
			zip_error_fini(&error);
			throw make_error("zip_open_from_source() failed", message, errors::uninterpretable_data{});
		}
		zip_error_fini(&error);
	}

	~pimpl_impl()
	{
		if (m_archive)
			zip_discard(m_archive);
	}

	pimpl_impl(const pimpl_impl&) = delete;
	pimpl_impl& operator=(const pimpl_impl&) = delete;
};

zip_reader::zip_reader(std::span<const std::byte> archive, std::size_t max_entry_size)
	: with_pimpl<zip_reader>(archive, max_entry_size)
{}

zip_reader::zip_reader(zip_reader&&) noexcept = default;

zip_reader::~zip_reader() = default;

bool zip_reader::contains(const std::string& entry_name) const
{
	return zip_name_locate(impl().m_archive, entry_name.c_str(), 0) >= 0;
}

std::string zip_reader::read(const std::string& entry_name) const
{
	zip_t* archive = impl().m_archive;
	zip_stat_t entry_stat;
	zip_stat_init(&entry_stat);
	throw_if(zip_stat(archive, entry_name.c_str(), 0, &entry_stat) != 0, "entry not found", entry_name, errors::uninterpretable_data{});
	throw_if(!(entry_stat.valid & ZIP_STAT_SIZE), "entry size unknown", entry_name, errors::uninterpretable_data{});
	throw_if(entry_stat.size > impl().m_max_entry_size, "entry too large", entry_name, entry_stat.size, impl().m_max_entry_size, errors::uninterpretable_data{});

	zip_file_t* file = zip_fopen(archive, entry_name.c_str(), 0);
	throw_if(!file, "zip_fopen() failed", entry_name, zip_strerror(archive), errors::uninterpretable_data{});
	std::string contents(entry_stat.size, '\0');
	zip_int64_t bytes_read = zip_fread(file, contents.data(), entry_stat.size);
	zip_fclose(file);
	throw_if(bytes_read != static_cast<zip_int64_t>(entry_stat.size), "entry truncated", entry_name, bytes_read, errors::uninterpretable_data{});
	return contents;
}

std::optional<std::string> zip_reader::read_if_exists(const std::string& entry_name) const
{
	if (!contains(entry_name))
		return std::nullopt;
	return read(entry_name);
}

} // namespace folio
