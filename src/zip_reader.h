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

#ifndef FOLIO_ZIP_READER_H
#define FOLIO_ZIP_READER_H

#include "core_export.h"
#include <cstddef>
#include <limits>
#include <optional>
#include "pimpl.h"
#include <span>
#include <string>

namespace folio
{

/**
 * @brief Read-only access to the entries of a ZIP archive held in memory, using libzip.
 *
 * The archive bytes are not copied and must outlive the reader. Entries declaring an uncompressed
 * size above `max_entry_size` are refused before anything is allocated for them.
 */
class FOLIO_CORE_EXPORT zip_reader : public with_pimpl<zip_reader>
{
public:
	/// @throws errors::base tagged errors::uninterpretable_data if the bytes are not a ZIP archive
	explicit zip_reader(std::span<const std::byte> archive, std::size_t max_entry_size = std::numeric_limits<int>::max());
	zip_reader(zip_reader&&) noexcept;
	~zip_reader();

	bool contains(const std::string& entry_name) const;

	/// @throws errors::base tagged errors::uninterpretable_data if the entry is missing, damaged or too large
	std::string read(const std::string& entry_name) const;

	std::optional<std::string> read_if_exists(const std::string& entry_name) const;
};

} // namespace folio

#endif // FOLIO_ZIP_READER_H
