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

#include "charset_converter.h"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <iconv.h>
#include "error_tags.h"
#include "throw_if.h"

namespace folio
{

template<>
struct pimpl_impl<charset_converter> : pimpl_impl_base
{
	struct iconv_descriptor
	{
		iconv_t descriptor;

		// glibc iconv_open races on its gconv module cache
		static std::mutex iconv_open_mutex;

		iconv_descriptor(const std::string& from, const std::string& to)
		{
			std::lock_guard<std::mutex> lock(iconv_open_mutex);
			descriptor = iconv_open(to.c_str(), from.c_str());
			throw_if(descriptor == (iconv_t)(-1), "iconv_open() failed", strerror(errno), from, to, errors::program_logic{});
		}

		~iconv_descriptor()
		{
			if (descriptor != (iconv_t)(-1))
				iconv_close(descriptor);
		}

		iconv_descriptor(const iconv_descriptor&) = delete;
		iconv_descriptor& operator=(const iconv_descriptor&) = delete;
		iconv_descriptor(iconv_descriptor&&) = delete;
		iconv_descriptor& operator=(iconv_descriptor&&) = delete;
	};

	pimpl_impl(const std::string& from, const std::string& to)
		: m_descriptor(from, to)
	{}

	iconv_descriptor m_descriptor;
};

std::mutex pimpl_impl<charset_converter>::iconv_descriptor::iconv_open_mutex;

charset_converter::charset_converter(const std::string &from, const std::string &to)
	: with_pimpl<charset_converter>(from, to)
{
}

charset_converter::~charset_converter() = default;

std::string charset_converter::convert(std::string_view input) const
{
	if (input.empty())
		return "";

	const char* inptr = input.data();
	size_t inbytesleft = input.length();

	iconv_t descriptor = impl().m_descriptor.descriptor;
	iconv(descriptor, nullptr, nullptr, nullptr, nullptr);

	size_t output_size = input.length() * 2;
	std::string output(output_size, '\0');
	size_t total_written = 0;

	while (inbytesleft > 0)
	{
		char* outptr = output.data() + total_written;
		size_t outbytesleft = output.size() - total_written;

		size_t result = iconv(descriptor, const_cast<char**>(&inptr), &inbytesleft, &outptr, &outbytesleft);
		total_written = output.size() - outbytesleft;

		if (result == (size_t)-1)
		{
			if (errno == E2BIG)
				output.resize(output.size() * 2);
			else
				throw make_error("iconv() failed", strerror(errno), errors::uninterpretable_data{});
		}
	}
	output.resize(total_written);
	return output;
}

} // namespace folio
