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

#ifndef FOLIO_PIMPL_H
#define FOLIO_PIMPL_H

#include <memory>
#include <utility>

namespace folio
{

/// @brief Base of every private implementation, gives them a common virtual destructor.
struct pimpl_impl_base
{
	virtual ~pimpl_impl_base() = default;
};

/// @brief Private implementation of T, specialized in the source file of T.
template <typename T>
struct pimpl_impl;

/**
 * @brief Base class hiding the implementation details of T behind a pointer.
 *
 * T derives from with_pimpl<T> and specializes pimpl_impl<T> in its source file.
 */
template <typename T>
class with_pimpl
{
protected:
	template <typename... Args>
	explicit with_pimpl(Args&&... args)
		: m_impl(std::make_unique<pimpl_impl<T>>(std::forward<Args>(args)...))
	{}

	with_pimpl(with_pimpl&&) noexcept = default;
	with_pimpl& operator=(with_pimpl&&) noexcept = default;
	~with_pimpl() = default;

	pimpl_impl<T>& impl() { return static_cast<pimpl_impl<T>&>(*m_impl); }
	const pimpl_impl<T>& impl() const { return static_cast<const pimpl_impl<T>&>(*m_impl); }

private:
	std::unique_ptr<pimpl_impl_base> m_impl;
};

} // namespace folio

#endif // FOLIO_PIMPL_H
