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

#ifndef FOLIO_LOG_STATE_SAVER_H
#define FOLIO_LOG_STATE_SAVER_H

#include "log_core.h"

namespace folio::log
{

/**
 * @brief Restores the sink and filter active at construction when destroyed. Used by tests
 * that capture log output.
 */
class state_saver
{
public:
	state_saver()
		: m_old_sink(get_sink()), m_old_filter(get_filter())
	{}

	state_saver(const state_saver&) = delete;
	state_saver& operator=(const state_saver&) = delete;
	state_saver(state_saver&&) = delete;
	state_saver& operator=(state_saver&&) = delete;

	~state_saver()
	{
		set_sink(m_old_sink);
		set_filter(m_old_filter);
	}

private:
	std::function<void(const record&)> m_old_sink;
	std::string m_old_filter;
};

} // namespace folio::log

#endif // FOLIO_LOG_STATE_SAVER_H
