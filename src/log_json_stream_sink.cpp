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

#include "log_json_stream_sink.h"

#include "json_serialization.h"
#include <mutex>

namespace folio::log
{

namespace
{

// Closes the JSON array when the last copy of the sink goes away.
struct stream_state
{
	std::shared_ptr<std::ostream> m_owned_stream;
	std::ostream& m_stream;
	bool m_first_log = true;
	std::mutex m_mutex;

	stream_state(std::ostream& s, std::shared_ptr<std::ostream> owned)
		: m_owned_stream(std::move(owned)), m_stream(s)
	{}

	~stream_state()
	{
		std::lock_guard lock(m_mutex);
		if (!m_first_log)
			m_stream << std::endl << "]" << std::endl;
	}
};

std::function<void(const record&)> make_sink(std::shared_ptr<stream_state> state)
{
	return [state](const record& rec)
	{
		serialization::object log_record_object = create_base_metadata(rec.m_location);
		log_record_object.v["log"] = rec.m_context;
		std::string json_output = serialization::to_json(log_record_object);

		std::lock_guard lock(state->m_mutex);
		state->m_stream << (state->m_first_log ? "[" : ",") << std::endl << json_output;
		state->m_first_log = false;
	};
}

} // anonymous namespace

std::function<void(const record&)> json_stream_sink(std::ostream& stream)
{
	return make_sink(std::make_shared<stream_state>(stream, nullptr));
}

std::function<void(const record&)> json_stream_sink(std::shared_ptr<std::ostream> stream)
{
	std::ostream& stream_ref = *stream;
	return make_sink(std::make_shared<stream_state>(stream_ref, std::move(stream)));
}

} // namespace folio::log
