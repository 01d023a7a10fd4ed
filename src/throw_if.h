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

#ifndef FOLIO_THROW_IF_H
#define FOLIO_THROW_IF_H

#include "make_error.h"

#define FOLIO_THROW_IF_AT_LOCATION(condition, location, ...) \
	do { \
		if (condition) \
			throw FOLIO_MAKE_ERROR_AT_LOCATION(location, #condition __VA_OPT__(,) __VA_ARGS__); \
	} while (false)

#define FOLIO_THROW_IF(condition, ...) \
	FOLIO_THROW_IF_AT_LOCATION(condition, folio::source_location::current() __VA_OPT__(,) __VA_ARGS__)

#ifdef FOLIO_ENABLE_SHORT_MACRO_NAMES
#define throw_if FOLIO_THROW_IF
#endif

#endif // FOLIO_THROW_IF_H
