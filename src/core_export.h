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

#ifndef FOLIO_CORE_EXPORT_H
#define FOLIO_CORE_EXPORT_H

#if defined(_WIN32)
	#if defined(folio_core_EXPORTS)
		#define FOLIO_CORE_EXPORT __declspec(dllexport)
	#else
		#define FOLIO_CORE_EXPORT __declspec(dllimport)
	#endif
#else
	#define FOLIO_CORE_EXPORT __attribute__((visibility("default")))
#endif

#endif // FOLIO_CORE_EXPORT_H
