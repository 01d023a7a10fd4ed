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

#ifndef FOLIO_SERIALIZATION_BLOCK_H
#define FOLIO_SERIALIZATION_BLOCK_H

#include "block.h"
#include "serialization_base.h"
#include "serialization_enum.h" // IWYU pragma: keep

namespace folio::serialization
{

template <> struct serializer<Run>
{
	value full(const Run& run) const
	{
		return object{{
			{"text", run.text},
			{"marks", serialization::full(run.marks)}
		}};
	}
	value typed_summary(const Run& run) const { return decorate_with_typeid(full(run), type_name::pretty<Run>()); }
};

template <> struct serializer<block::Heading>
{
	value full(const block::Heading& heading) const
	{
		return object{{
			{"level", serialization::full(heading.level)},
			{"text", heading.text},
			{"runs", serialization::full(heading.runs)}
		}};
	}
	value typed_summary(const block::Heading& heading) const { return decorate_with_typeid(full(heading), type_name::pretty<block::Heading>()); }
};

template <> struct serializer<block::Paragraph>
{
	value full(const block::Paragraph& paragraph) const
	{
		return object{{
			{"text", paragraph.text},
			{"runs", serialization::full(paragraph.runs)}
		}};
	}
	value typed_summary(const block::Paragraph& paragraph) const { return decorate_with_typeid(full(paragraph), type_name::pretty<block::Paragraph>()); }
};

template <> struct serializer<block::Table>
{
	value full(const block::Table& table) const
	{
		return object{{{"rows", serialization::full(table.rows)}}};
	}
	value typed_summary(const block::Table& table) const { return decorate_with_typeid(full(table), type_name::pretty<block::Table>()); }
};

template <> struct serializer<block::ListItem>
{
	value full(const block::ListItem& item) const
	{
		return object{{
			{"text", item.text},
			{"runs", serialization::full(item.runs)}
		}};
	}
	value typed_summary(const block::ListItem& item) const { return decorate_with_typeid(full(item), type_name::pretty<block::ListItem>()); }
};

/**
 * @brief Lists serialize to their items, the list kind is visible in the typeid of typed_summary.
 */
template <typename T> requires std::same_as<T, block::BulletList> || std::same_as<T, block::OrderedList>
struct serializer<T>
{
	value full(const T& list) const
	{
		return object{{{"items", serialization::full(list.items)}}};
	}
	value typed_summary(const T& list) const { return decorate_with_typeid(full(list), type_name::pretty<T>()); }
};

template <> struct serializer<Page>
{
	value full(const Page& page) const
	{
		return object{{
			{"number", serialization::full(page.number)},
			{"blocks", serialization::typed_summary(page.blocks)}
		}};
	}
	value typed_summary(const Page& page) const { return decorate_with_typeid(full(page), type_name::pretty<Page>()); }
};

} // namespace folio::serialization

#endif // FOLIO_SERIALIZATION_BLOCK_H
