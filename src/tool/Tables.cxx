// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Tables.hxx"
#include "char-escape/Table.hxx"

#include <string.h>

static constexpr struct {
	const char *name;
	const CharEscape::Escaper *escaper;
} builtin_tables[] = {
	{"c", &CharEscape::c_style_escaper},
	{"whitespace", &CharEscape::whitespace_escaper},
};

const CharEscape::Escaper *
FindBuiltinTable(const char *name) noexcept
{
	for (const auto &i : builtin_tables)
		if (strcmp(i.name, name) == 0)
			return i.escaper;

	return nullptr;
}
