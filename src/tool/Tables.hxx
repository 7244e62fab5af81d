// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

namespace CharEscape { class Escaper; }

/**
 * Look up one of the built-in escapers by name.  Returns nullptr if
 * there is no such table.
 */
[[gnu::pure]]
const CharEscape::Escaper *
FindBuiltinTable(const char *name) noexcept;
