// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Logger.hxx"

#include <fmt/format.h>

#include <iterator>

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= log_level;
}

static void
WriteLine(std::string_view domain, std::string_view msg) noexcept
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", msg);
	else
		fmt::print(stderr, "{}: {}\n", domain, msg);
}

void
LogString(unsigned level, std::string_view domain,
	  std::string_view msg) noexcept
{
	if (CheckLogLevel(level))
		WriteLine(domain, msg);
}

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	WriteLine(domain, {buffer.data(), buffer.size()});
}

static void
AppendMessage(std::string &dest, const std::exception &e) noexcept
{
	if (!dest.empty())
		dest += ": ";
	dest += e.what();

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		AppendMessage(dest, nested);
	} catch (...) {
		dest += ": Unrecognized nested exception";
	}
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		std::string result;
		AppendMessage(result, e);
		return result;
	} catch (...) {
		return "Unrecognized exception";
	}
}

void
LogException(unsigned level, std::string_view domain,
	     std::string_view prefix, std::exception_ptr ep) noexcept
{
	if (!CheckLogLevel(level))
		return;

	const auto msg = GetFullMessage(ep);
	if (prefix.empty())
		WriteLine(domain, msg);
	else
		WriteLine(domain, fmt::format("{}: {}", prefix, msg));
}
