// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Logging to stderr with numeric verbosity levels: 0 is reserved
 * for fatal errors, 1 is the default, higher levels are more
 * verbose.
 */

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>
#include <utility>

void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
bool
CheckLogLevel(unsigned level) noexcept;

void
LogString(unsigned level, std::string_view domain,
	  std::string_view msg) noexcept;

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	LogVFmt(level, domain, format_str, fmt::make_format_args(args...));
}

/**
 * Log the exception including all nested exceptions.
 */
void
LogException(unsigned level, std::string_view domain,
	     std::string_view prefix, std::exception_ptr ep) noexcept;

/**
 * Concatenate the messages of the exception and all its nested
 * exceptions, separated by ": ".
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;

/**
 * A logger with a fixed domain name.
 */
class Logger {
	const std::string domain;

public:
	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	void operator()(unsigned level, std::string_view msg) const noexcept {
		LogString(level, domain, msg);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		LogFmt(level, domain, format_str, std::forward<Args>(args)...);
	}

	void operator()(unsigned level, std::string_view prefix,
			std::exception_ptr ep) const noexcept {
		LogException(level, domain, prefix, ep);
	}
};
