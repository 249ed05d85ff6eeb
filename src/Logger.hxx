// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

/**
 * Set the process-wide log verbosity.  Messages with a level above
 * this value are discarded.  The default is 1.
 */
void
SetLogLevel(unsigned verbose) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

/**
 * A named logger.  Invoke it with a level and any number of
 * arguments; they are concatenated and printed to stderr with the
 * logger name as prefix.
 */
class Logger {
	std::string_view name;

public:
	explicit constexpr Logger(std::string_view _name) noexcept
		:name(_name) {}

	static bool IsLogLevelVisible(unsigned level) noexcept {
		return GetLogLevel() >= level;
	}

	template<typename... Args>
	void operator()(unsigned level, Args&&... args) const {
		if (!IsLogLevelVisible(level))
			return;

		fmt::memory_buffer buffer;
		(Append(buffer, std::forward<Args>(args)), ...);
		Log(level, {buffer.data(), buffer.size()});
	}

	void Log(unsigned level, std::string_view msg) const;

private:
	static void Append(fmt::memory_buffer &buffer,
			   std::exception_ptr ep);

	template<typename T>
	static void Append(fmt::memory_buffer &buffer, T &&value) {
		fmt::format_to(std::back_inserter(buffer), "{}",
			       std::forward<T>(value));
	}
};

/**
 * Obtain the message of the given exception and all exceptions
 * nested in it, separated by "; ".
 */
std::string
GetFullMessage(std::exception_ptr ep);
