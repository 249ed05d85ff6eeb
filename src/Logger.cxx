// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned verbose) noexcept
{
	log_level = verbose;
}

unsigned
GetLogLevel() noexcept
{
	return log_level;
}

void
Logger::Log(unsigned, std::string_view msg) const
{
	fmt::print(stderr, "[{}] {}\n", name, msg);
}

void
Logger::Append(fmt::memory_buffer &buffer, std::exception_ptr ep)
{
	const auto msg = GetFullMessage(ep);
	buffer.append(msg.data(), msg.data() + msg.size());
}

static void
AppendMessage(std::string &dest, std::exception_ptr ep)
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		if (!dest.empty())
			dest += "; ";
		dest += e.what();

		try {
			std::rethrow_if_nested(e);
		} catch (...) {
			AppendMessage(dest, std::current_exception());
		}
	} catch (const char *s) {
		if (!dest.empty())
			dest += "; ";
		dest += s;
	} catch (...) {
		if (!dest.empty())
			dest += "; ";
		dest += "Unknown exception";
	}
}

std::string
GetFullMessage(std::exception_ptr ep)
{
	std::string result;
	if (ep)
		AppendMessage(result, ep);
	return result;
}
