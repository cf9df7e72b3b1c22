// Copyright (c) 2017 Alexander Bolz
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#ifndef PADXX_PADDER_LOG_H
#define PADXX_PADDER_LOG_H 1

#include "Padder_core.h"

#include <fmt/format.h>

#include <cstdio>
#include <string_view>
#include <utility>

namespace padxx {

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

enum struct LogLevel : unsigned char {
    trace,
    debug,
    info,
    warn,
    error,
    off,    // default
};

// Sets the minimum level of the records which are written.
PADXX_API void set_log_level(LogLevel level) noexcept;

PADXX_API LogLevel log_level() noexcept;

// Returns whether records of the given level are written.
PADXX_API bool log_enabled(LogLevel level) noexcept;

// Sets the destination of the log records. Uses stderr if FILE is null.
// Not synchronized with concurrent calls to log().
PADXX_API void set_log_file(std::FILE* file) noexcept;

// Accepts "trace", "debug", "info", "warn", "error" and "off".
PADXX_API ErrorCode parse_log_level(std::string_view str, LogLevel& level);

// Reads the log level from the environment variable PADXX_LOG.
// Leaves the level unchanged if the variable is not set or invalid.
PADXX_API ErrorCode init_log_from_env();

namespace impl {

PADXX_API void LogMessage(LogLevel level, std::string_view message);

// Emits a warning about a source which does not fit into WIDTH elements.
PADXX_API void LogTruncation(size_t size, size_t width, Alignment align);

} // namespace impl

template <typename ...Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args)
{
    if (!log_enabled(level))
        return;

    ::padxx::impl::LogMessage(level, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace padxx

#endif // PADXX_PADDER_LOG_H
