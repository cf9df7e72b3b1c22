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

#include "Padder_log.h"
#include "Padder_spec.h"

#include <atomic>
#include <cstdlib>

using namespace padxx;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

static std::atomic<LogLevel> s_level{LogLevel::off};
static std::FILE* s_file = nullptr;

static char const* LevelName(LogLevel level)
{
    switch (level)
    {
    case LogLevel::trace:
        return "TRACE";
    case LogLevel::debug:
        return "DEBUG";
    case LogLevel::info:
        return "INFO";
    case LogLevel::warn:
        return "WARN";
    case LogLevel::error:
        return "ERROR";
    case LogLevel::off:
        break;
    }

    return "?????";
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

void padxx::set_log_level(LogLevel level) noexcept
{
    s_level.store(level, std::memory_order_relaxed);
}

LogLevel padxx::log_level() noexcept
{
    return s_level.load(std::memory_order_relaxed);
}

bool padxx::log_enabled(LogLevel level) noexcept
{
    auto const current = log_level();
    return current != LogLevel::off && level != LogLevel::off && level >= current;
}

void padxx::set_log_file(std::FILE* file) noexcept
{
    s_file = file;
}

ErrorCode padxx::parse_log_level(std::string_view str, LogLevel& level)
{
    static constexpr struct {
        char const* name;
        LogLevel level;
    } kLevels[] = {
        {"trace", LogLevel::trace},
        {"debug", LogLevel::debug},
        {"info",  LogLevel::info},
        {"warn",  LogLevel::warn},
        {"error", LogLevel::error},
        {"off",   LogLevel::off},
    };

    for (auto const& entry : kLevels)
    {
        if (str == entry.name)
        {
            level = entry.level;
            return ErrorCode::success;
        }
    }

    return ErrorCode::invalid_argument;
}

ErrorCode padxx::init_log_from_env()
{
    char const* value = std::getenv("PADXX_LOG");
    if (value == nullptr)
        return ErrorCode::success;

    LogLevel level;
    if (Failed ec = parse_log_level(value, level))
        return ec;

    set_log_level(level);
    return ErrorCode::success;
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

void padxx::impl::LogMessage(LogLevel level, std::string_view message)
{
    std::FILE* file = s_file != nullptr ? s_file : stderr;

    fmt::print(file, "[padxx] {}: {}\n", LevelName(level), message);
}

void padxx::impl::LogTruncation(size_t size, size_t width, Alignment align)
{
    ::padxx::log(LogLevel::warn, "could not pad source of length {} to width {}, slicing it to fit ({})",
        size, width, alignment_name(align));
}
