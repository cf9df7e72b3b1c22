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

#ifndef PADXX_PADDER_H
#define PADXX_PADDER_H 1

#include "Padder_core.h"
#include "Padder_log.h"
#include "Padder_spec.h"
#include "Padder_string.h"
#include "Padder_vector.h"

#include <string>
#include <string_view>
#include <vector>

namespace padxx {

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

//
// Pads SOURCE to exactly WIDTH elements, using SYMBOL as the fill element.
//
// If SOURCE is longer than WIDTH, a window of WIDTH elements is sliced out of
// SOURCE instead (see compute_window) and a warning is logged.
//
// Text in, text out:
//      pad("hej", 6, Alignment::left) == "hej   "
//
// Elements in, elements out:
//      pad(std::vector<unsigned char>{...}, 8, Alignment::right, Symbol::zero)
//
template <typename S>
typename PadSource<S>::output_type pad(S const& source, size_t width, Alignment align = Alignment::right, Symbol symbol = Symbol::whitespace)
{
    auto const len = PadSource<S>::size(source);
    if (width < len)
        impl::LogTruncation(len, width, align);

    return Padder<S>::pad(source, width, align, symbol);
}

inline std::string pad(std::string_view source, size_t width, Alignment align = Alignment::right, Symbol symbol = Symbol::whitespace)
{
    return ::padxx::pad<std::string_view>(source, width, align, symbol);
}

template <typename S>
auto pad(S const& source, PadSpec const& spec) -> decltype(::padxx::pad(source, spec.width, spec.align, spec.symbol))
{
    return ::padxx::pad(source, spec.width, spec.align, spec.symbol);
}

// Returns the window of at most WIDTH elements kept when SOURCE does not fit
// into WIDTH elements.
template <typename S>
typename PadSource<S>::output_type slice_to_fit(S const& source, size_t width, Alignment align = Alignment::right)
{
    return Padder<S>::slice_to_fit(source, width, align);
}

inline std::string slice_to_fit(std::string_view source, size_t width, Alignment align = Alignment::right)
{
    return Padder<std::string_view>::slice_to_fit(source, width, align);
}

//
// Pads SOURCE and appends the result to BUFFER.
//
// BUFFER is never cleared or truncated. Growing BUFFER is left to the caller:
// reserve enough capacity up front to amortize allocations over many calls.
//
// Concurrent calls for the same BUFFER must be synchronized by the caller.
//
template <typename S, typename Buffer>
auto pad_and_push_to_buffer(S const& source, size_t width, Alignment align, Symbol symbol, Buffer& buffer)
    -> decltype(void(PadSource<S>::size(source)))
{
    auto const len = PadSource<S>::size(source);
    if (width < len)
        impl::LogTruncation(len, width, align);

    Padder<S>::pad_and_push_to_buffer(source, width, align, symbol, buffer);
}

template <typename Buffer>
void pad_and_push_to_buffer(std::string_view source, size_t width, Alignment align, Symbol symbol, Buffer& buffer)
{
    ::padxx::pad_and_push_to_buffer<std::string_view>(source, width, align, symbol, buffer);
}

template <typename S, typename Buffer>
void pad_and_push_to_buffer(S const& source, PadSpec const& spec, Buffer& buffer)
{
    ::padxx::pad_and_push_to_buffer(source, spec.width, spec.align, spec.symbol, buffer);
}

//
// Like pad_and_push_to_buffer, but does not slice SOURCE.
//
// Returns ErrorCode::invalid_width (and leaves BUFFER unmodified) if SOURCE is
// longer than WIDTH.
//
template <typename S, typename Buffer>
auto try_pad_and_push_to_buffer(S const& source, size_t width, Alignment align, Symbol symbol, Buffer& buffer)
    -> decltype(PadSource<S>::size(source), ErrorCode{})
{
    if (width < PadSource<S>::size(source))
        return ErrorCode::invalid_width;

    Padder<S>::pad_and_push_to_buffer(source, width, align, symbol, buffer);
    return ErrorCode::success;
}

template <typename Buffer>
ErrorCode try_pad_and_push_to_buffer(std::string_view source, size_t width, Alignment align, Symbol symbol, Buffer& buffer)
{
    return ::padxx::try_pad_and_push_to_buffer<std::string_view>(source, width, align, symbol, buffer);
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

inline std::string whitespace(std::string_view source, size_t width, Alignment align = Alignment::right)
{
    return ::padxx::pad(source, width, align, Symbol::whitespace);
}

inline std::string zeros(std::string_view source, size_t width, Alignment align = Alignment::right)
{
    return ::padxx::pad(source, width, align, Symbol::zero);
}

// Pads the text SOURCE and returns the result as a byte vector.
inline std::vector<unsigned char> pad_into_bytes(std::string_view source, size_t width, Alignment align, Symbol symbol)
{
    Slice<unsigned char> const bytes(reinterpret_cast<unsigned char const*>(source.data()), source.size());
    return ::padxx::pad(bytes, width, align, symbol);
}

} // namespace padxx

#endif // PADXX_PADDER_H
