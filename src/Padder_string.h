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

#ifndef PADXX_PADDER_STRING_H
#define PADXX_PADDER_STRING_H 1

#include "Padder_core.h"

#include <string>
#include <string_view>

namespace padxx {

//------------------------------------------------------------------------------
// Text sources
//------------------------------------------------------------------------------

// Text is padded and sliced byte-wise. The length of a string is its size().

template <>
struct PadSource<std::string_view>
{
    using element_type = char;
    using output_type  = std::string;

    static char const* data(std::string_view str) { return str.data(); }
    static size_t size(std::string_view str) { return str.size(); }
};

template <typename Alloc>
struct PadSource<std::basic_string<char, std::char_traits<char>, Alloc>>
{
    using element_type = char;
    using output_type  = std::basic_string<char, std::char_traits<char>, Alloc>;

    static char const* data(output_type const& str) { return str.data(); }
    static size_t size(output_type const& str) { return str.size(); }
};

} // namespace padxx

#endif // PADXX_PADDER_STRING_H
