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

#include "Padder_core.h"

using namespace padxx;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

// One character per symbol, in the order of the enumerators.
static constexpr char kSymbolChars[] = {
    ' ',  // whitespace
    '0',
    '1',
    '2',
    '3',
    '4',
    '5',
    '6',
    '7',
    '8',
    '9',
    '-',  // hyphen
    '_',  // underscore
    '.',  // period
    ',',  // comma
    ':',  // colon
    ';',  // semicolon
    '!',  // exclamation
    '?',  // question
    '*',  // asterisk
    '#',  // hash
    '+',  // plus
    '=',  // equals
    '~',  // tilde
    '/',  // slash
    '\\', // backslash
    '|',  // pipe
};

static_assert(sizeof(kSymbolChars) == kSymbolCount, "kSymbolChars out of sync with enum Symbol");

static size_t SymbolIndex(Symbol symbol)
{
    auto const index = static_cast<size_t>(symbol);
    assert(index < kSymbolCount && "invalid symbol");
    return index;
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

Padding padxx::compute_padding(size_t diff, Alignment align) noexcept
{
    Padding pad;

    switch (align)
    {
    case Alignment::left:
        pad.right = diff;
        break;
    case Alignment::right:
        pad.left = diff;
        break;
    case Alignment::center:
        pad.left = diff/2;
        pad.right = diff - diff/2;
        break;
    }

    return pad;
}

Window padxx::compute_window(size_t size, size_t width, Alignment align) noexcept
{
    Window win;

    if (width >= size)
    {
        win.last = size;
        return win;
    }

    switch (align)
    {
    case Alignment::left:
        win.first = 0;
        win.last = width;
        break;
    case Alignment::right:
        win.first = size - width;
        win.last = size;
        break;
    case Alignment::center:
        // size/2 + width/2 + width%2 <= size/2 + (size+1)/2 == size
        win.first = size/2 - width/2;
        win.last = size/2 + width/2 + width%2;
        break;
    }

    assert(win.first <= win.last);
    assert(win.last <= size);
    assert(win.size() == width);
    return win;
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

char padxx::to_char(Symbol symbol) noexcept
{
    return kSymbolChars[SymbolIndex(symbol)];
}

unsigned char padxx::to_byte(Symbol symbol) noexcept
{
    return static_cast<unsigned char>(kSymbolChars[SymbolIndex(symbol)]);
}

std::string_view padxx::to_string_view(Symbol symbol) noexcept
{
    return std::string_view(&kSymbolChars[SymbolIndex(symbol)], 1);
}

Slice<unsigned char> padxx::to_byte_slice(Symbol symbol) noexcept
{
    return Slice<unsigned char>(reinterpret_cast<unsigned char const*>(&kSymbolChars[SymbolIndex(symbol)]), 1);
}
