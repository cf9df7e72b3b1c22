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

#ifndef PADXX_PADDER_CORE_H
#define PADXX_PADDER_CORE_H 1

#include <cassert>
#include <cstddef>
#include <string_view>
#include <type_traits>
#include <vector>

#ifdef _MSC_VER
#  define PADXX_VISIBILITY_DEFAULT
#else
#  define PADXX_VISIBILITY_DEFAULT __attribute__((visibility("default")))
#endif

#ifdef PADXX_SHARED
#  ifdef _MSC_VER
#    ifdef PADXX_EXPORT
#      define PADXX_API __declspec(dllexport)
#    else
#      define PADXX_API __declspec(dllimport)
#    endif
#  else
#    ifdef PADXX_EXPORT
#      define PADXX_API PADXX_VISIBILITY_DEFAULT
#    else
#      define PADXX_API
#    endif
#  endif
#else
#  define PADXX_API
#endif

namespace padxx {

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

enum struct ErrorCode {
    success                 = 0,
    invalid_argument        = 1, // Unknown alignment, symbol or log level
    invalid_pad_spec        = 2, // Malformed "[[fill]align][width]" string
    value_out_of_range      = 3, // Width does not fit into size_t
    invalid_width           = 4, // Target width smaller than the source (strict padding only)
};

// Wraps an error code, may be checked for failure.
// Replaces ErrorCode::operator bool() in most cases (and is more explicit).
struct Failed
{
    ErrorCode const ec = ErrorCode{};

    Failed() = default;
    Failed(ErrorCode ec_) : ec(ec_) {}

    // Test for failure.
    explicit operator bool() const { return ec != ErrorCode{}; }

    operator ErrorCode() const { return ec; }
};

enum struct Alignment : unsigned char {
    left,
    right,   // default
    center,  // odd remainders go to the trailing side
};

// Fill symbols. Each symbol maps to exactly one element.
// Keep in sync with the tables in Padder_core.cc and Padder_spec.cc!
enum struct Symbol : unsigned char {
    whitespace,  // default
    zero,
    one,
    two,
    three,
    four,
    five,
    six,
    seven,
    eight,
    nine,
    hyphen,
    underscore,
    period,
    comma,
    colon,
    semicolon,
    exclamation,
    question,
    asterisk,
    hash,
    plus,
    equals,
    tilde,
    slash,
    backslash,
    pipe,
};

inline constexpr size_t kSymbolCount = static_cast<size_t>(Symbol::pipe) + 1;

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

// A read-only view of SIZE elements of type T.
template <typename T>
class Slice
{
    T const* data_ = nullptr;
    size_t   size_ = 0;

public:
    using value_type = T;
    using pointer    = T const*;
    using iterator   = T const*;

public:
    constexpr Slice() = default;
    constexpr Slice(pointer p, size_t len) : data_(p), size_(len) {}

    template <size_t N>
    constexpr Slice(T const (&arr)[N]) : data_(arr), size_(N) {}

    template <typename Alloc>
    Slice(std::vector<T, Alloc> const& vec) : data_(vec.data()), size_(vec.size()) {}

    // Returns a pointer to the first element.
    constexpr pointer data() const { return data_; }

    // Returns the number of elements.
    constexpr size_t size() const { return size_; }

    // Returns whether the slice is empty.
    constexpr bool empty() const { return size_ == 0; }

    constexpr iterator begin() const { return data_; }
    constexpr iterator end() const { return data_ + size_; }

    constexpr T const& operator[](size_t index) const {
        assert(index < size_);
        return data_[index];
    }
};

//------------------------------------------------------------------------------
// Alignment policy
//------------------------------------------------------------------------------

struct Padding {
    size_t left  = 0;
    size_t right = 0;
};

// Splits DIFF fill elements into a leading and a trailing part.
PADXX_API Padding compute_padding(size_t diff, Alignment align) noexcept;

//------------------------------------------------------------------------------
// Truncation policy
//------------------------------------------------------------------------------

// The half-open range [first, last) of elements kept when slicing.
struct Window {
    size_t first = 0;
    size_t last  = 0;

    size_t size() const { return last - first; }
};

// Returns the window of exactly min(WIDTH, SIZE) elements which is kept when a
// sequence of length SIZE is sliced to fit into WIDTH.
PADXX_API Window compute_window(size_t size, size_t width, Alignment align) noexcept;

//------------------------------------------------------------------------------
// Symbol catalog
//------------------------------------------------------------------------------

PADXX_API char to_char(Symbol symbol) noexcept;
PADXX_API unsigned char to_byte(Symbol symbol) noexcept;

// The returned views point into static storage.
PADXX_API std::string_view to_string_view(Symbol symbol) noexcept;
PADXX_API Slice<unsigned char> to_byte_slice(Symbol symbol) noexcept;

//
// Specialize this to pad sequences of user-defined element types.
//
// Specializations must provide a static member function
//      T convert(Symbol)
// which never fails.
//
template <typename T, typename /*Enable*/ = void>
struct SymbolTraits
{
    static_assert(sizeof(T) == 0,
        "Padding sequences of elements of type T is not supported. "
        "Specialize SymbolTraits<T>.");
};

template <>
struct SymbolTraits<char>
{
    static char convert(Symbol symbol) { return to_char(symbol); }
};

template <>
struct SymbolTraits<signed char>
{
    static signed char convert(Symbol symbol) { return static_cast<signed char>(to_char(symbol)); }
};

template <>
struct SymbolTraits<unsigned char>
{
    static unsigned char convert(Symbol symbol) { return to_byte(symbol); }
};

//------------------------------------------------------------------------------
// Source abstraction
//------------------------------------------------------------------------------

//
// Specialize this to use a container type S as a padding source.
//
// Specializations must provide:
//      element_type                    The type of the elements of S
//      output_type                     A container which supports reserve()
//                                      and insert() and holds element_type's
//      static element_type const* data(S const&)
//      static size_t size(S const&)
//
// See Padder_string.h and Padder_vector.h.
//
template <typename S, typename /*Enable*/ = void>
struct PadSource
{
};

namespace impl {

template <typename Output, typename T>
Output PadElements(T const* src, size_t len, size_t width, Alignment align, T fill)
{
    assert(width >= len);

    auto const pad = compute_padding(width - len, align);

    Output out;
    out.reserve(width);
    out.insert(out.end(), pad.left, fill);
    out.insert(out.end(), src, src + len);
    out.insert(out.end(), pad.right, fill);

    assert(out.size() == width);
    return out;
}

template <typename Output, typename T>
Output SliceElements(T const* src, size_t len, size_t width, Alignment align)
{
    auto const win = compute_window(len, width, align);

    return Output(src + win.first, src + win.last);
}

} // namespace impl

// The padding engine. Works with every type S for which PadSource<S> has been
// specialized.
template <typename S>
struct Padder
{
    using source_type  = PadSource<S>;
    using element_type = typename source_type::element_type;
    using output_type  = typename source_type::output_type;

    static_assert(std::is_same<typename output_type::value_type, element_type>::value,
        "PadSource<S>::output_type must hold elements of type PadSource<S>::element_type");

    // Returns a new sequence of exactly WIDTH elements.
    // If the source is longer than WIDTH, the result of slice_to_fit is
    // returned instead.
    static output_type pad(S const& source, size_t width, Alignment align, Symbol symbol)
    {
        auto const len = source_type::size(source);
        if (width < len)
            return slice_to_fit(source, width, align);

        return impl::PadElements<output_type>(
            source_type::data(source), len, width, align, SymbolTraits<element_type>::convert(symbol));
    }

    // Returns the elements of the source which are kept when fitting it into
    // WIDTH elements. If the source is not longer than WIDTH, returns a copy of
    // the source.
    static output_type slice_to_fit(S const& source, size_t width, Alignment align)
    {
        return impl::SliceElements<output_type>(source_type::data(source), source_type::size(source), width, align);
    }

    // Appends the result of pad() to BUFFER.
    // The existing contents of BUFFER are left as they are.
    template <typename Buffer>
    static void pad_and_push_to_buffer(S const& source, size_t width, Alignment align, Symbol symbol, Buffer& buffer)
    {
        static_assert(std::is_constructible<typename Buffer::value_type, element_type>::value,
            "The elements of Buffer must be constructible from the elements of the source");

        auto const out = pad(source, width, align, symbol);
        buffer.insert(buffer.end(), out.begin(), out.end());
    }
};

} // namespace padxx

#endif // PADXX_PADDER_CORE_H
