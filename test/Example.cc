#include "../src/Padder.h"

#include <cstdio>
#include <string>
#include <vector>

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

static void Example1()
{
    std::printf("[%s]\n", padxx::pad("left", 16, padxx::Alignment::left, padxx::Symbol::hyphen).c_str());
        // "[left------------]"
    std::printf("[%s]\n", padxx::pad("center", 16, padxx::Alignment::center, padxx::Symbol::period).c_str());
        // "[.....center.....]"
    std::printf("[%s]\n", padxx::pad("right", 16, padxx::Alignment::right, padxx::Symbol::tilde).c_str());
        // "[~~~~~~~~~~~right]"
    std::printf("[%s]\n", padxx::zeros("9184", 8).c_str());
        // "[00009184]"
    std::printf("[%s]\n", padxx::pad("kappa", 3, padxx::Alignment::center).c_str());
        // "[app]"
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

static void Example2()
{
    // Fixed-width records, one allocation per field.
    struct Row {
        char const* name;
        char const* qty;
    };

    Row const rows[] = {
        {"apples", "12"},
        {"pears", "7"},
        {"a very long product name", "1200"},
    };

    std::string buf;
    buf.reserve(3 * 20);

    for (auto const& row : rows)
    {
        padxx::pad_and_push_to_buffer(row.name, 12, padxx::Alignment::left, padxx::Symbol::whitespace, buf);
        padxx::pad_and_push_to_buffer(row.qty, 6, padxx::Alignment::right, padxx::Symbol::zero, buf);
        buf.push_back('\n');
    }

    std::fwrite(buf.data(), 1, buf.size(), stdout);
        // "apples      000012"
        // "pears       000007"
        // "a very long 001200"
}

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

static void Example3()
{
    padxx::PadSpec spec;
    if (padxx::Failed ec = padxx::parse_pad_spec("_^12", spec))
    {
        std::fprintf(stderr, "invalid pad spec (%d)\n", static_cast<int>(ec.ec));
        return;
    }

    std::vector<unsigned char> const bytes = {'a', 'b', 'c'};
    auto const res = padxx::pad(bytes, spec);

    std::fwrite(res.data(), 1, res.size(), stdout);
    std::fputc('\n', stdout);
        // "____abc_____"
}

int main()
{
    if (padxx::Failed ec = padxx::init_log_from_env())
        std::fprintf(stderr, "ignoring invalid PADXX_LOG (%d)\n", static_cast<int>(ec.ec));

    Example1();
    Example2();
    Example3();
}
