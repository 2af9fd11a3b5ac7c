#include <thin-node/span.hh>
#include <thin-node/to_debug_string.hh>

#include <nexus/test.hh>

#include <array>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace
{
struct with_adl_to_string
{
    int v = 0;
};
std::string to_string(with_adl_to_string const& x) { return "adl:" + std::to_string(x.v); }

struct with_member_to_string
{
    std::string to_string() const { return "member"; }
};

// ADL to_string wins over iteration
struct iterable_with_to_string
{
    std::vector<int> data = {1, 2};
    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};
std::string to_string(iterable_with_to_string const&) { return "custom"; }

struct opaque
{
    int a = 0x01020304;
};
} // namespace

TEST("to_debug_string - primitives")
{
    CHECK(tn::to_debug_string(42) == "42");
    CHECK(tn::to_debug_string(-7) == "-7");
    CHECK(tn::to_debug_string(true) == "true");
    CHECK(tn::to_debug_string(false) == "false");
}

TEST("to_debug_string - strings are quoted")
{
    CHECK(tn::to_debug_string(std::string("hi")) == "\"hi\"");
    CHECK(tn::to_debug_string(std::string()) == "\"\"");
    CHECK(tn::to_debug_string("lit") == "\"lit\"");
}

TEST("to_debug_string - chars are quoted and escaped")
{
    CHECK(tn::to_debug_string('a') == "'a'");
    CHECK(tn::to_debug_string('\n') == "'\\n'");
    CHECK(tn::to_debug_string('\0') == "'\\0'");
    CHECK(tn::to_debug_string('\'') == "'\\''");
    CHECK(tn::to_debug_string(char(1)) == "'\\x01'");
}

TEST("to_debug_string - dispatch order")
{
    CHECK(tn::to_debug_string(with_adl_to_string{5}) == "adl:5");
    CHECK(tn::to_debug_string(with_member_to_string{}) == "member");
    CHECK(tn::to_debug_string(iterable_with_to_string{}) == "custom");
}

TEST("to_debug_string - collections")
{
    std::vector<int> const empty;
    CHECK(tn::to_debug_string(empty) == "[]");

    std::vector<int> const values = {1, 2, 3};
    CHECK(tn::to_debug_string(values) == "[1, 2, 3]");
    CHECK(tn::to_debug_string(tn::span<int const>(values)) == "[1, 2, 3]");

    std::vector<std::vector<int>> const nested = {{1}, {}, {2, 3}};
    CHECK(tn::to_debug_string(nested) == "[[1], [], [2, 3]]");

    std::vector<char> const chars = {'a', '\t'};
    CHECK(tn::to_debug_string(chars) == "['a', '\\t']");
}

TEST("to_debug_string - tuples")
{
    CHECK(tn::to_debug_string(std::make_pair(1, std::string("x"))) == "(1, \"x\")");
    CHECK(tn::to_debug_string(std::tuple<>()) == "()");
}

TEST("to_debug_string - long collections are truncated")
{
    std::vector<int> const many(1000, 7);
    auto const s = tn::to_debug_string(many);
    CHECK(s.ends_with(", ...]"));
    CHECK(s.size() < 120);

    tn::debug_string_config cfg;
    cfg.max_length = 10;
    auto const short_s = tn::to_debug_string(many, cfg);
    CHECK(short_s.size() < 20);
}

TEST("to_debug_string - opaque values dump memory")
{
    auto const s = tn::to_debug_string(opaque{});
    CHECK(s.starts_with("0x"));
    CHECK(s.size() == 2 + 2 * sizeof(int));
}
