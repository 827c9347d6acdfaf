#include "process/LineFramer.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

namespace
{

struct FramerFixture
{
    std::vector<std::string> lines;
    rcs::process::LineFramer framer{[this](std::string_view line)
                                    { lines.emplace_back(line); }};
};

} // namespace

TEST_CASE("LineFramer reassembles lines split across chunks")
{
    FramerFixture fx;
    fx.framer.push("first li");
    CHECK(fx.lines.empty());
    CHECK(fx.framer.buffered() == 8);
    fx.framer.push("ne\nsecond\nthi");
    REQUIRE(fx.lines.size() == 2);
    CHECK(fx.lines[0] == "first line");
    CHECK(fx.lines[1] == "second");
    fx.framer.push("rd\n");
    REQUIRE(fx.lines.size() == 3);
    CHECK(fx.lines[2] == "third");
    CHECK(fx.framer.buffered() == 0);
}

TEST_CASE("LineFramer delivers empty lines")
{
    FramerFixture fx;
    fx.framer.push("a\n\n\nb\n");
    REQUIRE(fx.lines.size() == 4);
    CHECK(fx.lines[1].empty());
    CHECK(fx.lines[2].empty());
    CHECK(fx.lines[3] == "b");
}

TEST_CASE("LineFramer::finish flushes the unterminated tail once")
{
    FramerFixture fx;
    fx.framer.push("complete\npartial");
    fx.framer.finish();
    REQUIRE(fx.lines.size() == 2);
    CHECK(fx.lines[1] == "partial");
    CHECK(fx.framer.finished());

    fx.framer.finish();
    fx.framer.push("ignored\n");
    CHECK(fx.lines.size() == 2);
}

TEST_CASE("LineFramer::finish without a tail emits nothing")
{
    FramerFixture fx;
    fx.framer.push("done\n");
    fx.framer.finish();
    CHECK(fx.lines.size() == 1);
}

TEST_CASE("LineFramer output rejoins to the input for any split point")
{
    std::string const text = "alpha\n\nbeta gamma\n{\"msg\":\"x\"}\ntail";
    for (std::size_t split = 0; split <= text.size(); ++split)
    {
        FramerFixture fx;
        fx.framer.push(std::string_view(text).substr(0, split));
        fx.framer.push(std::string_view(text).substr(split));
        fx.framer.finish();

        std::string rejoined;
        for (std::size_t i = 0; i < fx.lines.size(); ++i)
        {
            rejoined += (i == 0 ? "" : "\n") + fx.lines[i];
        }
        CHECK(rejoined == text);
    }
}
