#include "engine/HandlerRegistry.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

TEST_CASE("handlers are looked up by name")
{
    gt::engine::HandlerRegistry registry;
    std::string seen;

    registry.add("echo", [&](std::string const &args) { seen = args; });
    registry.add("noop", [](std::string const &) {});
    REQUIRE(registry.contains("echo"));
    CHECK_FALSE(registry.contains("missing"));
    CHECK_FALSE(static_cast<bool>(registry.find("missing")));

    registry.find("echo")("hello");
    CHECK(seen == "hello");

    registry.add("echo", [&](std::string const &args) { seen = "x" + args; });
    registry.find("echo")("y");
    CHECK(seen == "xy");

    CHECK(registry.names() == std::vector<std::string>{"echo", "noop"});
    CHECK(registry.remove("noop"));
    CHECK_FALSE(registry.remove("noop"));
    CHECK(registry.names() == std::vector<std::string>{"echo"});
}
