#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <streamfuse/sum.hpp>

TEST_CASE("Sum and merge", "[sum]") {
    streamfuse::Sum<double> a, b;
    for (double y : {1.0, 2.0, 3.0}) a.absorb(y);
    for (double y : {4.0, 5.0}) b.absorb(y);
    REQUIRE(a.value() == 6.0);

    a.merge(b);
    REQUIRE(a.count() == 5);
    REQUIRE(a.value() == 15.0);
}

TEST_CASE("Diff tracks the last value and difference", "[diff]") {
    streamfuse::Diff<double> d;
    d.absorb(3.0);
    REQUIRE(d.value() == 0.0);
    REQUIRE(d.last() == 3.0);
    d.absorb(10.0);
    REQUIRE(d.value() == 7.0);

    streamfuse::Diff<double> next;
    next.absorb(4.0);
    d.merge(next);
    REQUIRE(d.count() == 3);
    REQUIRE(d.last() == 4.0);
    REQUIRE(d.value() == -6.0);

    streamfuse::Diff<double> tail;
    tail.absorb(1.0);
    tail.absorb(1.5);
    d.merge(tail);
    REQUIRE(d.last() == 1.5);
    REQUIRE(d.value() == Catch::Approx(0.5));
}
