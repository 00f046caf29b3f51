#include <catch2/catch.hpp>

#include "reading_cleanup.hpp"

namespace {

Confidences uniform(float value) {
    Confidences c;
    c.fill(value);
    return c;
}

} // namespace

TEST_CASE("Clean readings pass through", "[cleanup]") {
    Grid g{};
    g[0] = 1;
    g[40] = 2;
    CHECK(dropConflictingReadings(g, uniform(0.9f)) == g);
}

TEST_CASE("The least confident duplicate is dropped", "[cleanup]") {
    Grid g{};
    g[0] = 5;
    g[1] = 5;
    Confidences c = uniform(0.9f);
    c[0] = 0.95f;
    c[1] = 0.6f;

    Grid cleaned = dropConflictingReadings(g, c);
    CHECK(cleaned[0] == 5);
    CHECK(cleaned[1] == 0);
    CHECK(validate(cleaned).ok);
}

TEST_CASE("Ties drop the lowest index", "[cleanup]") {
    Grid g{};
    g[3] = 8;
    g[30] = 8; // same column
    Grid cleaned = dropConflictingReadings(g, uniform(0.7f));
    CHECK(cleaned[3] == 0);
    CHECK(cleaned[30] == 8);
}

TEST_CASE("Several conflicts are resolved one cell at a time", "[cleanup]") {
    Grid g{};
    g[0] = 4;
    g[1] = 4;
    g[2] = 4;
    g[80] = 6;
    g[79] = 6;
    Confidences c = uniform(0.9f);
    c[1] = 0.2f;
    c[2] = 0.3f;
    c[79] = 0.1f;

    Grid cleaned = dropConflictingReadings(g, c);
    CHECK(validate(cleaned).ok);
    CHECK(cleaned[0] == 4);
    CHECK(cleaned[1] == 0);
    CHECK(cleaned[2] == 0);
    CHECK(cleaned[79] == 0);
    CHECK(cleaned[80] == 6);
}
