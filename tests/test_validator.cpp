#include <catch2/catch.hpp>

#include "puzzles.hpp"
#include "sudoku_validator.hpp"

TEST_CASE("Empty grid is valid", "[validator]") {
    Grid empty{};
    ValidationResult v = validate(empty);
    CHECK(v.ok);
    CHECK(v.conflicts.empty());
    CHECK_FALSE(isSolved(empty));
}

TEST_CASE("Same digit twice in a row", "[validator]") {
    Grid g{};
    g[0] = 5;
    g[1] = 5;
    ValidationResult v = validate(g);
    CHECK_FALSE(v.ok);
    CHECK(v.conflicts == std::set<int>{0, 1});
}

TEST_CASE("Duplicates in a column and in a box", "[validator]") {
    Grid column{};
    column[4] = 7;
    column[76] = 7;
    CHECK(validate(column).conflicts == std::set<int>{4, 76});

    Grid box{};
    box[30] = 3; // r4c4
    box[50] = 3; // r6c6
    CHECK(validate(box).conflicts == std::set<int>{30, 50});
}

TEST_CASE("Every occurrence of a repeated digit is reported", "[validator]") {
    Grid g{};
    g[9] = 2;
    g[12] = 2;
    g[17] = 2;
    g[10] = 6; // unrelated, stays out
    ValidationResult v = validate(g);
    CHECK_FALSE(v.ok);
    CHECK(v.conflicts == std::set<int>{9, 12, 17});
}

TEST_CASE("Conflicts from separate units are merged", "[validator]") {
    Grid g{};
    g[0] = 1;
    g[8] = 1;  // row 1
    g[80] = 4;
    g[62] = 4; // column 9 and box 9
    CHECK(validate(g).conflicts == std::set<int>{0, 8, 62, 80});
}

TEST_CASE("Same digit in unrelated cells is fine", "[validator]") {
    Grid g{};
    g[0] = 9;
    g[40] = 9;
    g[80] = 9;
    CHECK(validate(g).ok);
}

TEST_CASE("Solved grids are recognised", "[validator]") {
    Grid solved = puzzles::grid(puzzles::EASY_SOLUTION);
    CHECK(validate(solved).ok);
    CHECK(isSolved(solved));

    Grid broken = solved;
    std::swap(broken[0], broken[1]);
    CHECK_FALSE(validate(broken).ok);
    CHECK_FALSE(isSolved(broken));
}

TEST_CASE("Values outside 1..9 are not counted", "[validator]") {
    Grid g{};
    g[0] = 12;
    g[1] = 12;
    g[2] = -1;
    CHECK(validate(g).ok);
}
