#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "grid_io.hpp"
#include "puzzles.hpp"

TEST_CASE("Parsing ignores whitespace", "[grid_io]") {
    std::string spaced;
    for (size_t r = 0; r < 9; ++r) spaced += puzzles::EASY.substr(r * 9, 9) + " \n";

    Grid g = parseGrid(spaced);
    CHECK(toString81(g) == puzzles::EASY);
    CHECK(g[2] == 3);
    CHECK(g[0] == 0);
}

TEST_CASE("Dots read as empty cells", "[grid_io]") {
    std::string dotted = puzzles::HARD_17;
    for (char& ch : dotted) if (ch == '0') ch = '.';
    CHECK(toString81(parseGrid(dotted)) == puzzles::HARD_17);
}

TEST_CASE("Malformed text is rejected", "[grid_io]") {
    CHECK_THROWS_AS(parseGrid("123"), std::invalid_argument);
    CHECK_THROWS_WITH(parseGrid(puzzles::EASY + "0"), "Text file must contain exactly 81 digits (0-9).");

    std::string letters = puzzles::EASY;
    letters[10] = 'x';
    CHECK_THROWS_WITH(parseGrid(letters), "Only digits 0-9 allowed.");
}

TEST_CASE("Loading from a file", "[grid_io]") {
    const std::string path = "grid_io_test_puzzle.txt";
    {
        std::ofstream out(path);
        out << puzzles::INKALA << "\n";
    }
    CHECK(toString81(loadGridFile(path)) == puzzles::INKALA);
    std::remove(path.c_str());

    CHECK_THROWS_AS(loadGridFile("does/not/exist.txt"), std::runtime_error);
}

TEST_CASE("Printed grid marks boxes and blanks", "[grid_io]") {
    std::ostringstream out;
    printGrid(puzzles::grid(puzzles::EASY), out);
    std::string text = out.str();

    CHECK(text.rfind(". . 3 | . 2 . | 6 . . \n", 0) == 0);
    CHECK(text.find("------+-------+------\n") != std::string::npos);
}

TEST_CASE("Nested rows convert to a grid", "[grid_io]") {
    std::vector<std::vector<int>> rows(9, std::vector<int>(9, 0));
    rows[8][8] = 7;
    auto g = gridFromRows(rows);
    REQUIRE(g.has_value());
    CHECK((*g)[80] == 7);

    rows.pop_back();
    CHECK_FALSE(gridFromRows(rows).has_value());
}
