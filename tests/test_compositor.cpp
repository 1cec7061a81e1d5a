#include <catch2/catch.hpp>
#include <termrast/compositor.hpp>

#include <string>

using namespace termrast;

TEST_CASE("Cell composition", "[compositor]") {
    SECTION("One pixel per cell half at factor 1") {
        Framebuffer fb(2, 2, Color(0, 0, 0));
        fb.set_pixel(0, 0, Color(10, 20, 30), 1.0f);
        fb.set_pixel(0, 1, Color(40, 50, 60), 1.0f);

        CellGrid grid = compose_cells(fb, 2, 1, 1.0);
        REQUIRE(grid.width == 2);
        REQUIRE(grid.height == 1);
        REQUIRE(grid.at(0, 0).top == Color(10, 20, 30));
        REQUIRE(grid.at(0, 0).bottom == Color(40, 50, 60));
        REQUIRE(grid.at(1, 0).top == Color(0, 0, 0));
    }

    SECTION("Blocks are averaged at factor 2") {
        Framebuffer fb(4, 4, Color(0, 0, 0));
        fb.set_pixel(0, 0, Color(200, 100, 40), 1.0f);
        fb.set_pixel(1, 1, Color(200, 100, 40), 1.0f);
        fb.set_pixel(2, 2, Color(100, 100, 100), 1.0f);

        CellGrid grid = compose_cells(fb, 2, 1, 2.0);
        REQUIRE(grid.at(0, 0).top == Color(100, 50, 20));
        REQUIRE(grid.at(0, 0).bottom == Color(0, 0, 0));
        REQUIRE(grid.at(1, 0).bottom == Color(25, 25, 25));
    }

    SECTION("Fractional factors sample at least one pixel") {
        Framebuffer fb(2, 2, Color(90, 90, 90));
        CellGrid grid = compose_cells(fb, 4, 2, 0.5);
        REQUIRE(grid.cells.size() == 8);
        for (const Cell& cell : grid.cells) {
            REQUIRE(cell.top == Color(90, 90, 90));
            REQUIRE(cell.bottom == Color(90, 90, 90));
        }
    }

    SECTION("Empty buffer gives the clear color") {
        Framebuffer fb(0, 0, Color(5, 6, 7));
        CellGrid grid = compose_cells(fb, 3, 2, 1.0);
        REQUIRE(grid.cells.size() == 6);
        REQUIRE(grid.at(2, 1).top == Color(5, 6, 7));
    }
}

TEST_CASE("ANSI line formatting", "[compositor]") {
    CellGrid grid;
    grid.width = 2;
    grid.height = 1;
    grid.cells = {Cell{Color(1, 2, 3), Color(4, 5, 6)}, Cell{Color(255, 0, 0), Color(0, 0, 0)}};

    std::vector<std::string> lines = format_lines(grid);
    REQUIRE(lines.size() == 1);

    std::string expected = std::string("\033[38;2;1;2;3m\033[48;2;4;5;6m") + HALF_BLOCK +
                           "\033[38;2;255;0;0m\033[48;2;0;0;0m" + HALF_BLOCK + "\033[0m";
    REQUIRE(lines[0] == expected);

    SECTION("Every row ends with a reset") {
        CellGrid tall;
        tall.width = 1;
        tall.height = 3;
        tall.cells.assign(3, Cell{});
        for (const std::string& line : format_lines(tall)) {
            REQUIRE(line.size() >= 4);
            REQUIRE(line.substr(line.size() - 4) == "\033[0m");
        }
    }
}
