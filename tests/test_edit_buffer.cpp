#include <catch2/catch.hpp>

#include "tui/edit_buffer.hpp"

TEST_CASE("EditBuffer", "[tui]") {
    SECTION("CursorStartsAtEnd") {
        EditBuffer buf("hello");
        REQUIRE(buf.cursor() == 5);

        buf.set_text("hi");
        REQUIRE(buf.cursor() == 2);
    }

    SECTION("InsertAndDelete") {
        EditBuffer buf("hello");
        buf.insert(" world");
        REQUIRE(buf.text() == "hello world");

        REQUIRE(buf.backspace());
        REQUIRE(buf.text() == "hello worl");

        buf.move_home();
        REQUIRE(buf.cursor() == 0);
        REQUIRE_FALSE(buf.backspace());
        REQUIRE(buf.erase_forward());
        REQUIRE(buf.text() == "ello worl");

        buf.move_end();
        REQUIRE_FALSE(buf.erase_forward());
    }

    SECTION("MultiByteCharacters") {
        EditBuffer buf("añb");
        REQUIRE(buf.cursor() == 4);

        buf.move_left();
        REQUIRE(buf.cursor() == 3);
        buf.move_left();
        REQUIRE(buf.cursor() == 1);

        REQUIRE(buf.backspace());
        REQUIRE(buf.text() == "ñb");
        REQUIRE(buf.cursor() == 0);

        REQUIRE(buf.erase_forward());
        REQUIRE(buf.text() == "b");

        buf.set_text("ñ");
        REQUIRE(buf.backspace());
        REQUIRE(buf.text().empty());
    }

    SECTION("InsertAtCursor") {
        EditBuffer buf("ac");
        buf.move_left();
        buf.insert("b");
        REQUIRE(buf.text() == "abc");
        REQUIRE(buf.cursor() == 2);
    }

    SECTION("VerticalMovement") {
        EditBuffer buf("abc\nde\nfghij");
        REQUIRE(buf.cursor() == 12);

        // Column 5 clamps to the end of the shorter line.
        buf.move_up();
        REQUIRE(buf.cursor() == 6);
        buf.move_up();
        REQUIRE(buf.cursor() == 2);
        buf.move_up();
        REQUIRE(buf.cursor() == 0);

        buf.move_down();
        REQUIRE(buf.cursor() == 4);
        buf.move_down();
        REQUIRE(buf.cursor() == 7);
        buf.move_down();
        REQUIRE(buf.cursor() == 12);
    }

    SECTION("HomeEndStayOnLine") {
        EditBuffer buf("abc\nde\nfghij");
        buf.move_up();
        buf.move_home();
        REQUIRE(buf.cursor() == 4);
        buf.move_end();
        REQUIRE(buf.cursor() == 6);
    }
}
