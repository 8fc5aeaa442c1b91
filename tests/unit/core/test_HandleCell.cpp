#include <handleguard/core/HandleCell.hpp>

#include <doctest/doctest.h>

using HG::HandleCell;
using HG::Native::NativeHandle;

TEST_SUITE("core.handle_cell") {
    TEST_CASE("Starts absent and accepts exactly one identity") {
        HandleCell cell;
        CHECK_FALSE(cell.present());
        CHECK_FALSE(cell.retired());
        CHECK(cell.get().is_none());

        CHECK(cell.set(NativeHandle{0x20}));
        CHECK(cell.present());
        CHECK(cell.get() == NativeHandle{0x20});

        CHECK_FALSE(cell.set(NativeHandle{0x21}));
        CHECK(cell.get() == NativeHandle{0x20});
    }

    TEST_CASE("Refuses the sentinel") {
        HandleCell cell;
        CHECK_FALSE(cell.set(NativeHandle::none()));
        CHECK_FALSE(cell.present());
        CHECK_FALSE(cell.retired());
        CHECK(cell.set(NativeHandle{7}));
    }

    TEST_CASE("Clear is terminal and idempotent") {
        HandleCell cell;
        REQUIRE(cell.set(NativeHandle{0x30}));
        cell.clear();
        CHECK_FALSE(cell.present());
        CHECK(cell.retired());
        CHECK(cell.get().is_none());

        cell.clear();
        CHECK(cell.retired());

        // A replayed creation cannot bring the peer back.
        CHECK_FALSE(cell.set(NativeHandle{0x30}));
        CHECK_FALSE(cell.present());
    }

    TEST_CASE("Clearing a never-set cell retires it") {
        HandleCell cell;
        cell.clear();
        CHECK(cell.retired());
        CHECK_FALSE(cell.set(NativeHandle{0x40}));
    }
}
