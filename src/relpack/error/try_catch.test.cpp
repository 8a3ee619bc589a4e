#include "./try_catch.hpp"

#include <relpack/error/errors.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Try-catch with a value") {
    auto r = relpack_leaf_try { return 2; }
    relpack_leaf_catch_all->int { return 0; };
    CHECK(r == 2);
}

TEST_CASE("Try-catch selects the matching handler") {
    auto r = relpack_leaf_try->int {
        throw relpack::make_user_error<relpack::errc::patch_mismatch>();
    }
    relpack_leaf_catch(relpack::user_error<relpack::errc::invalid_version> const&)->int {
        return 1;
    }
    relpack_leaf_catch(relpack::user_error<relpack::errc::patch_mismatch> const& e)->int {
        CHECK(e.get_errc() == relpack::errc::patch_mismatch);
        return 2;
    }
    relpack_leaf_catch_all->int { return 0; };
    CHECK(r == 2);
}
