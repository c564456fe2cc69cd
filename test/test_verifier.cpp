#include <doctest/doctest.h>

#include <segloader/enums.hpp>
#include <segloader/utils.hpp>
#include <segloader/verifier.hpp>

#include "test_helpers.hpp"

using namespace segloader;
using namespace segloader::testing;

TEST_SUITE("verifier")
{
    TEST_CASE("sha256")
    {
        CHECK_EQ(sha256(""), EMPTY_SHA);
        CHECK_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    TEST_CASE("sha256sum")
    {
        TempDir dir;
        const std::string content = make_content(100000);
        write_file(dir / "data", content);

        auto digest = sha256sum(dir / "data");
        REQUIRE(digest);
        CHECK_EQ(digest.value(), sha256(content));

        write_file(dir / "empty", "");
        CHECK_EQ(sha256sum(dir / "empty").value(), EMPTY_SHA);
    }

    TEST_CASE("verify")
    {
        TempDir dir;
        write_file(dir / "abc", "abc");
        const std::string expected
            = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

        auto res = verify(dir / "abc", expected);
        REQUIRE(res);
        CHECK(res.value());

        res = verify(dir / "abc", to_upper(expected));
        REQUIRE(res);
        CHECK(res.value());

        res = verify(dir / "abc", EMPTY_SHA);
        REQUIRE(res);
        CHECK_FALSE(res.value());

        res = verify(dir / "missing", expected);
        REQUIRE_FALSE(res);
        CHECK_EQ(res.error().code, ErrorCode::SL_IO);
    }
}
