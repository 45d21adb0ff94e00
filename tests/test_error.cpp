/**
 * @file test_error.cpp
 * @brief Unit tests for error codes and exceptions.
 */

#include <catch2/catch.hpp>
#include <wordpack/error.hpp>

#include <cstring>
#include <stdexcept>
#include <string>

using namespace wordpack;

TEST_CASE("error_string", "[error]") {
    REQUIRE(std::strcmp(error_string(Error::Ok), "Success") == 0);
    REQUIRE(std::strcmp(error_string(Error::EmptyArray), "Pop from empty array") == 0);
    REQUIRE(std::strcmp(error_string(Error::InvalidWidth), error_string(Error::IndexOutOfRange)) != 0);
    REQUIRE(std::strcmp(error_string(static_cast<Error>(-99)), "Unknown error") == 0);
}

TEST_CASE("throw_on_error", "[error]") {
    SECTION("Ok does not throw") {
        REQUIRE_NOTHROW(throw_on_error(Error::Ok));
    }

    SECTION("each code maps to its exception") {
        REQUIRE_THROWS_AS(throw_on_error(Error::InvalidWidth), InvalidWidthException);
        REQUIRE_THROWS_AS(throw_on_error(Error::EmptyArray), EmptyArrayException);
        REQUIRE_THROWS_AS(throw_on_error(Error::LengthMismatch), LengthMismatchException);
        REQUIRE_THROWS_AS(throw_on_error(Error::IndexOutOfRange), IndexOutOfRangeException);
        REQUIRE_THROWS_AS(throw_on_error(Error::AddressDerivation), AddressDerivationException);
    }

    SECTION("exceptions carry the code and context") {
        try {
            throw_on_error(Error::EmptyArray, "pop");
            FAIL("expected an exception");
        } catch (const WordpackException& e) {
            REQUIRE(e.code() == Error::EmptyArray);
            REQUIRE(std::string(e.what()) == "pop: Pop from empty array");
        }
    }

    SECTION("base exception keeps the code it is given") {
        WordpackException e("custom", Error::LengthMismatch);
        REQUIRE(e.code() == Error::LengthMismatch);
        REQUIRE(std::string(e.what()) == "custom");
        REQUIRE(IndexOutOfRangeException("x").code() == Error::IndexOutOfRange);
    }

    SECTION("hierarchy derives from std::runtime_error") {
        REQUIRE_THROWS_AS(throw_on_error(Error::IndexOutOfRange), WordpackException);
        REQUIRE_THROWS_AS(throw_on_error(Error::IndexOutOfRange), std::runtime_error);
    }
}
