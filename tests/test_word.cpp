/**
 * @file test_word.cpp
 * @brief Unit tests for the Word class.
 */

#include <catch2/catch.hpp>
#include <wordpack/word.hpp>

using namespace wordpack;

TEST_CASE("Word construction", "[word]") {
    SECTION("default construction is zero") {
        Word<256> w;
        REQUIRE(w.is_zero());
        REQUIRE(w.to_uint64() == 0U);
    }

    SECTION("construct from 64-bit value") {
        Word<256> w(0x0123456789ABCDEFULL);
        REQUIRE(w.to_uint64() == 0x0123456789ABCDEFULL);
        REQUIRE(w.data()[Word<256>::NUM_LIMBS - 1] == 0x89ABCDEFU);
        REQUIRE(w.data()[Word<256>::NUM_LIMBS - 2] == 0x01234567U);
    }

    SECTION("narrow word drops high bits") {
        Word<32> w(0x100000001ULL);
        REQUIRE(w.to_uint64() == 1U);
    }

    SECTION("constants") {
        REQUIRE(Word<256>::BITS == 256);
        REQUIRE(Word<256>::NUM_LIMBS == 8);
        REQUIRE(Word<256>::NUM_BYTES == 32);
        REQUIRE(Word<64>::NUM_LIMBS == 2);
    }
}

TEST_CASE("Word low_mask", "[word]") {
    SECTION("zero width") {
        REQUIRE(Word<256>::low_mask(0).is_zero());
    }

    SECTION("width inside one limb") {
        REQUIRE(Word<256>::low_mask(5).to_uint64() == 0x1FU);
    }

    SECTION("width crossing a limb boundary") {
        Word<256> mask = Word<256>::low_mask(33);
        REQUIRE(mask.data()[7] == 0xFFFFFFFFU);
        REQUIRE(mask.data()[6] == 1U);
        REQUIRE(mask.data()[5] == 0U);
    }

    SECTION("full width sets every bit") {
        Word<256> mask = Word<256>::low_mask(256);
        mask.invert();
        REQUIRE(mask.is_zero());
    }
}

TEST_CASE("Word shifts", "[word]") {
    SECTION("left shift within 64 bits") {
        Word<64> w(1);
        w.shift_left(63);
        REQUIRE(w.to_uint64() == (1ULL << 63));
    }

    SECTION("left shift by full width gives zero") {
        Word<64> w(0xFFFF);
        w.shift_left(64);
        REQUIRE(w.is_zero());
    }

    SECTION("left shift carries across limbs") {
        Word<128> w(0x8000000000000000ULL);
        w.shift_left(1);
        REQUIRE(w.to_uint64() == 0U);
        REQUIRE(w.data()[1] == 1U);
    }

    SECTION("right shift undoes left shift") {
        Word<256> w(0xDEADBEEFULL);
        w.shift_left(200);
        REQUIRE(w.to_uint64() == 0U);
        w.shift_right(200);
        REQUIRE(w.to_uint64() == 0xDEADBEEFULL);
    }

    SECTION("right shift drops low bits") {
        Word<64> w(0xABCD);
        w.shift_right(8);
        REQUIRE(w.to_uint64() == 0xABU);
    }

    SECTION("shift_right_of may alias its operand") {
        Word<128> w(0xF0);
        w.shift_right_of(w, 4);
        REQUIRE(w.to_uint64() == 0x0FU);
    }
}

TEST_CASE("Word extract and deposit", "[word]") {
    SECTION("field at the top of the word") {
        Word<256> w;
        w.deposit(240, 16, Word<256>(0xABCD));
        REQUIRE(w.extract(240, 16).to_uint64() == 0xABCDU);
        REQUIRE(w.data()[0] == 0xABCD0000U);
    }

    SECTION("oversized value is truncated to the field") {
        Word<256> w;
        w.deposit(0, 8, Word<256>(0x1FF));
        REQUIRE(w.extract(0, 8).to_uint64() == 0xFFU);
        REQUIRE(w.extract(8, 8).is_zero());
    }

    SECTION("neighbouring bits are preserved") {
        Word<256> w;
        w.invert();
        w.deposit(100, 20, Word<256>(0));
        REQUIRE(w.extract(100, 20).is_zero());
        REQUIRE(w.extract(80, 20).to_uint64() == 0xFFFFFU);
        REQUIRE(w.extract(120, 20).to_uint64() == 0xFFFFFU);
    }

    SECTION("field crossing a limb boundary") {
        Word<256> w;
        w.deposit(20, 30, Word<256>(0x2AAAAAAA));
        REQUIRE(w.extract(20, 30).to_uint64() == 0x2AAAAAAAU);
        REQUIRE(w.extract(0, 20).is_zero());
        REQUIRE(w.extract(50, 30).is_zero());
    }

    SECTION("full-width field") {
        Word<256> value;
        value.invert();
        Word<256> w;
        w.deposit(0, 256, value);
        REQUIRE(w == value);
        REQUIRE(w.extract(0, 256) == value);
    }
}

TEST_CASE("Word add", "[word]") {
    SECTION("carry into the next limb") {
        Word<64> w(0xFFFFFFFFULL);
        w.add(1);
        REQUIRE(w.to_uint64() == 0x100000000ULL);
    }

    SECTION("64-bit addend carries past bit 64") {
        Word<128> w(0xFFFFFFFFFFFFFFFFULL);
        w.add(0xFFFFFFFFFFFFFFFFULL);
        REQUIRE(w.to_uint64() == 0xFFFFFFFFFFFFFFFEULL);
        REQUIRE(w.data()[1] == 1U);
    }

    SECTION("wraps modulo 2^W") {
        Word<256> w;
        w.invert();
        w.add(1);
        REQUIRE(w.is_zero());
    }

    SECTION("adding zero is a no-op") {
        Word<256> w(42);
        w.add(0);
        REQUIRE(w.to_uint64() == 42U);
    }
}

TEST_CASE("Word resized", "[word]") {
    SECTION("narrowing keeps the low bits") {
        Word<256> w(0xDEADBEEFCAFEBABEULL);
        w.deposit(200, 8, Word<256>(0xFF));
        Word<64> narrow = w.resized<64>();
        REQUIRE(narrow.to_uint64() == 0xDEADBEEFCAFEBABEULL);
    }

    SECTION("widening zero-extends") {
        Word<256> wide = Word<64>(0xDEADBEEFCAFEBABEULL).resized<256>();
        REQUIRE(wide.to_uint64() == 0xDEADBEEFCAFEBABEULL);
        REQUIRE(wide.extract(64, 192).is_zero());
    }
}

TEST_CASE("Word byte conversion", "[word]") {
    SECTION("to_bytes is big-endian") {
        Word<64> w(0x0102030405060708ULL);
        std::uint8_t bytes[8] = {0};
        w.to_bytes(bytes);
        for (std::size_t i = 0; i < 8; ++i) {
            REQUIRE(bytes[i] == i + 1);
        }
    }

    SECTION("short input is right-aligned") {
        std::uint8_t bytes[] = {0xAA, 0xBB, 0xCC};
        Word<256> w;
        w.from_bytes(bytes, 3);
        REQUIRE(w.to_uint64() == 0xAABBCCU);
    }

    SECTION("excess leading bytes are ignored") {
        std::uint8_t bytes[] = {0xFF, 0x00, 0x00, 0x00, 0x2A};
        Word<32> w;
        w.from_bytes(bytes, 5);
        REQUIRE(w.to_uint64() == 0x2AU);
    }
}

TEST_CASE("Word formatting and hashing", "[word]") {
    SECTION("to_hex is fixed width") {
        REQUIRE(Word<32>(0xBEEF).to_hex() == "0x0000beef");
        REQUIRE(Word<256>().to_hex().size() == 2 + 64);
    }

    SECTION("equal words hash equally") {
        WordHash hash;
        REQUIRE(hash(Word<256>(7)) == hash(Word<256>(7)));
        REQUIRE(Word<256>(7) != Word<256>(8));
    }
}
