#include "unittest.h"
#include <catch2/catch.hpp>

TEST_CASE("Family bits", "[family]") {
	clan::detail::family_bits bits;

	SECTION("Starts out empty") {
		CHECK(bits.none());
		CHECK(bits.count() == 0);
		CHECK_FALSE(bits.test(0));
		CHECK_FALSE(bits.test(1000));
	}

	SECTION("Setting and resetting bits") {
		bits.set(3);
		CHECK(bits.test(3));
		CHECK_FALSE(bits.test(2));
		CHECK_FALSE(bits.test(4));
		CHECK(bits.count() == 1);

		bits.reset(3);
		CHECK_FALSE(bits.test(3));
		CHECK(bits.none());
	}

	SECTION("Grows to fit large indices") {
		bits.set(0);
		bits.set(63);
		bits.set(64);
		bits.set(200);
		CHECK(bits.test(0));
		CHECK(bits.test(63));
		CHECK(bits.test(64));
		CHECK(bits.test(200));
		CHECK_FALSE(bits.test(199));
		CHECK(bits.count() == 4);
	}

	SECTION("Setting and resetting is idempotent") {
		bits.set(5);
		bits.set(5);
		CHECK(bits.count() == 1);

		bits.reset(5);
		bits.reset(5);
		bits.reset(500);
		CHECK(bits.none());
	}

	SECTION("Resetting everything") {
		bits.set(1);
		bits.set(100);
		bits.reset();
		CHECK(bits.none());
		CHECK_FALSE(bits.test(100));
	}
}
