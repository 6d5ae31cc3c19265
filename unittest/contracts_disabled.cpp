// Builds the contract macros with checks turned off. Only the contract header is
// included, so the engine is never compiled with two different settings.
#undef CLAN_ENABLE_CONTRACTS
#define CLAN_ENABLE_CONTRACTS 0
#include <clan/detail/contract.h>

#include <catch2/catch.hpp>

namespace {
	int halve(int const value) {
		Pre(value % 2 == 0, "value must be even");
		int const result = value / 2;
		Post(result * 2 == value, "halving is exact");
		return result;
	}

	int count_calls(int& calls) {
		return ++calls;
	}
} // namespace

TEST_CASE("Contracts can be turned off", "[contract]") {
	SECTION("Conditions that hold do not change the result") {
		CHECK(halve(8) == 4);
		CHECK(halve(-6) == -3);
	}

	SECTION("Conditions are not evaluated") {
		int calls = 0;
		Assert(count_calls(calls) > 0, "never evaluated");
		CHECK(calls == 0);
	}
}
