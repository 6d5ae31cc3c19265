#include "unittest.h"
#include <catch2/catch.hpp>

#include <set>
#include <string>

namespace {
	struct position {
		float x, y;
	};
	struct velocity {
		float dx, dy;
	};
	struct health {
		int hp;
	};
	struct early_bird {};

	// Registries are usable during static initialization
	constinit clan::component_registry static_registry;
	clan::component_bit const early_bit = static_registry.bit_for<early_bird>();
} // namespace

// From component_registry_internal.cpp, which has its own 'position' in an anonymous namespace
clan::component_bit internal_position_bit(clan::component_registry& reg);
void add_internal_position(clan::entity& e, std::string label);
std::string const* internal_position_label(clan::entity const& e);

TEST_CASE("Component registry", "[component]") {
	SECTION("The first type gets the first bit") {
		clan::component_registry reg;
		CHECK(reg.bit_for<position>() == clan::first_component_bit);
		CHECK(reg.bit_for<velocity>() == clan::first_component_bit + 1);
		CHECK(reg.size() == 2);
	}

	SECTION("Bits are stable") {
		clan::component_registry reg;
		auto const pos = reg.bit_for<position>();
		auto const vel = reg.bit_for<velocity>();

		for (int i = 0; i < 10; i++) {
			REQUIRE(reg.bit_for<position>() == pos);
			REQUIRE(reg.bit_for<velocity>() == vel);
		}
		CHECK(reg.size() == 2);
	}

	SECTION("Distinct types never share a bit") {
		clan::component_registry reg;
		std::set<clan::component_bit> const bits{reg.bit_for<health>(), reg.bit_for<position>(), reg.bit_for<velocity>(),
												 reg.bit_for<int>(), reg.bit_for<float>(), reg.bit_for<early_bird>()};
		CHECK(bits.size() == 6);
	}

	SECTION("Qualifiers are ignored") {
		clan::component_registry reg;
		auto const bit = reg.bit_for<position>();
		CHECK(reg.bit_for<position const>() == bit);
		CHECK(reg.bit_for<position&>() == bit);
		CHECK(reg.bit_for<position const&>() == bit);
		CHECK(reg.size() == 1);
	}

	SECTION("Registries are independent") {
		clan::component_registry a;
		clan::component_registry b;
		a.bit_for<position>();
		CHECK(b.bit_for<velocity>() == clan::first_component_bit);
		CHECK(a.bit_for<velocity>() == clan::first_component_bit + 1);
	}

	SECTION("Lookups do not allocate bits") {
		clan::component_registry reg;
		CHECK_FALSE(reg.contains<position>());
		CHECK_FALSE(reg.find<position>().has_value());
		CHECK(reg.size() == 0);

		auto const bit = reg.bit_for<position>();
		CHECK(reg.contains<position>());
		REQUIRE(reg.find<position>().has_value());
		CHECK(*reg.find<position>() == bit);
	}

	SECTION("Type ids can be used directly") {
		clan::component_registry reg;
		auto const bit = reg.bit_for(clan::detail::naked_type_id<health>);
		CHECK(reg.bit_for<health>() == bit);
	}

	SECTION("Masks hold the bits of their types") {
		clan::component_registry reg;
		clan::component_mask const mask = reg.mask_for<position, velocity>();
		CHECK(mask.count() == 2);
		CHECK(mask.test(reg.bit_for<position>()));
		CHECK(mask.test(reg.bit_for<velocity>()));
		CHECK_FALSE(mask.test(0));
	}

	SECTION("Works during static initialization") {
		CHECK(early_bit == clan::first_component_bit);
		CHECK(static_registry.bit_for<early_bird>() == early_bit);
	}
}

TEST_CASE("Types with internal linkage", "[component]") {
	clan::component_registry components;

	SECTION("Same named types in different translation units get their own bits") {
		auto const here = components.bit_for<position>();
		auto const there = internal_position_bit(components);
		CHECK(here != there);
		CHECK(internal_position_bit(components) == there);
		CHECK(components.bit_for<position>() == here);
		CHECK(components.size() == 2);
	}

	SECTION("An entity can hold both") {
		clan::entity e{components, 1};
		e.add(position{1.0f, 2.0f});
		add_internal_position(e, "elsewhere");

		CHECK(e.component_count() == 2);
		REQUIRE(e.get<position>() != nullptr);
		CHECK(e.get<position>()->x == 1.0f);
		CHECK(e.get<position>()->y == 2.0f);

		std::string const* label = internal_position_label(e);
		REQUIRE(label != nullptr);
		CHECK(*label == "elsewhere");

		e.remove<position>();
		CHECK(e.component_count() == 1);
		CHECK(internal_position_label(e) != nullptr);
	}
}
