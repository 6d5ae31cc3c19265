#include "unittest.h"
#include <catch2/catch.hpp>

namespace {
	struct position {};
	struct velocity {};
	struct sprite {};
	struct model {};
	struct frozen {};
} // namespace

TEST_CASE("Family predicates", "[family]") {
	clan::component_registry components;
	clan::family_registry families;

	auto const pos = components.bit_for<position>();
	auto const vel = components.bit_for<velocity>();
	auto const spr = components.bit_for<sprite>();
	auto const mdl = components.bit_for<model>();
	auto const frz = components.bit_for<frozen>();

	auto const mask = [](std::initializer_list<clan::component_bit> bits) {
		clan::component_mask m;
		for (auto const bit : bits)
			m.set(bit);
		return m;
	};

	SECTION("'all' requires every component") {
		clan::family const& f = families.all<position, velocity>(components);
		CHECK(f.matches(mask({pos, vel})));
		CHECK(f.matches(mask({pos, vel, spr})));
		CHECK_FALSE(f.matches(mask({pos})));
		CHECK_FALSE(f.matches(mask({vel})));
		CHECK_FALSE(f.matches(mask({})));
	}

	SECTION("'one' requires at least one component") {
		clan::family const& f = families.builder(components).one<sprite, model>().get();
		CHECK(f.matches(mask({spr})));
		CHECK(f.matches(mask({mdl})));
		CHECK(f.matches(mask({spr, mdl})));
		CHECK_FALSE(f.matches(mask({pos, vel})));
	}

	SECTION("'exclude' rejects components") {
		clan::family const& f = families.builder(components).all<position>().exclude<frozen>().get();
		CHECK(f.matches(mask({pos})));
		CHECK_FALSE(f.matches(mask({pos, frz})));
		CHECK_FALSE(f.matches(mask({frz})));
	}

	SECTION("An empty family matches everything") {
		clan::family const& f = families.get({});
		CHECK(f.matches(mask({})));
		CHECK(f.matches(mask({pos, frz})));
	}

	SECTION("Combined predicates") {
		clan::family const& f = families.builder(components).all<position>().one<sprite, model>().exclude<frozen>().get();
		CHECK(f.matches(mask({pos, spr})));
		CHECK(f.matches(mask({pos, mdl, vel})));
		CHECK_FALSE(f.matches(mask({pos})));
		CHECK_FALSE(f.matches(mask({pos, spr, frz})));
		CHECK_FALSE(f.matches(mask({spr})));
	}

	SECTION("Involved components") {
		clan::family const& f = families.builder(components).all<position>().one<sprite>().exclude<frozen>().get();
		CHECK(f.involves(pos));
		CHECK(f.involves(spr));
		CHECK(f.involves(frz));
		CHECK_FALSE(f.involves(vel));
		CHECK_FALSE(f.involves(mdl));
		CHECK_FALSE(f.involves(clan::max_components + 3));
	}

	SECTION("Membership of an entity follows its components") {
		clan::entity e{components, 1};
		clan::family const& f = families.all<position, velocity>(components);

		e.add(position{});
		CHECK_FALSE(f.member(e));
		e.add(velocity{});
		CHECK(f.member(e));
	}
}

TEST_CASE("Family registry", "[family]") {
	clan::component_registry components;
	clan::family_registry families;

	SECTION("Equal predicates give the same family") {
		clan::family const& a = families.all<position, velocity>(components);
		clan::family const& b = families.all<velocity, position>(components);
		clan::family const& c = families.builder(components).all<position>().all<velocity>().get();
		CHECK(&a == &b);
		CHECK(&a == &c);
		CHECK(a.index() == b.index());
		CHECK(families.size() == 1);
	}

	SECTION("Different predicates give different indices") {
		clan::family const& a = families.all<position>(components);
		clan::family const& b = families.all<position, velocity>(components);
		clan::family const& c = families.builder(components).all<position>().exclude<velocity>().get();
		clan::family const& d = families.builder(components).one<position>().get();

		CHECK(a.index() == 0);
		CHECK(b.index() == 1);
		CHECK(c.index() == 2);
		CHECK(d.index() == 3);
		CHECK(families.size() == 4);
	}

	SECTION("Families can be found by index") {
		clan::family const& a = families.all<position>(components);
		CHECK(families.find(a.index()) == &a);
		CHECK(families.find(a.index() + 1) == nullptr);
	}

	SECTION("Indices are stable") {
		auto const index = families.all<position>(components).index();
		for (int i = 0; i < 5; i++)
			families.all<sprite, model>(components);
		CHECK(families.all<position>(components).index() == index);
		CHECK(families.size() == 2);
	}
}
