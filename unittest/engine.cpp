#define CATCH_CONFIG_MAIN
#include "unittest.h"
#include <catch2/catch.hpp>

#include <memory>
#include <random>
#include <utility>
#include <vector>

namespace {
	struct position {
		float x, y;
	};
	struct velocity {
		float dx, dy;
	};
	struct sprite {};
	struct frozen {};

	// Snapshot of every cached family set and every membership bit
	struct engine_state {
		std::vector<clan::entity_set> sets;
		std::vector<std::vector<bool>> bits;

		bool operator==(engine_state const&) const = default;
	};

	engine_state capture(clan::engine& eng, std::vector<clan::family const*> const& fams,
						 std::vector<clan::entity const*> const& ents) {
		engine_state state;
		for (clan::family const* f : fams) {
			state.sets.push_back(eng.entities_for_family(*f));

			std::vector<bool> bits;
			for (clan::entity const* e : ents)
				bits.push_back(e->get_family_bits().test(f->index()));
			state.bits.push_back(std::move(bits));
		}
		return state;
	}

	// Verifies that the cached set of a family matches a full scan of the engine,
	// and that the membership bits of registered entities agree with it
	void require_consistent(clan::engine& eng, clan::family const& f) {
		clan::entity_set expected;
		for (clan::entity* e : eng.get_entities()) {
			if (f.member(*e))
				expected.insert(e);
			REQUIRE(e->get_family_bits().test(f.index()) == f.member(*e));
		}
		REQUIRE(eng.entities_for_family(f) == expected);
	}
} // namespace

TEST_CASE("Entity registry", "[engine]") {
	clan::component_registry components;
	clan::engine eng;
	clan::entity a{components, 1};
	clan::entity b{components, 2};

	SECTION("Entities can be added and removed") {
		eng.add_entity(a);
		eng.add_entity(b);
		CHECK(eng.get_entities().size() == 2);
		CHECK(eng.has_entity(a));
		CHECK(eng.has_entity(b));

		eng.remove_entity(a);
		CHECK(eng.get_entities().size() == 1);
		CHECK_FALSE(eng.has_entity(a));
		CHECK(eng.has_entity(b));
	}

	SECTION("Entities can be looked up through a const reference") {
		eng.add_entity(a);
		clan::entity const& ca = a;
		CHECK(eng.has_entity(ca));
		CHECK_FALSE(eng.has_entity(std::as_const(b)));
	}

	SECTION("Every registration is numbered") {
		CHECK(a.get_registration() == 0);

		eng.add_entity(a);
		auto const first = a.get_registration();
		CHECK(first != 0);

		// Adding it again does not register it again
		eng.add_entity(a);
		CHECK(a.get_registration() == first);

		eng.add_entity(b);
		CHECK(b.get_registration() != first);

		eng.remove_entity(a);
		eng.add_entity(a);
		CHECK(a.get_registration() > first);
		CHECK(a.get_registration() != b.get_registration());
	}

	SECTION("Removing an unknown entity is harmless") {
		eng.add_entity(b);
		eng.remove_entity(a);
		CHECK(eng.get_entities().size() == 1);
	}

	SECTION("Reset removes all entities") {
		eng.add_entity(a);
		eng.add_entity(b);
		eng.reset();
		CHECK(eng.get_entities().empty());
		CHECK(a.get_engine() == nullptr);
		CHECK(b.get_engine() == nullptr);
	}

	SECTION("Component notifications require a registered entity") {
		CHECK_THROWS_AS(eng.component_added(a, components.bit_for<position>()), std::runtime_error);
		CHECK_THROWS_AS(eng.component_removed(a, components.bit_for<position>()), std::runtime_error);
	}
}

TEST_CASE("Family cache", "[engine][family]") {
	clan::component_registry components;
	clan::family_registry families;
	clan::engine eng;

	SECTION("Position and velocity") {
		REQUIRE(components.bit_for<position>() == 1);
		REQUIRE(components.bit_for<velocity>() == 2);

		clan::entity e{components, 1};
		e.add(position{});
		eng.add_entity(e);

		clan::family const& f = families.all<position, velocity>(components);
		CHECK(eng.entities_for_family(f).empty());

		e.add(velocity{});
		CHECK(eng.entities_for_family(f) == clan::entity_set{&e});
		CHECK(e.get_family_bits().test(f.index()));

		e.remove<position>();
		CHECK(eng.entities_for_family(f).empty());
		CHECK_FALSE(e.get_family_bits().test(f.index()));
	}

	SECTION("The cached set is updated live") {
		clan::entity e{components, 1};
		eng.add_entity(e);

		clan::family const& f = families.all<position>(components);
		clan::entity_set const& members = eng.entities_for_family(f);
		CHECK(members.empty());

		e.add(position{});
		CHECK(members.contains(&e));
		CHECK(&eng.entities_for_family(f) == &members);
	}

	SECTION("The first query scans existing entities") {
		clan::entity a{components, 1};
		clan::entity b{components, 2};
		a.add(position{});
		a.add(velocity{});
		b.add(position{});
		eng.add_entity(a);
		eng.add_entity(b);

		clan::family const& f = families.all<position, velocity>(components);
		CHECK(eng.family_count() == 0);
		CHECK(eng.entities_for_family(f) == clan::entity_set{&a});
		CHECK(eng.family_count() == 1);
		CHECK(a.get_family_bits().test(f.index()));
		CHECK_FALSE(b.get_family_bits().test(f.index()));

		// The incremental path continues from the scanned state
		a.remove<velocity>();
		b.add(velocity{});
		CHECK(eng.entities_for_family(f) == clan::entity_set{&b});
	}

	SECTION("Entities added after a query join their families") {
		clan::family const& f = families.all<position>(components);
		CHECK(eng.entities_for_family(f).empty());

		clan::entity e{components, 1};
		e.add(position{});
		eng.add_entity(e);
		CHECK(eng.entities_for_family(f) == clan::entity_set{&e});
		CHECK(e.get_family_bits().test(f.index()));
	}

	SECTION("Removing an entity purges it from cached families") {
		clan::entity e{components, 1};
		e.add(position{});
		e.add(velocity{});
		eng.add_entity(e);

		clan::family const& f = families.all<position, velocity>(components);
		clan::family const& g = families.all<position>(components);
		REQUIRE(eng.entities_for_family(f).contains(&e));
		REQUIRE(eng.entities_for_family(g).contains(&e));

		eng.remove_entity(e);
		CHECK(eng.entities_for_family(f).empty());
		CHECK(eng.entities_for_family(g).empty());
		CHECK(e.get_family_bits().none());

		// Changes to a removed entity no longer reach the engine
		e.remove<velocity>();
		e.add(velocity{});
		CHECK(eng.entities_for_family(f).empty());

		// Re-adding restores the membership
		eng.add_entity(e);
		CHECK(eng.entities_for_family(f) == clan::entity_set{&e});
		CHECK(eng.entities_for_family(g) == clan::entity_set{&e});
	}

	SECTION("Destroyed entities leave the cache") {
		clan::family const& f = families.all<position>(components);
		{
			clan::entity e{components, 1};
			e.add(position{});
			eng.add_entity(e);
			REQUIRE(eng.entities_for_family(f).size() == 1);
		}
		CHECK(eng.entities_for_family(f).empty());
	}

	SECTION("Excluded components remove entities from a family") {
		clan::entity e{components, 1};
		e.add(position{});
		eng.add_entity(e);

		clan::family const& f = families.builder(components).all<position>().exclude<frozen>().get();
		REQUIRE(eng.entities_for_family(f) == clan::entity_set{&e});

		e.add(frozen{});
		CHECK(eng.entities_for_family(f).empty());
		CHECK_FALSE(e.get_family_bits().test(f.index()));

		e.remove<frozen>();
		CHECK(eng.entities_for_family(f) == clan::entity_set{&e});
	}

	SECTION("Manual notifications are idempotent") {
		clan::entity e{components, 1};
		e.add(position{});
		eng.add_entity(e);

		clan::family const& f = families.all<position>(components);
		REQUIRE(eng.entities_for_family(f).size() == 1);

		auto const bit = components.bit_for<position>();
		eng.component_added(e, bit);
		eng.component_added(e, bit);
		CHECK(eng.entities_for_family(f) == clan::entity_set{&e});

		eng.component_removed(e, bit);
		CHECK(eng.entities_for_family(f) == clan::entity_set{&e});
	}

	SECTION("Families from another registry are rejected on index collisions") {
		clan::family_registry other;
		clan::family const& f = families.all<position>(components);
		clan::family const& g = other.all<velocity>(components);
		REQUIRE(f.index() == g.index());

		(void)eng.entities_for_family(f);
		CHECK_THROWS_AS(eng.entities_for_family(g), std::runtime_error);
	}

	SECTION("The cache does not depend on the family registry") {
		clan::entity e{components, 1};
		eng.add_entity(e);
		{
			clan::family_registry scoped;
			clan::family const& f = scoped.all<position>(components);
			CHECK(eng.entities_for_family(f).empty());
		}

		// The registry is gone, but its family is still maintained
		e.add(position{});
		CHECK(e.get_family_bits().test(0));
		e.add(velocity{});
		e.remove<position>();
		CHECK_FALSE(e.get_family_bits().test(0));
		e.add(position{});

		// The same predicate from another registry finds the cached set
		clan::family_registry fresh;
		clan::family const& f = fresh.all<position>(components);
		REQUIRE(f.index() == 0);
		CHECK(eng.entities_for_family(f) == clan::entity_set{&e});
		CHECK(eng.family_count() == 1);
	}

	SECTION("Reset drops the cache") {
		clan::family const& f = families.all<position>(components);
		(void)eng.entities_for_family(f);
		eng.reset();
		CHECK(eng.family_count() == 0);
	}
}

TEST_CASE("Unrelated component changes leave the cache untouched", "[engine][family]") {
	clan::component_registry components;
	clan::family_registry families;
	clan::engine eng;

	clan::entity a{components, 1};
	clan::entity b{components, 2};
	a.add(position{});
	b.add(position{});
	b.add(velocity{});
	eng.add_entity(a);
	eng.add_entity(b);

	std::vector<clan::family const*> const fams{
		&families.all<position>(components),
		&families.all<position, velocity>(components),
		&families.builder(components).all<position>().exclude<frozen>().get()};
	std::vector<clan::entity const*> const ents{&a, &b};

	engine_state const before = capture(eng, fams, ents);

	SECTION("A component no family uses") {
		a.add(sprite{});
		b.add(sprite{});
		CHECK(capture(eng, fams, ents) == before);
		a.remove<sprite>();
		CHECK(capture(eng, fams, ents) == before);
	}

	SECTION("A component that does not change the outcome") {
		// 'b' already matches everything it can
		b.add(velocity{});
		CHECK(capture(eng, fams, ents) == before);

		// A notification for a change that did not happen
		eng.component_removed(a, components.bit_for<velocity>());
		eng.component_added(a, components.bit_for<frozen>());
		CHECK(capture(eng, fams, ents) == before);
	}
}

TEST_CASE("Family cache stays consistent", "[engine][family]") {
	clan::component_registry components;
	clan::family_registry families;
	clan::engine eng;

	std::vector<std::unique_ptr<clan::entity>> entities;
	for (int i = 0; i < 12; i++)
		entities.push_back(std::make_unique<clan::entity>(components, i));

	std::vector<clan::family const*> const all_families{
		&families.all<position>(components),
		&families.all<position, velocity>(components),
		&families.builder(components).one<sprite, frozen>().get(),
		&families.builder(components).all<position>().exclude<frozen>().get(),
		&families.get({})};

	// Half the families are queried up front, the rest part way through
	std::vector<clan::family const*> queried{all_families[0], all_families[2]};
	for (auto const* f : queried)
		(void)eng.entities_for_family(*f);

	std::mt19937 rng{1234};
	std::uniform_int_distribution<std::size_t> pick_entity(0, entities.size() - 1);
	std::uniform_int_distribution<int> pick_op(0, 3);
	std::uniform_int_distribution<int> pick_component(0, 3);

	auto const toggle = [](clan::entity& e, int component, bool add) {
		switch (component) {
		case 0: add ? (void)e.add(position{}) : (void)e.remove<position>(); break;
		case 1: add ? (void)e.add(velocity{}) : (void)e.remove<velocity>(); break;
		case 2: add ? (void)e.add(sprite{}) : (void)e.remove<sprite>(); break;
		default: add ? (void)e.add(frozen{}) : (void)e.remove<frozen>(); break;
		}
	};

	for (int step = 0; step < 2000; step++) {
		if (step == 500) {
			queried.push_back(all_families[1]);
			queried.push_back(all_families[3]);
		}
		if (step == 1000)
			queried.push_back(all_families[4]);

		clan::entity& e = *entities[pick_entity(rng)];
		switch (pick_op(rng)) {
		case 0: eng.add_entity(e); break;
		case 1: eng.remove_entity(e); break;
		case 2: toggle(e, pick_component(rng), true); break;
		default: toggle(e, pick_component(rng), false); break;
		}

		for (auto const* f : queried)
			require_consistent(eng, *f);
	}
}
