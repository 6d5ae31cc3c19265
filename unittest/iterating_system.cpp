#include "unittest.h"
#include <catch2/catch.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <new>
#include <vector>

namespace {
	struct position {
		float x, y;
	};
	struct velocity {
		float dx, dy;
	};
	struct expired {};

	struct movement_system : clan::iterating_system {
		using clan::iterating_system::iterating_system;

		int processed = 0;

	protected:
		void process(clan::entity& e, float const delta) override {
			position& p = *e.get<position>();
			velocity const& v = *e.get<velocity>();
			p.x += v.dx * delta;
			p.y += v.dy * delta;
			processed++;
		}
	};

	// Removes every entity it visits from the engine
	struct cleanup_system : clan::iterating_system {
		using clan::iterating_system::iterating_system;

		clan::engine* owner = nullptr;
		int processed = 0;

		void added_to_engine(clan::engine& e) override {
			clan::iterating_system::added_to_engine(e);
			owner = &e;
		}

	protected:
		void process(clan::entity& e, float const /*delta*/) override {
			owner->remove_entity(e);
			processed++;
		}
	};

	// Strips 'velocity' from the first entity it visits
	struct braking_system : clan::iterating_system {
		using clan::iterating_system::iterating_system;

		std::vector<clan::entity*> targets;
		int processed = 0;

	protected:
		void process(clan::entity& /*e*/, float const /*delta*/) override {
			if (processed == 0) {
				for (clan::entity* t : targets)
					t->remove<velocity>();
			}
			processed++;
		}
	};

	// Lives in storage owned by the test, so a replacement lands at the same address
	struct reusable_slot {
		alignas(clan::entity) std::byte storage[sizeof(clan::entity)];
		clan::entity* occupant = nullptr;

		clan::entity& create(clan::component_registry& components, int id) {
			occupant = new (storage) clan::entity{components, id};
			return *occupant;
		}

		void destroy() {
			if (occupant != nullptr)
				occupant->~entity();
			occupant = nullptr;
		}
	};

	// Once, while visiting another entity, destroys the entity in the slot and registers a new one in its place
	struct recycling_system : clan::iterating_system {
		using clan::iterating_system::iterating_system;

		clan::engine* owner = nullptr;
		clan::component_registry* components = nullptr;
		reusable_slot* slot = nullptr;
		std::vector<int> visited;
		bool recycled = false;

		void added_to_engine(clan::engine& e) override {
			clan::iterating_system::added_to_engine(e);
			owner = &e;
		}

	protected:
		void process(clan::entity& e, float const /*delta*/) override {
			visited.push_back(e.id());
			if (recycled || &e == slot->occupant)
				return;

			recycled = true;
			clan::entity* const old = slot->occupant;
			slot->destroy();
			clan::entity& replacement = slot->create(*components, 99);
			REQUIRE(&replacement == old);
			replacement.add(position{});
			replacement.add(velocity{});
			owner->add_entity(replacement);
		}
	};
} // namespace

TEST_CASE("Iterating systems", "[system][family]") {
	clan::component_registry components;
	clan::family_registry families;
	clan::engine eng;

	clan::family const& movers = families.all<position, velocity>(components);

	std::vector<std::unique_ptr<clan::entity>> entities;
	for (int i = 0; i < 4; i++) {
		auto& e = *entities.emplace_back(std::make_unique<clan::entity>(components, i));
		e.add(position{0, 0});
		if (i % 2 == 0)
			e.add(velocity{1, 2});
		eng.add_entity(e);
	}

	SECTION("Members of the family are processed") {
		movement_system& sys = eng.emplace_system<movement_system>(movers);
		REQUIRE(sys.get_entities() != nullptr);
		CHECK(sys.get_entities()->size() == 2);
		CHECK(sys.get_family().index() == movers.index());
		CHECK(sys.get_family().same_predicate(movers));

		eng.update(0.5f);
		CHECK(sys.processed == 2);
		CHECK(entities[0]->get<position>()->x == 0.5f);
		CHECK(entities[0]->get<position>()->y == 1.0f);
		CHECK(entities[1]->get<position>()->x == 0.0f);
		CHECK(entities[2]->get<position>()->x == 0.5f);
	}

	SECTION("New members are picked up") {
		movement_system& sys = eng.emplace_system<movement_system>(movers);
		entities[1]->add(velocity{1, 1});

		eng.update(1.0f);
		CHECK(sys.processed == 3);
		CHECK(entities[1]->get<position>()->x == 1.0f);
	}

	SECTION("Entities may be removed while processing") {
		cleanup_system& sys = eng.emplace_system<cleanup_system>(movers);
		eng.update(1.0f);
		CHECK(sys.processed == 2);
		CHECK(eng.get_entities().size() == 2);
		CHECK(eng.entities_for_family(movers).empty());

		eng.update(1.0f);
		CHECK(sys.processed == 2);
	}

	SECTION("Entities that leave the family are skipped") {
		braking_system& sys = eng.emplace_system<braking_system>(movers);
		sys.targets = {entities[0].get(), entities[2].get()};

		eng.update(1.0f);
		CHECK(sys.processed == 1);
		CHECK(eng.entities_for_family(movers).empty());
	}

	SECTION("Removed systems let go of the family") {
		(void)eng.emplace_system<movement_system>(movers);
		std::unique_ptr<movement_system> sys = eng.remove_system<movement_system>();
		REQUIRE(sys != nullptr);
		CHECK(sys->get_entities() == nullptr);

		sys->update(1.0f);
		CHECK(sys->processed == 0);
	}

	SECTION("Families can exclude components") {
		clan::family const& living = families.builder(components).all<position>().exclude<expired>().get();
		movement_system& sys = eng.emplace_system<movement_system>(movers);
		entities[0]->add(expired{});

		CHECK(eng.entities_for_family(living).size() == 3);
		eng.update(1.0f);
		CHECK(sys.processed == 2);
	}
}

TEST_CASE("Iterating systems and reused addresses", "[system][family]") {
	clan::component_registry components;
	clan::family_registry families;
	reusable_slot slot;
	clan::engine eng;

	clan::family const& movers = families.all<position, velocity>(components);

	clan::entity first{components, 1};
	first.add(position{});
	first.add(velocity{});
	eng.add_entity(first);

	clan::entity& doomed = slot.create(components, 2);
	doomed.add(position{});
	doomed.add(velocity{});
	eng.add_entity(doomed);

	recycling_system& sys = eng.emplace_system<recycling_system>(movers);
	sys.components = &components;
	sys.slot = &slot;

	// Whichever entity comes first, the one created during the pass is not visited
	eng.update(1.0f);
	CHECK(std::ranges::find(sys.visited, 1) != sys.visited.end());
	CHECK(std::ranges::find(sys.visited, 99) == sys.visited.end());

	sys.visited.clear();
	eng.update(1.0f);
	CHECK(std::ranges::find(sys.visited, 99) != sys.visited.end());
	CHECK(sys.visited.size() == 2);

	eng.remove_entity(first);
	slot.destroy();
}
