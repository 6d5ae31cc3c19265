#include "unittest.h"
#include <catch2/catch.hpp>

#include <string>

namespace {
	struct position {
		float x, y;
	};
	struct velocity {
		float dx, dy;
	};
	struct name {
		std::string value;
	};

	// Counts the lifecycle hooks it receives
	struct tracked_entity : clan::entity {
		using clan::entity::entity;

		int added = 0;
		int removed = 0;

		void added_to_engine(clan::engine& e) override {
			clan::entity::added_to_engine(e);
			added++;
		}

		void removed_from_engine(clan::engine& e) override {
			clan::entity::removed_from_engine(e);
			removed++;
		}
	};
} // namespace

TEST_CASE("Entity components", "[entity]") {
	clan::component_registry components;
	clan::entity e{components, 42};

	SECTION("A new entity is empty") {
		CHECK(e.id() == 42);
		CHECK(e.component_count() == 0);
		CHECK(e.get_component_bits().none());
		CHECK(e.get_family_bits().none());
		CHECK(e.get_engine() == nullptr);
		CHECK_FALSE(e.has<position>());
		CHECK(e.get<position>() == nullptr);
	}

	SECTION("Adding components") {
		position& p = e.add(position{1, 2});
		CHECK(p.x == 1.0f);
		CHECK(e.has<position>());
		CHECK_FALSE(e.has<velocity>());
		CHECK(e.component_count() == 1);
		CHECK(e.get_component_bits().test(components.bit_for<position>()));

		e.emplace<name>("bob");
		REQUIRE(e.get<name>() != nullptr);
		CHECK(e.get<name>()->value == "bob");
		CHECK(e.component_count() == 2);
	}

	SECTION("Components can be modified in place") {
		e.add(position{1, 2});
		e.get<position>()->x = 10;
		CHECK(e.get<position>()->x == 10.0f);

		clan::entity const& ce = e;
		REQUIRE(ce.get<position>() != nullptr);
		CHECK(ce.get<position>()->x == 10.0f);
	}

	SECTION("Adding a component twice replaces it") {
		e.add(position{1, 2});
		e.add(position{3, 4});
		CHECK(e.component_count() == 1);
		CHECK(e.get<position>()->x == 3.0f);
	}

	SECTION("Removing components") {
		e.add(position{1, 2});
		e.add(velocity{3, 4});

		CHECK(e.remove<position>());
		CHECK_FALSE(e.has<position>());
		CHECK(e.get<position>() == nullptr);
		CHECK(e.has<velocity>());
		CHECK(e.component_count() == 1);

		// Removing a missing component is not an error
		CHECK_FALSE(e.remove<position>());
		CHECK_FALSE(e.remove<name>());
	}

	SECTION("Components are shared by type across entities") {
		clan::entity other{components, 43};
		e.add(position{});
		other.add(velocity{});
		other.add(position{});
		CHECK(e.get_component_bits().test(components.bit_for<position>()));
		CHECK(other.get_component_bits().test(components.bit_for<position>()));
		CHECK((e.get_component_bits() & other.get_component_bits()).count() == 1);
	}
}

TEST_CASE("Entity capacity", "[entity][contract]") {
	clan::component_registry components;
	clan::entity e{components, 0};

	// Use up every bit the mask can hold, with made up type ids
	static char const placeholders[clan::max_components]{};
	for (std::size_t i = components.size(); i < clan::max_components - 1; i++)
		components.bit_for(&placeholders[i]);

	CHECK_THROWS_AS(e.add(position{}), std::runtime_error);
	CHECK_FALSE(e.has<position>());
}

TEST_CASE("Entity lifecycle hooks", "[entity]") {
	clan::component_registry components;
	clan::engine eng;
	tracked_entity e{components, 7};

	SECTION("Hooks track the owning engine") {
		eng.add_entity(e);
		CHECK(e.added == 1);
		CHECK(e.get_engine() == &eng);

		eng.remove_entity(e);
		CHECK(e.removed == 1);
		CHECK(e.get_engine() == nullptr);
	}

	SECTION("Adding twice still calls the hook") {
		eng.add_entity(e);
		eng.add_entity(e);
		CHECK(e.added == 2);
		CHECK(eng.get_entities().size() == 1);
	}

	SECTION("Removal from a foreign engine leaves the owner intact") {
		clan::engine other;
		eng.add_entity(e);
		other.remove_entity(e);
		CHECK(e.removed == 1);
		CHECK(e.get_engine() == &eng);
		CHECK(eng.has_entity(e));
	}

	SECTION("An entity can only be in one engine") {
		clan::engine other;
		eng.add_entity(e);
		CHECK_THROWS_AS(other.add_entity(e), std::runtime_error);
		CHECK_FALSE(other.has_entity(e));
	}

	SECTION("Destroying an entity removes it from its engine") {
		{
			clan::entity temp{components, 8};
			eng.add_entity(temp);
			CHECK(eng.get_entities().size() == 1);
		}
		CHECK(eng.get_entities().empty());
	}
}
