#include <benchmark/benchmark.h>
#include <clan/clan.h>

#include <memory>
#include <vector>

#include "global.h"

namespace {
	struct position {
		float x, y;
	};
	struct velocity {
		float dx, dy;
	};
	struct sprite {};

	using entity_list = std::vector<std::unique_ptr<clan::entity>>;

	// Every other entity moves, every third is drawn
	entity_list make_entities(clan::engine& eng, clan::component_registry& components, std::size_t count) {
		entity_list entities;
		entities.reserve(count);
		for (std::size_t i = 0; i < count; i++) {
			auto& e = *entities.emplace_back(std::make_unique<clan::entity>(components, static_cast<clan::detail::entity_type>(i)));
			e.add(position{0, 0});
			if (i % 2 == 0)
				e.add(velocity{1, 1});
			if (i % 3 == 0)
				e.add(sprite{});
			eng.add_entity(e);
		}
		return entities;
	}
} // namespace

// The cost of the full scan done on the first query of a family
void first_family_query(benchmark::State& state) {
	auto const nentities = static_cast<std::size_t>(state.range(0));

	for ([[maybe_unused]] auto const _ : state) {
		state.PauseTiming();
		clan::component_registry components;
		clan::family_registry families;
		auto eng = std::make_unique<clan::engine>();
		entity_list entities = make_entities(*eng, components, nentities);
		clan::family const& movers = families.all<position, velocity>(components);
		state.ResumeTiming();

		benchmark::DoNotOptimize(eng->entities_for_family(movers).size());

		state.PauseTiming();
		entities.clear();
		eng.reset();
		state.ResumeTiming();
	}

	state.SetItemsProcessed(state.iterations() * state.range(0));
}
CLAN_BENCHMARK(first_family_query);

// A cached query is a lookup
void cached_family_query(benchmark::State& state) {
	auto const nentities = static_cast<std::size_t>(state.range(0));

	clan::component_registry components;
	clan::family_registry families;
	clan::engine eng;
	entity_list entities = make_entities(eng, components, nentities);
	clan::family const& movers = families.all<position, velocity>(components);
	(void)eng.entities_for_family(movers);

	for ([[maybe_unused]] auto const _ : state) {
		benchmark::DoNotOptimize(eng.entities_for_family(movers).size());
	}

	state.SetItemsProcessed(state.iterations());
}
CLAN_BENCHMARK(cached_family_query);

// Adding and removing a component on one entity, with several cached families.
// The cost should not depend on the number of entities.
void incremental_membership(benchmark::State& state) {
	auto const nentities = static_cast<std::size_t>(state.range(0));

	clan::component_registry components;
	clan::family_registry families;
	clan::engine eng;
	entity_list entities = make_entities(eng, components, nentities);

	(void)eng.entities_for_family(families.all<position>(components));
	(void)eng.entities_for_family(families.all<position, velocity>(components));
	(void)eng.entities_for_family(families.builder(components).all<position>().exclude<sprite>().get());

	clan::entity& e = *entities[1];
	for ([[maybe_unused]] auto const _ : state) {
		e.add(velocity{1, 1});
		e.remove<velocity>();
	}

	state.SetItemsProcessed(state.iterations() * 2);
}
CLAN_BENCHMARK(incremental_membership);

// One frame of a movement system over all moving entities
void update_iterating_system(benchmark::State& state) {
	struct movement : clan::iterating_system {
		using clan::iterating_system::iterating_system;

		void process(clan::entity& e, float const delta) override {
			position& p = *e.get<position>();
			velocity const& v = *e.get<velocity>();
			p.x += v.dx * delta;
			p.y += v.dy * delta;
		}
	};

	auto const nentities = static_cast<std::size_t>(state.range(0));

	clan::component_registry components;
	clan::family_registry families;
	clan::engine eng;
	entity_list entities = make_entities(eng, components, nentities);
	eng.emplace_system<movement>(families.all<position, velocity>(components));

	for ([[maybe_unused]] auto const _ : state) {
		eng.update(1.0f / 60.0f);
	}

	state.SetItemsProcessed(state.iterations() * state.range(0) / 2);
}
CLAN_BENCHMARK(update_iterating_system);

// Registering component types
void component_bit_lookup(benchmark::State& state) {
	clan::component_registry components;
	components.bit_for<position>();
	components.bit_for<velocity>();
	components.bit_for<sprite>();

	for ([[maybe_unused]] auto const _ : state) {
		benchmark::DoNotOptimize(components.bit_for<sprite>());
	}

	state.SetItemsProcessed(state.iterations());
}
CLAN_BENCHMARK_ONE(component_bit_lookup);
