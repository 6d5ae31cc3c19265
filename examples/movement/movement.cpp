#include <clan/clan.h>
#include <iostream>
#include <memory>
#include <vector>

// The components
struct position {
	float x = 0, y = 0;
};

struct velocity {
	float dx = 0, dy = 0;
};

struct sleeping {};

// Moves everything that has a velocity and is awake
struct movement_system : clan::iterating_system {
	using clan::iterating_system::iterating_system;

	void process(clan::entity& e, float const delta) override {
		position& p = *e.get<position>();
		velocity const& v = *e.get<velocity>();
		p.x += v.dx * delta;
		p.y += v.dy * delta;
	}
};

// Prints the position of every entity once per frame
struct report_system : clan::system {
	clan::family const* positioned;
	clan::engine* owner = nullptr;
	int frame = 0;

	explicit report_system(clan::family const& f) : positioned(&f) {
	}

	void added_to_engine(clan::engine& e) override {
		owner = &e;
	}

	void update(float const /*delta*/) override {
		std::cout << "frame " << frame++ << '\n';
		for (clan::entity const* e : owner->entities_for_family(*positioned)) {
			position const& p = *e->get<position>();
			std::cout << "  entity " << e->id() << " at (" << p.x << ", " << p.y << ")\n";
		}
	}
};

int main() {
	clan::component_registry components;
	clan::family_registry families;
	clan::engine eng;

	clan::family const& movers = families.builder(components).all<position, velocity>().exclude<sleeping>().get();
	clan::family const& positioned = families.all<position>(components);

	eng.emplace_system<movement_system>(movers);
	eng.emplace_system<report_system>(positioned);

	// The entities
	std::vector<std::unique_ptr<clan::entity>> entities;
	for (int i = 0; i < 3; i++) {
		auto& e = *entities.emplace_back(std::make_unique<clan::entity>(components, i));
		e.add(position{});
		e.add(velocity{1.0f * (i + 1), 0.5f});
		eng.add_entity(e);
	}

	// Run a few frames. Entity 1 falls asleep after the second frame.
	for (int frame = 0; frame < 4; frame++) {
		if (frame == 2)
			entities[1]->add(sleeping{});
		eng.update(1.0f);
	}
}
