#include "unittest.h"
#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

namespace {
	// Records every hook call in a shared log
	struct logging_system : clan::system {
		std::vector<std::string>* log;
		std::string name;
		std::vector<float> deltas;
		clan::engine* owner = nullptr;

		logging_system(std::vector<std::string>& log, std::string name) : log(&log), name(std::move(name)) {
		}

		void update(float const delta) override {
			deltas.push_back(delta);
			log->push_back(name + ":update");
		}

		void added_to_engine(clan::engine& e) override {
			owner = &e;
			log->push_back(name + ":added");
		}

		void removed_from_engine(clan::engine& /*e*/) override {
			owner = nullptr;
			log->push_back(name + ":removed");
		}
	};

	struct physics : logging_system {
		using logging_system::logging_system;
	};
	struct render : logging_system {
		using logging_system::logging_system;
	};
	struct audio : logging_system {
		using logging_system::logging_system;
	};

	// Tries to modify the system registry from inside an update
	struct meddling_system : clan::system {
		clan::engine* owner = nullptr;
		std::vector<std::string> log;

		void added_to_engine(clan::engine& e) override {
			owner = &e;
		}

		void update(float const /*delta*/) override {
			owner->emplace_system<physics>(log, "physics");
		}
	};
} // namespace

TEST_CASE("System registry", "[system]") {
	std::vector<std::string> log;
	clan::engine eng;

	SECTION("Adding then removing a system") {
		physics& sys = eng.emplace_system<physics>(log, "physics");
		CHECK(eng.system_count() == 1);
		CHECK(sys.owner == &eng);
		CHECK(eng.system_for<physics>() == &sys);

		std::unique_ptr<physics> removed = eng.remove_system<physics>();
		REQUIRE(removed != nullptr);
		CHECK(removed.get() == &sys);
		CHECK(eng.system_count() == 0);
		CHECK(eng.system_for<physics>() == nullptr);
		CHECK(log == std::vector<std::string>{"physics:added", "physics:removed"});
	}

	SECTION("Lookups of missing systems are empty") {
		eng.emplace_system<physics>(log, "physics");
		CHECK(eng.system_for<render>() == nullptr);
		CHECK(eng.remove_system<render>() == nullptr);
		CHECK(eng.system_count() == 1);
		CHECK(log == std::vector<std::string>{"physics:added"});
	}

	SECTION("Systems are keyed on their type") {
		physics& p = eng.emplace_system<physics>(log, "physics");
		render& r = eng.emplace_system<render>(log, "render");
		CHECK(eng.system_count() == 2);
		CHECK(eng.system_for<physics>() == &p);
		CHECK(eng.system_for<render>() == &r);
	}

	SECTION("A second system of the same type replaces the first") {
		eng.emplace_system<physics>(log, "first");
		eng.emplace_system<render>(log, "render");
		physics& second = eng.emplace_system<physics>(log, "second");

		CHECK(eng.system_count() == 2);
		CHECK(eng.system_for<physics>() == &second);

		// The replaced system is not notified
		CHECK(log == std::vector<std::string>{"first:added", "render:added", "second:added"});

		// and the replacement keeps the update slot
		log.clear();
		eng.update(0.5f);
		CHECK(log == std::vector<std::string>{"second:update", "render:update"});
	}

	SECTION("Systems can be added from a unique_ptr") {
		auto sys = std::make_unique<audio>(log, "audio");
		audio* const raw = sys.get();
		audio& added = eng.add_system(std::move(sys));
		CHECK(&added == raw);
		CHECK(eng.system_for<audio>() == raw);
	}

	SECTION("Systems added through a base class pointer are keyed on their own type") {
		std::unique_ptr<clan::system> p = std::make_unique<physics>(log, "physics");
		std::unique_ptr<clan::system> r = std::make_unique<render>(log, "render");
		clan::system* const raw_p = p.get();
		clan::system* const raw_r = r.get();
		eng.add_system(std::move(p));
		eng.add_system(std::move(r));

		CHECK(eng.system_count() == 2);
		CHECK(eng.system_for<physics>() == raw_p);
		CHECK(eng.system_for<render>() == raw_r);
		CHECK(eng.system_for<clan::system>() == nullptr);

		std::unique_ptr<physics> removed = eng.remove_system<physics>();
		CHECK(removed.get() == raw_p);
		CHECK(eng.system_count() == 1);
		CHECK(eng.system_for<render>() == raw_r);
		CHECK(log == std::vector<std::string>{"physics:added", "render:added", "physics:removed"});
	}

	SECTION("A system added through a base class pointer replaces one of its own type") {
		eng.emplace_system<physics>(log, "first");
		std::unique_ptr<logging_system> second = std::make_unique<physics>(log, "second");
		logging_system* const raw = second.get();
		eng.add_system(std::move(second));

		CHECK(eng.system_count() == 1);
		CHECK(eng.system_for<physics>() == raw);
		CHECK(eng.system_for<logging_system>() == nullptr);
		CHECK(eng.remove_system<logging_system>() == nullptr);
	}

	SECTION("Null systems are rejected") {
		CHECK_THROWS_AS(eng.add_system(std::unique_ptr<physics>{}), std::runtime_error);
		CHECK(eng.system_count() == 0);
	}

	SECTION("Reset removes all systems") {
		eng.emplace_system<physics>(log, "physics");
		eng.emplace_system<render>(log, "render");
		eng.reset();
		CHECK(eng.system_count() == 0);
		CHECK(log == std::vector<std::string>{"physics:added", "render:added", "render:removed", "physics:removed"});
	}

	SECTION("Destroying the engine removes its systems") {
		{
			clan::engine temp;
			temp.emplace_system<physics>(log, "physics");
		}
		CHECK(log == std::vector<std::string>{"physics:added", "physics:removed"});
	}
}

TEST_CASE("System updates", "[system]") {
	std::vector<std::string> log;
	clan::engine eng;

	SECTION("Every system is updated once with the same delta") {
		physics& p = eng.emplace_system<physics>(log, "physics");
		render& r = eng.emplace_system<render>(log, "render");
		audio& a = eng.emplace_system<audio>(log, "audio");

		eng.update(0.016f);
		CHECK(p.deltas == std::vector<float>{0.016f});
		CHECK(r.deltas == std::vector<float>{0.016f});
		CHECK(a.deltas == std::vector<float>{0.016f});

		eng.update(0.0f);
		CHECK(p.deltas == std::vector<float>{0.016f, 0.0f});
		CHECK(a.deltas == std::vector<float>{0.016f, 0.0f});
	}

	SECTION("Systems are updated in the order they were added") {
		eng.emplace_system<render>(log, "render");
		eng.emplace_system<physics>(log, "physics");
		eng.emplace_system<audio>(log, "audio");
		log.clear();

		eng.update(1.0f);
		CHECK(log == std::vector<std::string>{"render:update", "physics:update", "audio:update"});

		// Removing a system keeps the order of the rest
		(void)eng.remove_system<physics>();
		log.clear();
		eng.update(1.0f);
		CHECK(log == std::vector<std::string>{"render:update", "audio:update"});
	}

	SECTION("Disabled systems are skipped") {
		physics& p = eng.emplace_system<physics>(log, "physics");
		REQUIRE(p.is_enabled());

		p.disable();
		CHECK_FALSE(p.is_enabled());
		eng.update(1.0f);
		CHECK(p.deltas.empty());

		p.enable();
		eng.update(2.0f);
		CHECK(p.deltas == std::vector<float>{2.0f});

		p.set_enable(false);
		CHECK_FALSE(p.is_enabled());
	}

	SECTION("An engine without systems can be updated") {
		eng.update(1.0f);
		CHECK(log.empty());
	}

	SECTION("Negative deltas are rejected") {
		physics& p = eng.emplace_system<physics>(log, "physics");
		CHECK_THROWS_AS(eng.update(-1.0f), std::runtime_error);
		CHECK(p.deltas.empty());
	}

	SECTION("The system registry can not change during an update") {
		eng.emplace_system<meddling_system>();
		CHECK_THROWS_AS(eng.update(1.0f), std::runtime_error);
		CHECK(eng.system_count() == 1);

		// The engine is usable again afterwards
		(void)eng.remove_system<meddling_system>();
		CHECK(eng.system_count() == 0);
		eng.update(1.0f);
	}
}
