#ifndef CLAN_ITERATING_SYSTEM_H
#define CLAN_ITERATING_SYSTEM_H

#include <cstdint>
#include <utility>
#include <vector>

#include "engine.h"
#include "family.h"
#include "system.h"

namespace clan {
	// A system that processes every member of a single family once per update.
	//
	// The members are visited from a snapshot taken at the start of the update, so
	// 'process' may add or remove components and entities. Entities that leave the
	// family before their turn are skipped, and so are entities that join it during the
	// pass, even one that reuses the address of an entity destroyed earlier in the pass.
	class iterating_system : public system {
	public:
		explicit iterating_system(family const& f) : fam(f) {
		}

		void update(float const delta) override {
			if (members == nullptr)
				return;

			snapshot.clear();
			for (entity* e : *members)
				snapshot.emplace_back(e, e->get_registration());

			// An address is only dereferenced once the family vouches for it
			for (auto const& [e, registration] : snapshot) {
				if (members->contains(e) && e->get_registration() == registration)
					process(*e, delta);
			}
			snapshot.clear();
		}

		void added_to_engine(engine& e) override {
			members = &e.entities_for_family(fam);
		}

		void removed_from_engine(engine& /*e*/) override {
			members = nullptr;
		}

		[[nodiscard]] family const& get_family() const noexcept {
			return fam;
		}

		// The current members of the family, or nullptr if the system is not in an engine
		[[nodiscard]] entity_set const* get_entities() const noexcept {
			return members;
		}

	protected:
		// Called for each member of the family
		virtual void process(entity& e, float delta) = 0;

	private:
		family fam;
		entity_set const* members = nullptr;
		std::vector<std::pair<entity*, std::uint64_t>> snapshot;
	};
} // namespace clan

#endif // !CLAN_ITERATING_SYSTEM_H
