#ifndef CLAN_ENGINE_H
#define CLAN_ENGINE_H

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "component_registry.h"
#include "detail/contract.h"
#include "entity.h"
#include "family.h"
#include "system.h"

namespace clan {
	namespace detail {
		// Lets an entity set be searched with a pointer to a const entity
		struct entity_ptr_hash {
			using is_transparent = void;

			std::size_t operator()(entity const* e) const noexcept {
				return std::hash<entity const*>{}(e);
			}
		};
	} // namespace detail

	// A set of entities. Returned by the engine for family queries.
	using entity_set = std::unordered_set<entity*, detail::entity_ptr_hash, std::equal_to<>>;

	// The central class of the library. Keeps track of the registered entities and
	// systems, answers family queries, and drives the systems once per frame.
	//
	// Family queries are cached. The first query for a family scans every entity,
	// after which the cached set is kept current from the component change
	// notifications, so it never needs to be rebuilt.
	//
	// The engine is not thread safe; all calls must come from the same thread.
	class engine {
		// Holds its own copy of the family, so the cache does not depend on the
		// lifetime of the registry the family came from
		struct cached_family {
			family fam;
			entity_set members;
		};

		// The values that make up the engine
		entity_set entities;
		std::vector<std::unique_ptr<system>> systems;
		std::vector<std::type_index> system_types;
		std::unordered_map<std::size_t, cached_family> families;
		std::uint64_t registrations = 0;

		bool update_in_progress = false;

	public:
		engine() = default;
		engine(engine const&) = delete;
		engine(engine&&) = delete;
		engine& operator=(engine const&) = delete;
		engine& operator=(engine&&) = delete;

		~engine() {
			reset();
		}

		//
		// Entities
		//

		// Registers an entity with the engine. The entity is immediately placed in
		// every cached family it matches.
		// Pre: the entity is not registered with another engine
		void add_entity(entity& e) {
			Pre(e.get_engine() == nullptr || e.get_engine() == this, "entity is already registered with another engine");

			if (entities.insert(&e).second)
				e.registration = ++registrations;

			for (auto& entry : families)
				refresh_membership(e, entry.second);

			e.added_to_engine(*this);
		}

		// Deregisters an entity and removes it from every cached family
		void remove_entity(entity& e) {
			if (entities.erase(&e) > 0) {
				for (auto& [index, cached] : families) {
					if (e.family_membership.test(index)) {
						cached.members.erase(&e);
						e.family_membership.reset(index);
					}
				}
			}

			e.removed_from_engine(*this);
		}

		// Returns true if the entity is registered with this engine
		[[nodiscard]] bool has_entity(entity const& e) const {
			return entities.contains(&e);
		}

		[[nodiscard]] entity_set const& get_entities() const noexcept {
			return entities;
		}

		//
		// Systems
		//

		// Adds a system, keyed on its dynamic type, so a system passed through a pointer to
		// a base class is still found by its own type. An existing system of that type is
		// replaced and destroyed without being notified, and the new system takes over its
		// place in the update order.
		// Pre: systems are not being updated
		template <std::derived_from<system> S>
		S& add_system(std::unique_ptr<S> sys) {
			Pre(sys != nullptr, "can not add a null system");
			Pre(!update_in_progress, "can not add systems while systems are updating");

			S& ref = *sys;

			std::type_index const type{typeid(ref)};
			auto const it = std::ranges::find(system_types, type);
			if (it == system_types.end()) {
				system_types.push_back(type);
				systems.push_back(std::move(sys));
			} else {
				systems[std::distance(system_types.begin(), it)] = std::move(sys);
			}

			ref.added_to_engine(*this);
			return ref;
		}

		// Constructs a system in place and adds it
		template <std::derived_from<system> S, typename... Args>
		S& emplace_system(Args&&... args) {
			return add_system(std::make_unique<S>(std::forward<Args>(args)...));
		}

		// Removes the system whose dynamic type is 'S' and hands it back to the caller.
		// Returns an empty pointer if no such system is registered.
		// Pre: systems are not being updated
		template <std::derived_from<system> S>
		std::unique_ptr<S> remove_system() {
			Pre(!update_in_progress, "can not remove systems while systems are updating");

			auto const it = std::ranges::find(system_types, std::type_index{typeid(S)});
			if (it == system_types.end())
				return {};

			auto const offset = std::distance(system_types.begin(), it);
			std::unique_ptr<system> sys = std::move(systems[offset]);
			systems.erase(systems.begin() + offset);
			system_types.erase(it);

			sys->removed_from_engine(*this);
			return std::unique_ptr<S>{static_cast<S*>(sys.release())};
		}

		// Returns the system whose dynamic type is 'S', or nullptr if no such system is registered
		template <std::derived_from<system> S>
		[[nodiscard]] S* system_for() const {
			auto const it = std::ranges::find(system_types, std::type_index{typeid(S)});
			if (it == system_types.end())
				return nullptr;

			return static_cast<S*>(systems[std::distance(system_types.begin(), it)].get());
		}

		[[nodiscard]] std::size_t system_count() const noexcept {
			return systems.size();
		}

		// Calls 'update' on all the enabled systems, in the order they were added.
		// Pre: 'delta' is not negative
		// Pre: systems are not already being updated
		void update(float const delta) {
			Pre(delta >= 0.0f, "delta time can not be negative");
			Pre(!update_in_progress, "systems are already updating");

			struct update_scope {
				bool& flag;
				explicit update_scope(bool& f) : flag(f) {
					flag = true;
				}
				~update_scope() {
					flag = false;
				}
			} const scope{update_in_progress};

			for (auto const& sys : systems) {
				if (sys->is_enabled())
					sys->update(delta);
			}
		}

		//
		// Families
		//

		// Returns the entities that are members of the family. The set is owned by the
		// engine and stays current as entities gain or lose components. The engine keeps
		// a copy of the family, so 'f' does not have to outlive the call.
		// Pre: a family cached under the same index has the same predicate
		entity_set const& entities_for_family(family const& f) {
			auto const [it, inserted] = families.try_emplace(f.index(), cached_family{f, {}});
			cached_family& cached = it->second;

			if (!inserted) {
				Pre(cached.fam.same_predicate(f), "family index is already used by another family; use one family_registry per engine");
				PostAudit(std::ranges::all_of(cached.members, [&f](entity const* e) { return f.member(*e); }),
						  "cached family contains an entity that is not a member; a component change was not announced");
				return cached.members;
			}

			// First query for this family, so build its set
			for (entity* e : entities) {
				if (f.member(*e)) {
					cached.members.insert(e);
					e->family_membership.set(f.index());
				} else {
					e->family_membership.reset(f.index());
				}
			}

			return cached.members;
		}

		// Returns the number of families that have been queried
		[[nodiscard]] std::size_t family_count() const noexcept {
			return families.size();
		}

		// Must be called when a component is attached to a registered entity.
		// 'clan::entity' does this itself for components added through its interface.
		// Pre: the entity is registered with this engine
		void component_added(entity& e, component_bit const bit) {
			Pre(entities.contains(&e), "entity is not registered with this engine");
			refresh_memberships(e, bit);
		}

		// Must be called when a component is detached from a registered entity.
		// Pre: the entity is registered with this engine
		void component_removed(entity& e, component_bit const bit) {
			Pre(entities.contains(&e), "entity is not registered with this engine");
			refresh_memberships(e, bit);
		}

		// Removes all systems and entities, and drops the family caches
		// Pre: systems are not being updated
		void reset() {
			Pre(!update_in_progress, "can not reset the engine while systems are updating");

			// Systems go in reverse order of addition
			while (!systems.empty()) {
				std::unique_ptr<system> sys = std::move(systems.back());
				systems.pop_back();
				system_types.pop_back();
				sys->removed_from_engine(*this);
			}

			std::vector<entity*> const registered(entities.begin(), entities.end());
			for (entity* e : registered)
				remove_entity(*e);

			families.clear();
		}

	private:
		// Re-evaluate the families that can be affected by a change to 'bit'
		void refresh_memberships(entity& e, component_bit const bit) {
			for (auto& entry : families) {
				if (entry.second.fam.involves(bit))
					refresh_membership(e, entry.second);
			}
		}

		// Bring the entity's membership of a single family in line with its components
		static void refresh_membership(entity& e, cached_family& cached) {
			std::size_t const index = cached.fam.index();
			bool const was_member = e.family_membership.test(index);
			bool const is_member = cached.fam.member(e);
			if (was_member == is_member)
				return;

			if (is_member) {
				cached.members.insert(&e);
				e.family_membership.set(index);
			} else {
				cached.members.erase(&e);
				e.family_membership.reset(index);
			}
		}
	};

	//
	// The parts of 'entity' that need a complete engine
	//

	inline entity::~entity() {
		if (owner != nullptr)
			owner->remove_entity(*this);
	}

	inline void entity::notify_component_added(component_bit const bit) {
		if (owner != nullptr)
			owner->component_added(*this, bit);
	}

	inline void entity::notify_component_removed(component_bit const bit) {
		if (owner != nullptr)
			owner->component_removed(*this, bit);
	}
} // namespace clan

#endif // !CLAN_ENGINE_H
