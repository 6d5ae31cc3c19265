#ifndef CLAN_FAMILY_H
#define CLAN_FAMILY_H

#include <algorithm>
#include <cstddef>
#include <memory>
#include <vector>

#include "component_registry.h"
#include "entity.h"

namespace clan {
	// A predicate over an entity's component mask. An entity is a member of a family
	// when it has every component in 'all', at least one component in 'one' (if 'one'
	// is not empty), and none of the components in 'exclude'.
	//
	// Families are created by a 'family_registry', which hands out one canonical
	// instance per distinct predicate. The index of a family is the bit it occupies in
	// every entity's family membership bits. Copies keep both the predicate and the index.
	class family {
		component_mask all_bits;
		component_mask one_bits;
		component_mask exclude_bits;
		std::size_t family_index;

	public:
		family(component_mask const& all, component_mask const& one, component_mask const& exclude, std::size_t index)
			: all_bits(all), one_bits(one), exclude_bits(exclude), family_index(index) {
		}

		[[nodiscard]] std::size_t index() const noexcept {
			return family_index;
		}

		// Returns true if the entity's current components satisfy this family
		[[nodiscard]] bool member(entity const& e) const noexcept {
			return matches(e.get_component_bits());
		}

		[[nodiscard]] bool matches(component_mask const& bits) const noexcept {
			if ((all_bits & bits) != all_bits)
				return false;
			if (one_bits.any() && (one_bits & bits).none())
				return false;
			return (exclude_bits & bits).none();
		}

		// Returns true if changing 'bit' on an entity can change its membership
		[[nodiscard]] bool involves(component_bit const bit) const {
			return bit < max_components && (all_bits.test(bit) || one_bits.test(bit) || exclude_bits.test(bit));
		}

		// Returns true if both families describe the same predicate
		[[nodiscard]] bool same_predicate(component_mask const& all, component_mask const& one, component_mask const& exclude) const noexcept {
			return all_bits == all && one_bits == one && exclude_bits == exclude;
		}

		[[nodiscard]] bool same_predicate(family const& other) const noexcept {
			return same_predicate(other.all_bits, other.one_bits, other.exclude_bits);
		}

		[[nodiscard]] component_mask const& get_all() const noexcept {
			return all_bits;
		}

		[[nodiscard]] component_mask const& get_one() const noexcept {
			return one_bits;
		}

		[[nodiscard]] component_mask const& get_exclude() const noexcept {
			return exclude_bits;
		}
	};

	class family_builder;

	// Owns the families and assigns their indices. Equal predicates always yield the
	// same family, so its index is stable for the lifetime of the registry.
	//
	// Use a single family registry per engine; the engine keys its caches on the index.
	class family_registry {
		std::vector<std::unique_ptr<family>> families;

	public:
		family_registry() = default;
		family_registry(family_registry const&) = delete;
		family_registry& operator=(family_registry const&) = delete;

		// Returns the family for the predicate, creating it on first request
		family const& get(component_mask const& all, component_mask const& one = {}, component_mask const& exclude = {}) {
			auto const it = std::ranges::find_if(families, [&](auto const& f) { return f->same_predicate(all, one, exclude); });
			if (it != families.end())
				return **it;

			families.push_back(std::make_unique<family>(all, one, exclude, families.size()));
			return *families.back();
		}

		// Shorthand for a family that requires all of 'Types'
		template <typename... Types>
		family const& all(component_registry& components) {
			return get(components.mask_for<Types...>());
		}

		// Starts building a family with component types from 'components'
		family_builder builder(component_registry& components);

		// Returns the family with the given index, or nullptr
		[[nodiscard]] family const* find(std::size_t const index) const noexcept {
			if (index >= families.size())
				return nullptr;
			return families[index].get();
		}

		[[nodiscard]] std::size_t size() const noexcept {
			return families.size();
		}
	};

	// Collects the component types of a family.
	//
	//   family const& movers = families.builder(components).all<position, velocity>().exclude<frozen>().get();
	class family_builder {
		family_registry* registry;
		component_registry* components;
		component_mask all_bits;
		component_mask one_bits;
		component_mask exclude_bits;

	public:
		family_builder(family_registry& families, component_registry& components) : registry(&families), components(&components) {
		}

		template <typename... Types>
		family_builder& all() {
			all_bits |= components->mask_for<Types...>();
			return *this;
		}

		template <typename... Types>
		family_builder& one() {
			one_bits |= components->mask_for<Types...>();
			return *this;
		}

		template <typename... Types>
		family_builder& exclude() {
			exclude_bits |= components->mask_for<Types...>();
			return *this;
		}

		[[nodiscard]] family const& get() const {
			return registry->get(all_bits, one_bits, exclude_bits);
		}
	};

	inline family_builder family_registry::builder(component_registry& components) {
		return family_builder{*this, components};
	}
} // namespace clan

#endif // !CLAN_FAMILY_H
