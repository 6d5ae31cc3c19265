#ifndef CLAN_COMPONENT_REGISTRY_H
#define CLAN_COMPONENT_REGISTRY_H

#include <algorithm>
#include <bitset>
#include <cstddef>
#include <iterator>
#include <optional>
#include <vector>

#include "detail/contract.h"
#include "detail/type_id.h"
#include "options.h"

namespace clan {
	// The bit index of a component type
	using component_bit = std::size_t;

	// The set of component types held by an entity
	using component_mask = std::bitset<max_components>;

	// The bit handed out for the first component type seen by a registry
	inline constexpr component_bit first_component_bit = 1;

	// Maps component types to unique, stable bit indices. A type is assigned the next
	// free bit the first time it is seen and keeps it for the lifetime of the registry.
	// Bits are never reused.
	//
	// The registry has no upper bound of its own; whether a bit fits in a
	// 'component_mask' is checked where the mask is written.
	class component_registry {
		// Position 'i' holds the type that owns bit 'first_component_bit + i'
		std::vector<detail::type_id> type_ids;

	public:
		constexpr component_registry() = default;

		// Returns the bit for 'T', allocating it if this is the first request for 'T'
		template <typename T>
		component_bit bit_for() {
			return bit_for(detail::naked_type_id<T>);
		}

		// Returns the bit for the type identified by 'id', allocating it if needed
		component_bit bit_for(detail::type_id const id) {
			if (auto const bit = find(id))
				return *bit;

			type_ids.push_back(id);
			return first_component_bit + (type_ids.size() - 1);
		}

		// Returns true if 'T' has been assigned a bit
		template <typename T>
		[[nodiscard]] bool contains() const {
			return contains(detail::naked_type_id<T>);
		}

		[[nodiscard]] bool contains(detail::type_id const id) const {
			return std::ranges::find(type_ids, id) != type_ids.end();
		}

		// Returns the bit for 'T' without allocating one
		template <typename T>
		[[nodiscard]] std::optional<component_bit> find() const {
			return find(detail::naked_type_id<T>);
		}

		[[nodiscard]] std::optional<component_bit> find(detail::type_id const id) const {
			auto const it = std::ranges::find(type_ids, id);
			if (it == type_ids.end())
				return std::nullopt;
			return first_component_bit + static_cast<component_bit>(std::distance(type_ids.begin(), it));
		}

		// Returns the number of component types registered
		[[nodiscard]] std::size_t size() const noexcept {
			return type_ids.size();
		}

		// Builds a mask with the bits of all the types in 'Types'
		template <typename... Types>
		component_mask mask_for() {
			component_mask mask;
			(set_bit(mask, bit_for<Types>()), ...);
			return mask;
		}

	private:
		static void set_bit(component_mask& mask, component_bit const bit) {
			Pre(bit < max_components, "component bit does not fit in component_mask; raise CLAN_MAX_COMPONENTS");
			mask.set(bit);
		}
	};
} // namespace clan

#endif // !CLAN_COMPONENT_REGISTRY_H
