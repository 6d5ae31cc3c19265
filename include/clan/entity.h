#ifndef CLAN_ENTITY_H
#define CLAN_ENTITY_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "component_registry.h"
#include "detail/contract.h"
#include "detail/family_bits.h"
#include "entity_id.h"

namespace clan {
	class engine;

	namespace detail {
		// Type-erased storage for a single component value
		struct component_holder_base {
			virtual ~component_holder_base() = default;
		};

		template <typename T>
		struct component_holder final : component_holder_base {
			template <typename... Args>
			explicit component_holder(Args&&... args) : value(std::forward<Args>(args)...) {
			}

			T value;
		};
	} // namespace detail

	// An identity with a set of attached components.
	//
	// Entities are owned by the application. An engine only keeps a pointer to the
	// entities registered with it, so an entity must outlive its registration;
	// destroying a registered entity removes it from its engine.
	//
	// Components attached or detached through 'add', 'emplace' and 'remove' are
	// announced to the owning engine. Code that changes the component mask through
	// other means must call 'engine::component_added/component_removed' itself.
	//
	// Note: the member functions that talk to the engine are defined in 'engine.h'.
	class entity {
	public:
		entity(component_registry& registry, entity_id const id) : registry(&registry), ent_id(id) {
		}

		virtual ~entity();

		entity(entity const&) = delete;
		entity(entity&&) = delete;
		entity& operator=(entity const&) = delete;
		entity& operator=(entity&&) = delete;

		// Constructs a component of type 'T' in place, replacing any existing 'T'
		template <typename T, typename... Args>
		T& emplace(Args&&... args) {
			static_assert(std::is_same_v<T, std::remove_cvref_t<T>>, "components must be naked types, like 'int', and not 'int const&'");
			static_assert(!std::is_pointer_v<T>, "can not add pointers to entities; wrap them in a struct");

			component_bit const bit = registry->bit_for<T>();
			Pre(bit < max_components, "component bit does not fit in component_mask; raise CLAN_MAX_COMPONENTS");

			if (components.size() <= bit)
				components.resize(bit + 1);

			auto holder = std::make_unique<detail::component_holder<T>>(std::forward<Args>(args)...);
			T& value = holder->value;
			components[bit] = std::move(holder);
			component_bits.set(bit);

			notify_component_added(bit);
			return value;
		}

		// Attaches a component, replacing any existing component of the same type
		template <typename T>
		std::remove_cvref_t<T>& add(T&& value) {
			return emplace<std::remove_cvref_t<T>>(std::forward<T>(value));
		}

		// Detaches the component of type 'T'. Returns false if the entity does not have one.
		template <typename T>
		bool remove() {
			auto const bit = registry->find<T>();
			if (!holds(bit))
				return false;

			components[*bit].reset();
			component_bits.reset(*bit);

			notify_component_removed(*bit);
			return true;
		}

		// Returns true if a component of type 'T' is attached
		template <typename T>
		[[nodiscard]] bool has() const {
			return holds(registry->find<T>());
		}

		// Returns the component of type 'T', or nullptr if it is not attached
		template <typename T>
		[[nodiscard]] T* get() {
			return const_cast<T*>(std::as_const(*this).get<T>());
		}

		template <typename T>
		[[nodiscard]] T const* get() const {
			using naked = std::remove_cvref_t<T>;
			auto const bit = registry->find<naked>();
			if (!holds(bit))
				return nullptr;

			return &static_cast<detail::component_holder<naked> const*>(components[*bit].get())->value;
		}

		// Returns the number of attached components
		[[nodiscard]] std::size_t component_count() const noexcept {
			return component_bits.count();
		}

		[[nodiscard]] entity_id id() const noexcept {
			return ent_id;
		}

		[[nodiscard]] component_mask const& get_component_bits() const noexcept {
			return component_bits;
		}

		// The cached family memberships, maintained by the engine
		[[nodiscard]] detail::family_bits const& get_family_bits() const noexcept {
			return family_membership;
		}

		// Returns the engine this entity is registered with, or nullptr
		[[nodiscard]] engine* get_engine() const noexcept {
			return owner;
		}

		// A number handed out by the engine each time the entity is registered. No two
		// registrations with the same engine share a number; 0 if never registered.
		[[nodiscard]] std::uint64_t get_registration() const noexcept {
			return registration;
		}

		// Called by 'engine::add_entity'. Overrides must call the base version.
		virtual void added_to_engine(engine& e) {
			owner = &e;
		}

		// Called by 'engine::remove_entity'. Overrides must call the base version.
		virtual void removed_from_engine(engine& e) {
			if (owner == &e)
				owner = nullptr;
		}

	private:
		friend class engine;

		void notify_component_added(component_bit bit);
		void notify_component_removed(component_bit bit);

		[[nodiscard]] bool holds(std::optional<component_bit> const bit) const {
			return bit && *bit < max_components && component_bits.test(*bit);
		}

	private:
		component_registry* registry;
		entity_id ent_id;
		engine* owner = nullptr;
		std::uint64_t registration = 0;

		component_mask component_bits;
		detail::family_bits family_membership;

		// Indexed by component bit
		std::vector<std::unique_ptr<detail::component_holder_base>> components;
	};
} // namespace clan

#endif // !CLAN_ENTITY_H
