#ifndef CLAN_SYSTEM_H
#define CLAN_SYSTEM_H

namespace clan {
	class engine;

	// Per-frame logic. A system is registered with an engine under its own type, and
	// the engine owns it until it is removed again.
	class system {
	public:
		system() = default;
		virtual ~system() = default;
		system(system const&) = delete;
		system(system&&) = default;
		system& operator=(system const&) = delete;
		system& operator=(system&&) = default;

		// Called once per frame by 'engine::update' with the time since the previous frame
		virtual void update(float delta) = 0;

		// Called after the system has been added to an engine
		virtual void added_to_engine(engine& /*e*/) {
		}

		// Called after the system has been removed from an engine
		virtual void removed_from_engine(engine& /*e*/) {
		}

		// Enables this system for updates
		void enable() {
			set_enable(true);
		}

		// Prevent this system from being updated
		void disable() {
			set_enable(false);
		}

		// Sets whether the system is enabled or disabled
		void set_enable(bool const is_enabled) {
			enabled = is_enabled;
		}

		// Returns true if this system is enabled
		[[nodiscard]] bool is_enabled() const {
			return enabled;
		}

	private:
		// Whether this system is enabled or disabled. Disabled systems are not updated.
		bool enabled = true;
	};
} // namespace clan

#endif // !CLAN_SYSTEM_H
