#ifndef CLAN_OPTIONS_H
#define CLAN_OPTIONS_H

#include <cstddef>

// Compile-time configuration. Define these before including any clan header,
// or set them through the build system.

// Enables the 'Pre', 'Assert' and 'Post' contract checks
#ifndef CLAN_ENABLE_CONTRACTS
#define CLAN_ENABLE_CONTRACTS 1
#endif

// Enables the expensive '*Audit' contract checks
#ifndef CLAN_ENABLE_CONTRACTS_AUDIT
#define CLAN_ENABLE_CONTRACTS_AUDIT 0
#endif

// Dumps a stack trace on contract violations. Needs a standard library with <stacktrace>,
// which may have to be linked explicitly (libstdc++_libbacktrace / libstdc++exp).
#ifndef CLAN_ENABLE_STACKTRACE
#define CLAN_ENABLE_STACKTRACE 0
#endif

// The number of bits in a component mask
#ifndef CLAN_MAX_COMPONENTS
#define CLAN_MAX_COMPONENTS 64
#endif

namespace clan {
	inline constexpr std::size_t max_components = CLAN_MAX_COMPONENTS;
	static_assert(max_components > 1, "a component mask must hold at least one component bit");
} // namespace clan

#endif // !CLAN_OPTIONS_H
