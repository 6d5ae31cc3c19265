#ifndef CLAN_DETAIL_CONTRACT_H
#define CLAN_DETAIL_CONTRACT_H

#include "../options.h"

#include <concepts>
#include <iostream>
#include <type_traits>
#include <utility>
#if CLAN_ENABLE_STACKTRACE && __has_include(<stacktrace>)
#include <stacktrace>
#endif

// Contracts. If they are violated, the engine is in an invalid state and the program is terminated.
namespace clan::detail {
	// Concept for the contract violation interface.
	template <typename T>
	concept contract_violation_interface = requires(T t) {
		{ t.assertion_failed("", "") } -> std::same_as<void>;
		{ t.precondition_violation("", "") } -> std::same_as<void>;
		{ t.postcondition_violation("", "") } -> std::same_as<void>;
	};

	struct default_contract_violation_impl {
		void panic(char const* why, char const* what, char const* how) noexcept {
			std::cerr << why << ": \"" << how << "\"\n\t" << what << "\n\n";
#if CLAN_ENABLE_STACKTRACE && defined(__cpp_lib_stacktrace)
			std::cerr << "** stack dump **\n" << std::stacktrace::current(3) << '\n';
#endif
			std::terminate();
		}

		void assertion_failed(char const* what, char const* how) noexcept {
			panic("Assertion failed", what, how);
		}

		void precondition_violation(char const* what, char const* how) noexcept {
			panic("Precondition violation", what, how);
		}

		void postcondition_violation(char const* what, char const* how) noexcept {
			panic("Postcondition violation", what, how);
		}
	};
} // namespace clan::detail

// The contract violation interface, which can be overridden by users
namespace clan {
	template <typename...>
	auto contract_violation_handler = clan::detail::default_contract_violation_impl{};
}

// Tells the optimizer that an expression holds
#if __has_cpp_attribute(assume)
#define Assume(expression) [[assume((expression))]]
#elif defined(_MSC_VER)
#define Assume(expression) __assume((expression))
#elif defined(__clang__)
#define Assume(expression) __builtin_assume((expression))
#else
#define Assume(expression) /* unknown */
#endif

#if CLAN_ENABLE_CONTRACTS

namespace clan::detail {
	template <typename... DummyArgs>
		requires(sizeof...(DummyArgs) == 0)
	inline void do_assertion_failed(char const* what, char const* how) {
		clan::detail::contract_violation_interface auto& cvi = clan::contract_violation_handler<DummyArgs...>;
		cvi.assertion_failed(what, how);
	}

	template <typename... DummyArgs>
		requires(sizeof...(DummyArgs) == 0)
	inline void do_precondition_violation(char const* what, char const* how) {
		clan::detail::contract_violation_interface auto& cvi = clan::contract_violation_handler<DummyArgs...>;
		cvi.precondition_violation(what, how);
	}

	template <typename... DummyArgs>
		requires(sizeof...(DummyArgs) == 0)
	inline void do_postcondition_violation(char const* what, char const* how) {
		clan::detail::contract_violation_interface auto& cvi = clan::contract_violation_handler<DummyArgs...>;
		cvi.postcondition_violation(what, how);
	}
} // namespace clan::detail

#define CLAN_InvokeContractBreach(expression, message, func)                                                                               \
	do {                                                                                                                                   \
		if (!(expression)) {                                                                                                               \
			func(#expression, message);                                                                                                    \
			/* Contract handler should not let execution reach here */                                                                     \
			std::unreachable();                                                                                                            \
		}                                                                                                                                  \
		/* (expression) is always true from here on out */                                                                                 \
		Assume(expression);                                                                                                                \
	} while (false)

#define Assert(expression, message) CLAN_InvokeContractBreach(expression, message, clan::detail::do_assertion_failed)
#define Pre(expression, message) CLAN_InvokeContractBreach(expression, message, clan::detail::do_precondition_violation)
#define Post(expression, message) CLAN_InvokeContractBreach(expression, message, clan::detail::do_postcondition_violation)

// Audit contracts. Used for expensive checks; can be disabled.
#if CLAN_ENABLE_CONTRACTS_AUDIT
#define AssertAudit(expression, message) Assert(expression, message)
#define PreAudit(expression, message) Pre(expression, message)
#define PostAudit(expression, message) Post(expression, message)
#else
#define AssertAudit(expression, message)
#define PreAudit(expression, message)
#define PostAudit(expression, message)
#endif

#else

// Without contracts the conditions become optimizer assumptions
#define Assert(expression, message) Assume(expression)
#define Pre(expression, message) Assume(expression)
#define Post(expression, message) Assume(expression)
#define AssertAudit(expression, message)
#define PreAudit(expression, message)
#define PostAudit(expression, message)
#endif

#endif // !CLAN_DETAIL_CONTRACT_H
