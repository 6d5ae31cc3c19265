#ifndef UNITTEST_H
#define UNITTEST_H

#include <stdexcept>

#include <clan/clan.h>

// Override the default handler for contract violations, so they can be tested for.
struct unittest_handler {
	void assertion_failed(char const* , char const* msg)        { throw std::runtime_error(msg); }
	void precondition_violation(char const* , char const* msg)  { throw std::runtime_error(msg); }
	void postcondition_violation(char const* , char const* msg) { throw std::runtime_error(msg); }
};

template <>
inline auto clan::contract_violation_handler<> = unittest_handler{};

#endif // !UNITTEST_H
