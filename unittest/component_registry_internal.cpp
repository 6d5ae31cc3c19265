#include "unittest.h"

#include <string>
#include <utility>

// A 'position' that only shares its name with the one in component_registry.cpp
namespace {
	struct position {
		std::string label;
	};
} // namespace

clan::component_bit internal_position_bit(clan::component_registry& reg) {
	return reg.bit_for<position>();
}

void add_internal_position(clan::entity& e, std::string label) {
	e.add(position{std::move(label)});
}

std::string const* internal_position_label(clan::entity const& e) {
	position const* p = e.get<position>();
	return p != nullptr ? &p->label : nullptr;
}
