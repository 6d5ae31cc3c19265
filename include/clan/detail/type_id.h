#ifndef CLAN_DETAIL_TYPE_ID_H
#define CLAN_DETAIL_TYPE_ID_H

#include <type_traits>

namespace clan::detail {

// Identifies a type by the address of a variable instantiated for it. Types with
// internal linkage get a distinct id in every translation unit, even when they
// share a name with a type in another one.
using type_id = void const*;

template <typename T>
inline constexpr char type_tag{};

// The id of a type with its const/reference qualifiers removed
template <typename T>
inline constexpr type_id naked_type_id = &type_tag<std::remove_cvref_t<T>>;

} // namespace clan::detail

#endif // !CLAN_DETAIL_TYPE_ID_H
