#ifndef CLAN_ENTITY_ID_H
#define CLAN_ENTITY_ID_H

namespace clan {
    namespace detail {
        using entity_type = int;
    } // namespace detail

    // The application-chosen identity of an entity. The engine never interprets it.
    struct entity_id {
        // Uninitialized entity ids are not allowed, because they make no sense
        entity_id() = delete;

        constexpr entity_id(detail::entity_type _id) noexcept
            : id(_id) {
        }

        constexpr operator detail::entity_type const& () const noexcept {
            return id;
        }

    private:
        detail::entity_type id;
    };
} // namespace clan

#endif // !CLAN_ENTITY_ID_H
