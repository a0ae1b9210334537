#ifndef JCX_DIVAN_WRAPPER_SERIALIZER_H
#define JCX_DIVAN_WRAPPER_SERIALIZER_H

#include <concepts>
#include <string>
#include <string_view>

#include <glaze/glaze.hpp>

#include "jcailloux/divan/Errors.h"

namespace jcailloux::divan {

// =============================================================================
// JsonEntity — what an accessor needs from its entity type
//
// The JSON mapping itself comes from glaze: plain aggregates are reflected
// automatically, anything else provides a glz::meta<Entity> specialization.
// =============================================================================

template<typename E>
concept JsonEntity = std::default_initializable<E> && std::movable<E>;

}  // namespace jcailloux::divan

namespace jcailloux::divan::wrapper {

// =============================================================================
// Serializer<Entity> — Entity <-> canonical JSON text (Glaze JSON)
//
// type_name is the accessor's entity name; it is carried by the errors so a
// failing payload can be traced back to the entity type that rejected it.
//
// Entities whose document is not a reflected struct specialize Serializer
// with the same two static functions and the same error contract.
// =============================================================================

template<JsonEntity Entity>
struct Serializer {
    [[nodiscard]] static std::string toJson(const Entity& entity, std::string_view type_name) {
        std::string out;
        out.reserve(256);
        if (auto ec = glz::write_json(entity, out)) {
            throw SerializationError(type_name, glz::format_error(ec, out));
        }
        return out;
    }

    [[nodiscard]] static Entity fromJson(std::string_view json, std::string_view type_name) {
        if (json.empty()) {
            throw DeserializationError(type_name, json, "empty payload");
        }
        Entity entity{};
        if (auto ec = glz::read_json(entity, json)) {
            throw DeserializationError(type_name, json, glz::format_error(ec, json));
        }
        return entity;
    }
};

}  // namespace jcailloux::divan::wrapper

#endif  // JCX_DIVAN_WRAPPER_SERIALIZER_H
