#pragma once
#include <warden/schema/primitives.hpp>

namespace warden::schema {

template <uint16_t Version>
struct vote_for;

template <>
struct vote_for<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
};

using vote_for_t = vote_for<1>;

}  // namespace warden::schema
