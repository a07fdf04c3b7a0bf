#pragma once
#include <warden/schema/primitives.hpp>

namespace warden::schema {

template <uint16_t Version>
struct cancel_vote_for;

template <>
struct cancel_vote_for<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
};

using cancel_vote_for_t = cancel_vote_for<1>;

}  // namespace warden::schema
