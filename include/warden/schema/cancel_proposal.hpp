#pragma once
#include <warden/schema/primitives.hpp>

namespace warden::schema {

template <uint16_t Version>
struct cancel_proposal;

template <>
struct cancel_proposal<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
};

using cancel_proposal_t = cancel_proposal<1>;

}  // namespace warden::schema
