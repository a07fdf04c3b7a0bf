#pragma once
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/transaction_event.hpp>
#include <vector>

namespace warden::governance {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

/// Events accumulated by one transaction, kept only if it succeeds.
using event_list_t = std::vector<warden::schema::transaction_event_t>;

}  // namespace warden::governance
