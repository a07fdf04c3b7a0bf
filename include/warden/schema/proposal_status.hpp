#pragma once

#include <cstdint>

// Schema type: proposal status.
// Governance workflow: proposal lifecycle. Unknown ids read as not_started;
// executed and cancelled are terminal. Expiry is a read-time gate, not a
// status.
namespace warden::schema {

enum class proposal_status_t : uint8_t {
  not_started = 0,
  proposed = 1,
  executed = 2,
  cancelled = 3
};

}  // namespace warden::schema
