#pragma once
#include <warden/schema/encoding/scale/add_signer.hpp>
#include <warden/schema/encoding/scale/cancel_proposal.hpp>
#include <warden/schema/encoding/scale/remove_signer.hpp>
#include <warden/schema/governance_call.hpp>
