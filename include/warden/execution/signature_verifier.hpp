#pragma once

#include <warden/schema/primitives.hpp>
#include <functional>

namespace warden::execution {

using signature_verifier_t =
    std::function<bool(const warden::schema::bytes_view_t& message,
                       const warden::schema::signer_id_t& signer,
                       const warden::schema::signature_t& signature)>;

}  // namespace warden::execution
