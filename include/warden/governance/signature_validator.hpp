#pragma once
#include <warden/schema/primitives.hpp>
#include <map>
#include <memory>

namespace warden::governance {

/// Delegated signature policy for a signer. Consulted when the signer holds
/// no raw key, or when its key does not match the signature.
///
/// Implementations may throw; the authorizer treats any exception the same
/// as a `false` answer.
class signature_validator {
 public:
  virtual ~signature_validator() = default;

  virtual bool is_valid_signature(
      const warden::schema::hash32_t& digest,
      const warden::schema::bytes_view_t& signature) const = 0;
};

/// Validators keyed by the signer they speak for.
class validator_registry final {
 public:
  void register_validator(const warden::schema::signer_id_t& signer,
                          std::shared_ptr<const signature_validator> validator) {
    validators_[signer] = std::move(validator);
  }

  const signature_validator* find(
      const warden::schema::signer_id_t& signer) const {
    auto it = validators_.find(signer);
    return it == std::end(validators_) ? nullptr : it->second.get();
  }

 private:
  std::map<warden::schema::signer_id_t,
           std::shared_ptr<const signature_validator>>
      validators_;
};

}  // namespace warden::governance
