#pragma once
#include <warden/schema/primitives.hpp>
#include <warden/schema/proposal_state.hpp>
#include <warden/schema/transaction_error_code.hpp>
#include <warden/state/overlay.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace warden::governance {

/// Re-entry surface a call target sees while a batch is running.
class governance_host {
 public:
  virtual ~governance_host() = default;

  /// Execute another proposal from inside the running batch. Its effects
  /// join the enclosing batch and roll back with it.
  virtual std::optional<warden::schema::transaction_error_t> execute(
      warden::schema::proposal_id_t proposal_id,
      const warden::schema::signer_id_t& caller) = 0;

  /// Proposal as seen from inside the running batch.
  virtual warden::schema::proposal_state_t proposal(
      warden::schema::proposal_id_t proposal_id) const = 0;
};

struct call_context final {
  /// Target-private state; writes roll back with the batch.
  warden::state::prefixed_view& state;
  governance_host& host;
  warden::schema::account_id_t wallet_address{};
  warden::schema::account_id_t target{};
  warden::schema::proposal_id_t proposal_id{};
  warden::schema::timestamp_milliseconds_t now{};
};

struct call_result final {
  bool success{true};
  std::string log;
};

/// External operation reachable from a batched call.
///
/// A `false` result or a thrown exception fails the whole batch.
class call_target {
 public:
  virtual ~call_target() = default;

  virtual call_result invoke(call_context& context,
                             const warden::schema::amount_t& value,
                             const warden::schema::bytes_view_t& payload) = 0;
};

/// Call targets keyed by account id.
class call_target_registry final {
 public:
  void register_target(const warden::schema::account_id_t& account,
                       std::shared_ptr<call_target> target) {
    targets_[account] = std::move(target);
  }

  call_target* find(const warden::schema::account_id_t& account) const {
    auto it = targets_.find(account);
    return it == std::end(targets_) ? nullptr : it->second.get();
  }

 private:
  std::map<warden::schema::account_id_t, std::shared_ptr<call_target>>
      targets_;
};

}  // namespace warden::governance
