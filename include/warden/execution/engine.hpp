#pragma once

#include <warden/execution/signature_verifier.hpp>
#include <warden/governance/call_target.hpp>
#include <warden/governance/proposal_executor.hpp>
#include <warden/governance/signature_validator.hpp>
#include <warden/schema/app_info.hpp>
#include <warden/schema/block_result.hpp>
#include <warden/schema/commit_result.hpp>
#include <warden/schema/domain_info.hpp>
#include <warden/schema/encoding/encoder.hpp>
#include <warden/schema/event_record.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/proposal_state.hpp>
#include <warden/schema/query_result.hpp>
#include <warden/schema/transaction.hpp>
#include <warden/schema/transaction_error_code.hpp>
#include <warden/schema/transaction_result.hpp>
#include <warden/schema/wallet_config.hpp>
#include <warden/state/overlay.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::execution {

struct engine_options final {
  /// Verify envelope signatures. When false, envelopes are trusted as
  /// submitted (PoC and test mode); vote signatures are always verified.
  bool require_strict_crypto{true};
  /// Bound on nested proposal execution through call targets.
  uint32_t max_call_depth{warden::governance::kDefaultMaxCallDepth};
};

/// Deterministic multisig wallet state machine.
///
/// One engine is one wallet instance. Transactions arrive in ordered blocks;
/// each runs in its own overlay on top of the block's pending state and is
/// either merged whole or discarded. `commit` persists the pending state to
/// storage in one batch.
class engine final {
 public:
  /// Construct the engine with encoder/storage backends and runtime options.
  explicit engine(
      warden::schema::encoding::encoder<
          warden::schema::encoding::scale_encoder_tag>& encoder,
      warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage,
      engine_options options = {});

  /// Install domain, signer bound and initial signers. Part of the pending
  /// state until the next commit.
  warden::schema::transaction_result_t init_wallet(
      const warden::schema::wallet_genesis_t& genesis);

  /// Admit a transaction for inclusion (CheckTx semantics).
  ///
  /// Runs envelope validation only; does not mutate application state.
  warden::schema::transaction_result_t check_transaction(
      const warden::schema::bytes_view_t& raw_tx);

  /// Execute a block and compute its resulting state_root.
  ///
  /// Transactions are processed in-order against `block_time` as the current
  /// time; per-tx results are returned even on failures.
  warden::schema::block_result_t finalize_block(
      uint64_t height,
      warden::schema::timestamp_milliseconds_t block_time,
      const std::vector<warden::schema::bytes_t>& txs);

  /// Commit the pending state to durable storage.
  warden::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  warden::schema::app_info_t info() const;

  /// Execute a read-path query by route. Keys and values are SCALE encoded.
  warden::schema::query_result_t query(
      std::string_view path,
      const warden::schema::bytes_view_t& data);

  /// Event log entries with ids in [from_id, to_id].
  std::vector<warden::schema::event_record_t> events(uint64_t from_id,
                                                     uint64_t to_id) const;

  /// Install runtime signature verifier callback for envelopes.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Route batched calls addressed to `account` to `target`.
  ///
  /// Targets run while the engine lock is held: a target must not call back
  /// into this engine's public methods, or it deadlocks. Nested execution
  /// goes through `call_context::host` instead.
  void register_call_target(
      const warden::schema::account_id_t& account,
      std::shared_ptr<warden::governance::call_target> target);

  /// Delegate vote signature checks for `signer` to `validator`.
  ///
  /// Validators run while the engine lock is held and must not call back
  /// into this engine.
  void register_signature_validator(
      const warden::schema::signer_id_t& signer,
      std::shared_ptr<const warden::governance::signature_validator>
          validator);

  std::vector<warden::schema::signer_id_t> signers() const;
  uint64_t signer_count() const;
  bool is_signer(const warden::schema::signer_id_t& signer) const;
  std::optional<warden::schema::domain_info_t> domain() const;
  warden::schema::proposal_state_t proposal(
      warden::schema::proposal_id_t proposal_id) const;
  uint64_t proposal_count() const;
  bool has_voted(warden::schema::proposal_id_t proposal_id,
                 const warden::schema::signer_id_t& voter) const;
  std::vector<warden::schema::signer_id_t> yes_voter_history(
      warden::schema::proposal_id_t proposal_id) const;
  uint64_t valid_yes_count(warden::schema::proposal_id_t proposal_id) const;
  uint64_t vote_nonce(const warden::schema::signer_id_t& signer) const;
  /// Next envelope sequence expected from `signer`.
  uint64_t sequence(const warden::schema::signer_id_t& signer) const;

 private:
  using encoder_t = warden::schema::encoding::encoder<
      warden::schema::encoding::scale_encoder_tag>;
  using storage_t =
      warden::storage::storage<warden::storage::rocksdb_storage_tag>;

  struct operation_outcome final {
    std::optional<warden::schema::transaction_error_t> error;
    /// Keep the transaction's state even though `error` is set.
    bool persist_on_error{false};
    warden::schema::bytes_t data;
  };

  /// Validate envelope version, chain, sequence and signature.
  std::optional<warden::schema::transaction_error_t> validate_transaction(
      const warden::state::reader& view,
      const warden::schema::transaction_t& tx);

  /// Execute a validated transaction payload inside `tx_state`.
  operation_outcome execute_operation(
      warden::state::overlay& tx_state,
      const warden::schema::transaction_t& tx,
      warden::governance::event_list_t& events);

  void append_events(warden::state::overlay& view,
                     uint64_t height,
                     uint32_t tx_index,
                     const warden::governance::event_list_t& events);

  std::vector<warden::schema::event_record_t> read_events(
      const warden::state::reader& view,
      uint64_t from_id,
      uint64_t to_id) const;

  warden::schema::app_info_t make_info() const;

  /// Load committed state from storage at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  engine_options options_;
  warden::state::committed_reader<storage_t> committed_;
  warden::state::overlay pending_;
  int64_t last_committed_height_{};
  warden::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  warden::schema::hash32_t pending_state_root_{};
  warden::schema::timestamp_milliseconds_t current_block_time_ms_{};
  bool signature_verifier_overridden_{false};
  signature_verifier_t signature_verifier_;
  warden::governance::call_target_registry call_targets_;
  warden::governance::validator_registry validators_;
};

}  // namespace warden::execution
