#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <warden/blake3/hash.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/execution/engine.hpp>
#include <warden/governance/proposal_store.hpp>
#include <warden/governance/signature_authorizer.hpp>
#include <warden/governance/signer_registry.hpp>
#include <warden/governance/vote_ledger.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/encoding/scale/transaction.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/schema/query_error_code.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace warden::schema;

namespace {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

inline constexpr auto kQueryCodespace = std::string_view{"warden.query"};
inline constexpr uint64_t kMaxEventRange = 1000;

/// Registry, proposals and votes over one overlay. Not movable: the
/// components hold references to `view` and to each other.
struct wallet_context final {
  wallet_context(const warden::state::reader& parent, encoder_t& encoder)
      : view{parent},
        registry{view, encoder},
        proposals{view, encoder, registry},
        ledger{view, encoder, registry, proposals} {}

  wallet_context(const wallet_context&) = delete;
  wallet_context& operator=(const wallet_context&) = delete;

  warden::state::overlay view;
  warden::governance::signer_registry registry;
  warden::governance::proposal_store proposals;
  warden::governance::vote_ledger ledger;
};

warden::schema::hash32_t fold_state_root(const warden::schema::hash32_t& seed,
                                         const warden::schema::bytes_t& tx,
                                         uint64_t height,
                                         uint64_t index) {
  auto material = warden::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return warden::blake3::hash(
      warden::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<warden::schema::transaction_t> decode_transaction(
    const warden::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<warden::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "undecodable transaction envelope";
  }
  return tx;
}

transaction_result_t make_error_result(const transaction_error_t& error) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(error.code);
  result.log = error.log;
  result.codespace = std::string{codespace_of(error.code)};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                const std::string_view log,
                                const bytes_view_t& key,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.codespace = std::string{kQueryCodespace};
  result.key = make_bytes(key);
  result.height = height;
  return result;
}

}  // namespace

namespace warden::execution {

engine::engine(encoder_t& encoder, storage_t& storage, engine_options options)
    : encoder_{encoder},
      storage_{storage},
      options_{options},
      committed_{storage},
      pending_{committed_} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  if (!options_.require_strict_crypto) {
    spdlog::warn("Strict crypto disabled; envelope signatures are not checked");
  }
  spdlog::info("Execution engine ready at height {}", last_committed_height_);
}

transaction_result_t engine::init_wallet(const wallet_genesis_t& genesis) {
  auto lock = std::scoped_lock{mutex_};
  auto context = wallet_context{pending_, encoder_};
  auto events = warden::governance::event_list_t{};
  if (auto error = context.registry.initialize(genesis, events)) {
    spdlog::error("Wallet genesis rejected: {}", error->log);
    return make_error_result(*error);
  }
  append_events(context.view, static_cast<uint64_t>(pending_height_), 0,
                events);
  pending_.merge(std::move(context.view));
  pending_state_root_ =
      fold_state_root(pending_state_root_, encoder_.encode(genesis), 0, 0);
  spdlog::info("Wallet {} initialized with {} signer(s)",
               to_hex(bytes_view_t{genesis.domain.wallet_address}),
               genesis.signers.size());

  auto result = transaction_result_t{};
  result.info = "wallet initialized";
  result.events = std::move(events);
  return result;
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    auto result = make_error_result(transaction_error_t{
        transaction_error_code::invalid_transaction, "invalid transaction"});
    result.info = decode_error;
    return result;
  }
  if (auto error = validate_transaction(pending_, *maybe_tx)) {
    return make_error_result(*error);
  }
  return transaction_result_t{};
}

block_result_t engine::finalize_block(
    uint64_t height,
    timestamp_milliseconds_t block_time,
    const std::vector<warden::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  current_block_time_ms_ = block_time;

  auto rolling_hash = pending_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(bytes_view_t{txs[i]}, decode_error);
    if (!maybe_tx) {
      auto tx_result = make_error_result(transaction_error_t{
          transaction_error_code::invalid_transaction, "invalid transaction"});
      tx_result.info = decode_error;
      result.tx_results.push_back(std::move(tx_result));
      continue;
    }
    if (auto error = validate_transaction(pending_, *maybe_tx)) {
      result.tx_results.push_back(make_error_result(*error));
      continue;
    }

    auto tx_state = warden::state::overlay{pending_};
    auto events = warden::governance::event_list_t{};
    auto outcome = execute_operation(tx_state, *maybe_tx, events);
    auto tx_result = outcome.error ? make_error_result(*outcome.error)
                                   : transaction_result_t{};
    if (!outcome.error || outcome.persist_on_error) {
      auto sequence_key = key::make_sequence_key(encoder_, maybe_tx->signer);
      auto next = warden::state::get<uint64_t>(encoder_, tx_state,
                                               bytes_view_t{sequence_key})
                      .value_or(0) +
                  1;
      warden::state::put(encoder_, tx_state, bytes_view_t{sequence_key}, next);
      if (!outcome.error) {
        append_events(tx_state, height, static_cast<uint32_t>(i), events);
        tx_result.data = std::move(outcome.data);
        tx_result.events = std::move(events);
      }
      pending_.merge(std::move(tx_state));
      rolling_hash = fold_state_root(rolling_hash, txs[i], height, i);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_hash;
  result.state_root = rolling_hash;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > last_committed_height_) {
    last_committed_height_ = pending_height_;
  }
  last_committed_state_root_ = pending_state_root_;

  storage_.commit(
      pending_.pending(),
      warden::storage::committed_state{
          .height = last_committed_height_,
          .state_root = last_committed_state_root_});
  pending_.clear();
  spdlog::debug("Committed height {}", last_committed_height_);

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  return make_info();
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto context = wallet_context{pending_, encoder_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;

  auto invalid_key = [&]() {
    return make_query_error(query_error_code::invalid_key, "invalid key", data,
                            last_committed_height_);
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(make_info());
    return result;
  }

  auto config = context.registry.config();
  if (!config) {
    return make_query_error(query_error_code::wallet_not_initialized,
                            "wallet not initialized", data,
                            last_committed_height_);
  }

  if (path == "/wallet/domain") {
    result.value = encoder_.encode(config->domain);
  } else if (path == "/wallet/signers") {
    result.value = encoder_.encode(context.registry.list());
  } else if (path == "/wallet/signer_count") {
    result.value = encoder_.encode(context.registry.count());
  } else if (path == "/wallet/is_signer") {
    auto signer = encoder_.try_decode<signer_id_t>(data);
    if (!signer) {
      return invalid_key();
    }
    result.value = encoder_.encode(context.registry.is_signer(*signer));
  } else if (path == "/wallet/vote_nonce") {
    auto signer = encoder_.try_decode<signer_id_t>(data);
    if (!signer) {
      return invalid_key();
    }
    auto authorizer = warden::governance::signature_authorizer{
        context.view, encoder_, context.registry, validators_};
    result.value = encoder_.encode(authorizer.nonce(*signer));
  } else if (path == "/wallet/sequence") {
    auto signer = encoder_.try_decode<signer_id_t>(data);
    if (!signer) {
      return invalid_key();
    }
    auto sequence_key = key::make_sequence_key(encoder_, *signer);
    result.value = encoder_.encode(
        warden::state::get<uint64_t>(encoder_, context.view,
                                     bytes_view_t{sequence_key})
            .value_or(0));
  } else if (path == "/proposal/state") {
    auto proposal_id = encoder_.try_decode<proposal_id_t>(data);
    if (!proposal_id) {
      return invalid_key();
    }
    auto proposal = context.proposals.get(*proposal_id);
    if (proposal.status == proposal_status_t::not_started) {
      return make_query_error(query_error_code::not_found, "proposal not found",
                              data, last_committed_height_);
    }
    result.value = encoder_.encode(proposal);
  } else if (path == "/proposal/count") {
    result.value = encoder_.encode(context.proposals.count());
  } else if (path == "/proposal/has_voted") {
    auto decoded =
        encoder_.try_decode<std::tuple<proposal_id_t, signer_id_t>>(data);
    if (!decoded) {
      return invalid_key();
    }
    result.value = encoder_.encode(context.ledger.has_voted_yes(
        std::get<0>(*decoded), std::get<1>(*decoded)));
  } else if (path == "/proposal/yes_voters") {
    auto proposal_id = encoder_.try_decode<proposal_id_t>(data);
    if (!proposal_id) {
      return invalid_key();
    }
    result.value = encoder_.encode(context.ledger.yes_voter_history(*proposal_id));
  } else if (path == "/proposal/valid_yes_count") {
    auto proposal_id = encoder_.try_decode<proposal_id_t>(data);
    if (!proposal_id) {
      return invalid_key();
    }
    result.value = encoder_.encode(context.ledger.valid_yes_count(*proposal_id));
  } else if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range || std::get<0>(*range) > std::get<1>(*range)) {
      return invalid_key();
    }
    result.value = encoder_.encode(
        read_events(context.view, std::get<0>(*range), std::get<1>(*range)));
  } else {
    return make_query_error(query_error_code::unsupported_path,
                            "unsupported path", data, last_committed_height_);
  }
  return result;
}

std::vector<event_record_t> engine::events(uint64_t from_id,
                                           uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  return read_events(pending_, from_id, to_id);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!options_.require_strict_crypto) {
    spdlog::warn("Ignoring signature verifier override: strict crypto off");
    return;
  }
  signature_verifier_ = std::move(verifier);
  signature_verifier_overridden_ = true;
}

void engine::register_call_target(
    const account_id_t& account,
    std::shared_ptr<warden::governance::call_target> target) {
  auto lock = std::scoped_lock{mutex_};
  call_targets_.register_target(account, std::move(target));
}

void engine::register_signature_validator(
    const signer_id_t& signer,
    std::shared_ptr<const warden::governance::signature_validator> validator) {
  auto lock = std::scoped_lock{mutex_};
  validators_.register_validator(signer, std::move(validator));
}

std::vector<signer_id_t> engine::signers() const {
  auto lock = std::scoped_lock{mutex_};
  return wallet_context{pending_, encoder_}.registry.list();
}

uint64_t engine::signer_count() const {
  auto lock = std::scoped_lock{mutex_};
  return wallet_context{pending_, encoder_}.registry.count();
}

bool engine::is_signer(const signer_id_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  return wallet_context{pending_, encoder_}.registry.is_signer(signer);
}

std::optional<domain_info_t> engine::domain() const {
  auto lock = std::scoped_lock{mutex_};
  auto config = wallet_context{pending_, encoder_}.registry.config();
  if (!config) {
    return std::nullopt;
  }
  return config->domain;
}

proposal_state_t engine::proposal(const proposal_id_t proposal_id) const {
  auto lock = std::scoped_lock{mutex_};
  return wallet_context{pending_, encoder_}.proposals.get(proposal_id);
}

uint64_t engine::proposal_count() const {
  auto lock = std::scoped_lock{mutex_};
  return wallet_context{pending_, encoder_}.proposals.count();
}

bool engine::has_voted(const proposal_id_t proposal_id,
                       const signer_id_t& voter) const {
  auto lock = std::scoped_lock{mutex_};
  return wallet_context{pending_, encoder_}.ledger.has_voted_yes(proposal_id,
                                                                 voter);
}

std::vector<signer_id_t> engine::yes_voter_history(
    const proposal_id_t proposal_id) const {
  auto lock = std::scoped_lock{mutex_};
  return wallet_context{pending_, encoder_}.ledger.yes_voter_history(
      proposal_id);
}

uint64_t engine::valid_yes_count(const proposal_id_t proposal_id) const {
  auto lock = std::scoped_lock{mutex_};
  return wallet_context{pending_, encoder_}.ledger.valid_yes_count(
      proposal_id);
}

uint64_t engine::vote_nonce(const signer_id_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  auto context = wallet_context{pending_, encoder_};
  return warden::governance::signature_authorizer{context.view, encoder_,
                                                  context.registry, validators_}
      .nonce(signer);
}

uint64_t engine::sequence(const signer_id_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  auto sequence_key = key::make_sequence_key(encoder_, signer);
  return warden::state::get<uint64_t>(encoder_, pending_,
                                      bytes_view_t{sequence_key})
      .value_or(0);
}

std::optional<transaction_error_t> engine::validate_transaction(
    const warden::state::reader& view,
    const transaction_t& tx) {
  if (tx.version != 1) {
    return transaction_error_t{
        transaction_error_code::unsupported_transaction_version,
        "expected version 1"};
  }
  auto config_key = key::make_wallet_config_key(encoder_);
  auto config = warden::state::get<wallet_config_t>(encoder_, view,
                                                    bytes_view_t{config_key});
  if (!config) {
    return transaction_error_t{transaction_error_code::wallet_not_initialized,
                               "wallet not initialized"};
  }
  if (tx.chain_id != config->domain.chain_id) {
    return transaction_error_t{transaction_error_code::invalid_chain_id,
                               "chain id mismatch"};
  }
  auto sequence_key = key::make_sequence_key(encoder_, tx.signer);
  auto expected =
      warden::state::get<uint64_t>(encoder_, view, bytes_view_t{sequence_key})
          .value_or(0);
  if (tx.sequence != expected) {
    return transaction_error_t{
        transaction_error_code::invalid_sequence,
        "expected sequence " + std::to_string(expected) + ", got " +
            std::to_string(tx.sequence)};
  }

  if (options_.require_strict_crypto) {
    auto signing_bytes = encoder_.encode(
        std::tuple{tx.version, tx.chain_id, tx.sequence, tx.signer, tx.payload});
    auto message = warden::blake3::hash(bytes_view_t{signing_bytes});
    auto verified =
        signature_verifier_overridden_
            ? signature_verifier_(bytes_view_t{message}, tx.signer,
                                  tx.signature)
            : warden::crypto::verify_signature(bytes_view_t{message},
                                               tx.signer, tx.signature);
    if (!verified) {
      return transaction_error_t{
          transaction_error_code::signature_verification_failed,
          "envelope signature rejected"};
    }
  }
  return std::nullopt;
}

engine::operation_outcome engine::execute_operation(
    warden::state::overlay& tx_state,
    const transaction_t& tx,
    warden::governance::event_list_t& events) {
  auto outcome = operation_outcome{};
  auto context = wallet_context{tx_state, encoder_};
  auto now = current_block_time_ms_;

  auto require_signer = [&]() -> std::optional<transaction_error_t> {
    if (!context.registry.is_signer(tx.signer)) {
      return transaction_error_t{transaction_error_code::not_a_signer,
                                 "sender is not a signer"};
    }
    return std::nullopt;
  };

  std::visit(
      overloaded{
          [&](const propose_t& value) {
            auto created = context.proposals.create(
                tx.signer, value.calls, value.expires_at, now, context.ledger,
                events);
            if (auto* error = std::get_if<transaction_error_t>(&created)) {
              outcome.error = *error;
              return;
            }
            outcome.data = encoder_.encode(std::get<proposal_id_t>(created));
          },
          [&](const vote_for_t& value) {
            outcome.error = require_signer();
            if (!outcome.error) {
              outcome.error = context.ledger.cast_yes(value.proposal_id,
                                                      tx.signer, now, events);
            }
          },
          [&](const cancel_vote_for_t& value) {
            outcome.error = require_signer();
            if (!outcome.error) {
              outcome.error = context.ledger.retract_yes(value.proposal_id,
                                                         tx.signer, events);
            }
          },
          [&](const vote_on_behalf_of_t& value) {
            auto authorizer = warden::governance::signature_authorizer{
                context.view, encoder_, context.registry, validators_};
            auto authorized = authorizer.authorize(
                value.proposal_id, value.support, value.voter,
                bytes_view_t{value.signature}, context.ledger, now, events);
            outcome.error = std::move(authorized.error);
            outcome.persist_on_error = authorized.nonce_consumed;
          },
          [&](const execute_proposal_t& value) {
            auto executor = warden::governance::proposal_executor{
                context.view,  encoder_, call_targets_,
                now,           events,   options_.max_call_depth};
            outcome.error = executor.execute(value.proposal_id, tx.signer);
          },
          [&](const cancel_proposal_t& value) {
            outcome.error =
                context.proposals.cancel(value.proposal_id, tx.signer, events);
          },
          [&](const add_signer_t&) {
            outcome.error = transaction_error_t{
                transaction_error_code::not_governance_path,
                "signer changes require an executed proposal"};
          },
          [&](const remove_signer_t&) {
            outcome.error = transaction_error_t{
                transaction_error_code::not_governance_path,
                "signer changes require an executed proposal"};
          }},
      tx.payload);

  if (outcome.error) {
    spdlog::debug("Transaction from {} rejected: {}", to_string(tx.signer),
                  outcome.error->log);
  }
  if (!outcome.error || outcome.persist_on_error) {
    tx_state.merge(std::move(context.view));
  }
  return outcome;
}

void engine::append_events(warden::state::overlay& view,
                           uint64_t height,
                           uint32_t tx_index,
                           const warden::governance::event_list_t& events) {
  if (events.empty()) {
    return;
  }
  auto seq_key = key::make_event_sequence_key(encoder_);
  auto next_id =
      warden::state::get<uint64_t>(encoder_, view, bytes_view_t{seq_key})
          .value_or(0);
  for (const auto& event : events) {
    auto record = event_record_t{};
    record.event_id = next_id;
    record.height = height;
    record.tx_index = tx_index;
    record.event = event;
    auto event_key = key::make_event_key(encoder_, next_id);
    warden::state::put(encoder_, view, bytes_view_t{event_key}, record);
    ++next_id;
  }
  warden::state::put(encoder_, view, bytes_view_t{seq_key}, next_id);
}

std::vector<event_record_t> engine::read_events(
    const warden::state::reader& view,
    uint64_t from_id,
    uint64_t to_id) const {
  auto records = std::vector<event_record_t>{};
  auto seq_key = key::make_event_sequence_key(encoder_);
  auto next_id =
      warden::state::get<uint64_t>(encoder_, view, bytes_view_t{seq_key})
          .value_or(0);
  if (next_id == 0 || from_id >= next_id) {
    return records;
  }
  to_id = std::min({to_id, next_id - 1, from_id + kMaxEventRange - 1});
  for (auto id = from_id; id <= to_id; ++id) {
    auto event_key = key::make_event_key(encoder_, id);
    if (auto record = warden::state::get<event_record_t>(
            encoder_, view, bytes_view_t{event_key})) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

app_info_t engine::make_info() const {
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  auto config_key = key::make_wallet_config_key(encoder_);
  result.wallet_initialized = pending_.read(bytes_view_t{config_key}).has_value();
  return result;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_height_ = committed->height;
    pending_state_root_ = committed->state_root;
  }
}

}  // namespace warden::execution
