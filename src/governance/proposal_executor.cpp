#include <spdlog/spdlog.h>
#include <warden/governance/events.hpp>
#include <warden/governance/proposal_executor.hpp>
#include <warden/governance/vote_ledger.hpp>
#include <warden/schema/governance_call.hpp>
#include <warden/schema/key/engine_keys.hpp>

#include <iterator>
#include <string>
#include <utility>

using namespace warden::schema;

namespace warden::governance {

namespace {

/// Points the executor at a nested batch for the lifetime of one execute.
class batch_frame final {
 public:
  batch_frame(warden::state::overlay*& current,
              event_list_t*& current_events,
              uint32_t& depth,
              warden::state::overlay& batch,
              event_list_t& events)
      : current_{current},
        current_events_{current_events},
        depth_{depth},
        saved_{current},
        saved_events_{current_events} {
    current_ = &batch;
    current_events_ = &events;
    ++depth_;
  }

  ~batch_frame() {
    current_ = saved_;
    current_events_ = saved_events_;
    --depth_;
  }

  batch_frame(const batch_frame&) = delete;
  batch_frame& operator=(const batch_frame&) = delete;

 private:
  warden::state::overlay*& current_;
  event_list_t*& current_events_;
  uint32_t& depth_;
  warden::state::overlay* saved_;
  event_list_t* saved_events_;
};

transaction_error_t call_error(const transaction_error_code code,
                               const std::size_t index,
                               const std::string_view reason) {
  return transaction_error_t{
      code, "call " + std::to_string(index) + ": " + std::string{reason}};
}

}  // namespace

proposal_executor::proposal_executor(warden::state::overlay& state,
                                     encoder_t& encoder,
                                     const call_target_registry& targets,
                                     const timestamp_milliseconds_t now,
                                     event_list_t& events,
                                     const uint32_t max_call_depth)
    : current_{&state},
      current_events_{&events},
      encoder_{encoder},
      targets_{targets},
      now_{now},
      max_call_depth_{max_call_depth} {}

std::optional<transaction_error_t> proposal_executor::execute(
    const proposal_id_t proposal_id,
    const signer_id_t& caller) {
  if (depth_ >= max_call_depth_) {
    return transaction_error_t{transaction_error_code::call_depth_exceeded,
                               "re-entrant execution too deep"};
  }

  auto& parent = *current_;
  auto& parent_events = *current_events_;
  auto batch = warden::state::overlay{parent};
  auto batch_events = event_list_t{};
  auto registry = signer_registry{batch, encoder_};
  auto proposals = proposal_store{batch, encoder_, registry};
  auto ledger = vote_ledger{batch, encoder_, registry, proposals};

  auto proposal = proposals.get(proposal_id);
  if (proposal.status != proposal_status_t::proposed) {
    return transaction_error_t{transaction_error_code::proposal_not_proposed,
                               "proposal is not open"};
  }
  if (now_ > proposal.expires_at) {
    return transaction_error_t{transaction_error_code::proposal_expired,
                               "proposal expired"};
  }

  auto valid = ledger.valid_yes_count(proposal_id);
  auto signers = registry.count();
  if (valid <= signers / 2) {
    return transaction_error_t{
        transaction_error_code::insufficient_votes,
        std::to_string(valid) + " valid yes vote(s) of " +
            std::to_string(signers) + " signer(s)"};
  }

  auto token = governance_token{proposal_id};
  if (auto error = proposals.mark_executed(token)) {
    return error;
  }

  {
    auto frame = batch_frame{current_, current_events_, depth_, batch,
                             batch_events};
    for (std::size_t i = 0; i < proposal.calls.size(); ++i) {
      auto error = run_call(proposal.calls[i], token, batch, registry,
                            proposals, batch_events);
      if (error) {
        spdlog::warn("Proposal {} rolled back at call {}: {}", proposal_id, i,
                     error->log);
        return call_error(error->code, i, error->log);
      }
    }
  }

  batch_events.push_back(make_proposal_executed_event(proposal_id, caller));
  parent.merge(std::move(batch));
  parent_events.insert(std::end(parent_events),
                       std::make_move_iterator(std::begin(batch_events)),
                       std::make_move_iterator(std::end(batch_events)));
  spdlog::info("Proposal {} executed with {} valid yes vote(s) of {}",
               proposal_id, valid, signers);
  return std::nullopt;
}

proposal_state_t proposal_executor::proposal(
    const proposal_id_t proposal_id) const {
  auto view = warden::state::overlay{*current_};
  auto registry = signer_registry{view, encoder_};
  return proposal_store{view, encoder_, registry}.get(proposal_id);
}

std::optional<transaction_error_t> proposal_executor::run_call(
    const call_t& call,
    const governance_token& token,
    warden::state::overlay& batch,
    signer_registry& registry,
    proposal_store& proposals,
    event_list_t& events) {
  auto config = registry.config();
  if (!config) {
    return transaction_error_t{transaction_error_code::wallet_not_initialized,
                               "wallet has no address"};
  }
  if (call.target == config->domain.wallet_address) {
    return run_governance_call(call, token, registry, proposals, events);
  }

  auto* target = targets_.find(call.target);
  if (target == nullptr) {
    return transaction_error_t{transaction_error_code::call_target_missing,
                               "no target registered at " +
                                   to_hex(bytes_view_t{call.target})};
  }

  auto view = warden::state::prefixed_view{
      batch, key::make_target_prefix_key(encoder_, call.target)};
  auto context = call_context{.state = view,
                              .host = *this,
                              .wallet_address = config->domain.wallet_address,
                              .target = call.target,
                              .proposal_id = token.proposal_id(),
                              .now = now_};
  try {
    auto result = target->invoke(context, call.value, bytes_view_t{call.payload});
    if (!result.success) {
      return transaction_error_t{transaction_error_code::call_failed,
                                 result.log};
    }
  } catch (const std::exception& e) {
    return transaction_error_t{transaction_error_code::call_failed, e.what()};
  } catch (...) {
    return transaction_error_t{transaction_error_code::call_failed,
                               "target raised a non-standard exception"};
  }
  return std::nullopt;
}

std::optional<transaction_error_t> proposal_executor::run_governance_call(
    const call_t& call,
    const governance_token& token,
    signer_registry& registry,
    proposal_store& proposals,
    event_list_t& events) {
  auto decoded =
      encoder_.try_decode<governance_call_t>(bytes_view_t{call.payload});
  if (!decoded) {
    return transaction_error_t{transaction_error_code::invalid_governance_call,
                               "undecodable governance call"};
  }

  auto error = std::optional<transaction_error_t>{};
  std::visit(overloaded{[&](const add_signer_t& value) {
                          error = registry.add_signer(token, value.signer,
                                                      events);
                        },
                        [&](const remove_signer_t& value) {
                          error = registry.remove_signer(token, value.signer,
                                                         events);
                        },
                        [&](const cancel_proposal_t& value) {
                          error = proposals.cancel(value.proposal_id, token,
                                                   events);
                        }},
             *decoded);
  return error;
}

}  // namespace warden::governance
