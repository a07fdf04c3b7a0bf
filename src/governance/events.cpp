#include <warden/governance/events.hpp>

#include <string>

using namespace warden::schema;

namespace warden::governance {

namespace {

transaction_event_attribute_t make_attribute(const std::string_view key,
                                             std::string value) {
  return transaction_event_attribute_t{
      .key = std::string{key}, .value = std::move(value), .index = true};
}

transaction_event_t make_event(const std::string_view type) {
  auto event = transaction_event_t{};
  event.type = std::string{type};
  return event;
}

}  // namespace

transaction_event_t make_signer_added_event(const signer_id_t& signer) {
  auto event = make_event(kSignerAddedEvent);
  event.attributes.push_back(make_attribute("signer", to_string(signer)));
  return event;
}

transaction_event_t make_signer_removed_event(const signer_id_t& signer) {
  auto event = make_event(kSignerRemovedEvent);
  event.attributes.push_back(make_attribute("signer", to_string(signer)));
  return event;
}

transaction_event_t make_proposal_created_event(
    const proposal_id_t proposal_id,
    const signer_id_t& proposer,
    const timestamp_milliseconds_t expires_at,
    const std::size_t call_count) {
  auto event = make_event(kProposalCreatedEvent);
  event.attributes.push_back(
      make_attribute("proposal_id", std::to_string(proposal_id)));
  event.attributes.push_back(make_attribute("proposer", to_string(proposer)));
  event.attributes.push_back(
      make_attribute("expires_at", std::to_string(expires_at)));
  auto calls = make_attribute("calls", std::to_string(call_count));
  calls.index = false;
  event.attributes.push_back(std::move(calls));
  return event;
}

transaction_event_t make_vote_cast_event(const proposal_id_t proposal_id,
                                         const signer_id_t& voter) {
  auto event = make_event(kVoteCastEvent);
  event.attributes.push_back(
      make_attribute("proposal_id", std::to_string(proposal_id)));
  event.attributes.push_back(make_attribute("voter", to_string(voter)));
  return event;
}

transaction_event_t make_vote_retracted_event(const proposal_id_t proposal_id,
                                              const signer_id_t& voter) {
  auto event = make_event(kVoteRetractedEvent);
  event.attributes.push_back(
      make_attribute("proposal_id", std::to_string(proposal_id)));
  event.attributes.push_back(make_attribute("voter", to_string(voter)));
  return event;
}

transaction_event_t make_proposal_cancelled_event(
    const proposal_id_t proposal_id) {
  auto event = make_event(kProposalCancelledEvent);
  event.attributes.push_back(
      make_attribute("proposal_id", std::to_string(proposal_id)));
  return event;
}

transaction_event_t make_proposal_executed_event(
    const proposal_id_t proposal_id,
    const signer_id_t& caller) {
  auto event = make_event(kProposalExecutedEvent);
  event.attributes.push_back(
      make_attribute("proposal_id", std::to_string(proposal_id)));
  event.attributes.push_back(make_attribute("caller", to_string(caller)));
  return event;
}

std::string_view attribute_value(const transaction_event_t& event,
                                 const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return {};
}

}  // namespace warden::governance
