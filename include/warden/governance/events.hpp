#pragma once
#include <warden/schema/primitives.hpp>
#include <warden/schema/transaction_event.hpp>
#include <string_view>

namespace warden::governance {

inline constexpr auto kSignerAddedEvent = std::string_view{"signer_added"};
inline constexpr auto kSignerRemovedEvent = std::string_view{"signer_removed"};
inline constexpr auto kProposalCreatedEvent =
    std::string_view{"proposal_created"};
inline constexpr auto kVoteCastEvent = std::string_view{"vote_cast"};
inline constexpr auto kVoteRetractedEvent = std::string_view{"vote_retracted"};
inline constexpr auto kProposalCancelledEvent =
    std::string_view{"proposal_cancelled"};
inline constexpr auto kProposalExecutedEvent =
    std::string_view{"proposal_executed"};

warden::schema::transaction_event_t make_signer_added_event(
    const warden::schema::signer_id_t& signer);
warden::schema::transaction_event_t make_signer_removed_event(
    const warden::schema::signer_id_t& signer);
warden::schema::transaction_event_t make_proposal_created_event(
    warden::schema::proposal_id_t proposal_id,
    const warden::schema::signer_id_t& proposer,
    warden::schema::timestamp_milliseconds_t expires_at,
    std::size_t call_count);
warden::schema::transaction_event_t make_vote_cast_event(
    warden::schema::proposal_id_t proposal_id,
    const warden::schema::signer_id_t& voter);
warden::schema::transaction_event_t make_vote_retracted_event(
    warden::schema::proposal_id_t proposal_id,
    const warden::schema::signer_id_t& voter);
warden::schema::transaction_event_t make_proposal_cancelled_event(
    warden::schema::proposal_id_t proposal_id);
warden::schema::transaction_event_t make_proposal_executed_event(
    warden::schema::proposal_id_t proposal_id,
    const warden::schema::signer_id_t& caller);

/// Value of the first attribute named `key`, or empty when absent.
std::string_view attribute_value(const warden::schema::transaction_event_t& event,
                                 std::string_view key);

}  // namespace warden::governance
