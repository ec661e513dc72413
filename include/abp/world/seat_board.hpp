#pragma once

/// @file seat_board.hpp
/// @brief In-memory world state: seats, stage and conversations.

#include <array>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "abp/behavior/behavior_catalog.hpp"
#include "abp/behavior/behavior_controller.hpp"
#include "abp/behavior/plan_types.hpp"
#include "abp/foundation/types.hpp"

namespace abp::world {

using foundation::EntityId;

/// Single-process registry of shared resources.
///
/// Each seat area holds a fixed number of slots sized from the catalog
/// capacities at construction. An entity holds at most one slot per
/// area; claiming again returns the slot it already has.
class SeatBoard : public behavior::IWorldState {
public:
    explicit SeatBoard(const behavior::BehaviorCatalog& catalog = behavior::BehaviorCatalog::Default());

    // IWorldState
    std::optional<uint32_t> ClaimSeat(behavior::SeatArea area, EntityId entity) override;
    void ReleaseSeat(behavior::SeatArea area, EntityId entity) override;
    [[nodiscard]] behavior::AvailabilitySnapshot Snapshot() const override;

    /// Release every seat @p entity holds.
    void ReleaseAll(EntityId entity);

    [[nodiscard]] uint32_t Occupancy(behavior::SeatArea area) const noexcept;
    [[nodiscard]] uint32_t Capacity(behavior::SeatArea area) const noexcept;

    /// Occupant of a seat slot, if any.
    [[nodiscard]] std::optional<EntityId> SeatHolder(behavior::SeatArea area, uint32_t index) const;

    // -- Stage ---------------------------------------------------------------

    void SetStagePerformer(EntityId entity);
    void ClearStagePerformer() noexcept { performer_.reset(); }
    [[nodiscard]] std::optional<EntityId> StagePerformer() const noexcept { return performer_; }

    // -- Conversations -------------------------------------------------------

    /// Pair two entities. Either one already talking is first released
    /// from its previous conversation. Returns false for a self-pairing.
    bool StartConversation(EntityId a, EntityId b);

    /// End the conversation @p entity takes part in (both sides leave).
    void EndConversation(EntityId entity);

    [[nodiscard]] bool InConversation(EntityId entity) const;
    [[nodiscard]] std::optional<EntityId> ConversationPartner(EntityId entity) const;

private:
    using Slots = std::vector<std::optional<EntityId>>;

    [[nodiscard]] Slots& slots(behavior::SeatArea area) noexcept {
        return seats_[behavior::ToIndex(area)];
    }
    [[nodiscard]] const Slots& slots(behavior::SeatArea area) const noexcept {
        return seats_[behavior::ToIndex(area)];
    }

    std::array<Slots, behavior::kSeatAreaCount> seats_;
    std::optional<EntityId> performer_;
    std::unordered_map<EntityId, EntityId> partners_;
};

}  // namespace abp::world
