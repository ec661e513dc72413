/// @file seat_board.cpp
/// @brief SeatBoard implementation.

#include "abp/world/seat_board.hpp"

#include <algorithm>
#include <string>

#include "abp/foundation/planner_logger.hpp"

namespace abp::world {

using behavior::AvailabilitySnapshot;
using behavior::SeatArea;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

SeatBoard::SeatBoard(const behavior::BehaviorCatalog& catalog) {
    for (auto area : behavior::kAllSeatAreas) {
        slots(area).resize(catalog.Capacity(area));
    }
}

std::optional<uint32_t> SeatBoard::ClaimSeat(SeatArea area, EntityId entity) {
    auto& areaSlots = slots(area);

    auto held = std::find(areaSlots.begin(), areaSlots.end(), entity);
    if (held != areaSlots.end()) {
        return static_cast<uint32_t>(held - areaSlots.begin());
    }

    auto free = std::find(areaSlots.begin(), areaSlots.end(), std::nullopt);
    if (free == areaSlots.end()) {
        return std::nullopt;
    }
    *free = entity;

    auto index = static_cast<uint32_t>(free - areaSlots.begin());
    LogContext ctx;
    ctx.entityId = entity;
    ctx.extra["area"] = std::string(behavior::SeatAreaName(area));
    ctx.extra["seat"] = std::to_string(index);
    ABP_LOG_CTX(LogLevel::Trace, LogCategory::World, "Seat claimed", ctx);
    return index;
}

void SeatBoard::ReleaseSeat(SeatArea area, EntityId entity) {
    for (auto& slot : slots(area)) {
        if (slot == entity) {
            slot.reset();
        }
    }
}

void SeatBoard::ReleaseAll(EntityId entity) {
    for (auto area : behavior::kAllSeatAreas) {
        ReleaseSeat(area, entity);
    }
}

AvailabilitySnapshot SeatBoard::Snapshot() const {
    AvailabilitySnapshot snapshot;
    snapshot.stageOccupied = performer_.has_value();
    for (auto area : behavior::kAllSeatAreas) {
        snapshot.SetOccupancy(area, Occupancy(area));
    }
    return snapshot;
}

uint32_t SeatBoard::Occupancy(SeatArea area) const noexcept {
    const auto& areaSlots = slots(area);
    return static_cast<uint32_t>(
        std::count_if(areaSlots.begin(), areaSlots.end(),
                      [](const std::optional<EntityId>& slot) { return slot.has_value(); }));
}

uint32_t SeatBoard::Capacity(SeatArea area) const noexcept {
    return static_cast<uint32_t>(slots(area).size());
}

std::optional<EntityId> SeatBoard::SeatHolder(SeatArea area, uint32_t index) const {
    const auto& areaSlots = slots(area);
    if (index >= areaSlots.size()) {
        return std::nullopt;
    }
    return areaSlots[index];
}

void SeatBoard::SetStagePerformer(EntityId entity) {
    if (performer_ == entity) {
        return;
    }
    performer_ = entity;

    LogContext ctx;
    ctx.entityId = entity;
    ABP_LOG_CTX(LogLevel::Info, LogCategory::Stage, "Performer took the stage", ctx);
}

bool SeatBoard::StartConversation(EntityId a, EntityId b) {
    if (a == b) {
        return false;
    }
    EndConversation(a);
    EndConversation(b);
    partners_[a] = b;
    partners_[b] = a;
    return true;
}

void SeatBoard::EndConversation(EntityId entity) {
    auto it = partners_.find(entity);
    if (it == partners_.end()) {
        return;
    }
    auto partner = it->second;
    partners_.erase(it);
    partners_.erase(partner);
}

bool SeatBoard::InConversation(EntityId entity) const {
    return partners_.count(entity) > 0;
}

std::optional<EntityId> SeatBoard::ConversationPartner(EntityId entity) const {
    auto it = partners_.find(entity);
    if (it == partners_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace abp::world
