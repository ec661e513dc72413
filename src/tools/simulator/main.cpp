/// @file main.cpp
/// @brief Headless planner simulator.
///
/// Runs a crowd of entities on a flat floor for a fixed number of ticks
/// and prints how each of them spent its time.
///
/// Usage:
///   abp_simulator [--config <path>] [--override <entity>=<step>]...
///
/// Without --config (or ABP_CONFIG_PATH) the built-in tables are used.

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "abp/abp.hpp"
#include "command_line.hpp"
#include "console_logger.hpp"

namespace {

using abp::behavior::Archetype;
using abp::behavior::BehaviorCatalog;
using abp::behavior::BehaviorController;
using abp::behavior::DriverAction;
using abp::behavior::PlannerSettings;
using abp::behavior::PlanStep;
using abp::behavior::Position;
using abp::behavior::RandomStream;
using abp::behavior::ResolvedTarget;
using abp::behavior::StepKind;
using abp::foundation::ConfigManager;
using abp::foundation::EntityId;
using abp::foundation::ErrorCode;
using abp::foundation::PlannerError;
using abp::foundation::PlannerResult;

constexpr float kWalkSpeed = 1.5f;      // metres per second
constexpr float kStationSpacing = 2.5f;
constexpr float kConversationChance = 0.01f;
constexpr float kConversationSeconds = 4.0f;

struct SimulationSettings {
    uint32_t entities = 8;
    uint32_t ticks = 600;
    float tickSeconds = 0.1f;
    Archetype archetype = Archetype::Worker;
    abp::foundation::LogLevel logLevel = abp::foundation::LogLevel::Info;
};

PlannerResult<SimulationSettings> loadSimulationSettings(const ConfigManager& config) {
    SimulationSettings settings;

    auto entities = config.getOr<uint32_t>("simulation.entities", settings.entities);
    if (!entities) {
        return PlannerResult<SimulationSettings>::err(entities.error());
    }
    auto ticks = config.getOr<uint32_t>("simulation.ticks", settings.ticks);
    if (!ticks) {
        return PlannerResult<SimulationSettings>::err(ticks.error());
    }
    auto tickSeconds = config.getOr<float>("simulation.tick_seconds", settings.tickSeconds);
    if (!tickSeconds) {
        return PlannerResult<SimulationSettings>::err(tickSeconds.error());
    }
    if (entities.value() == 0 || tickSeconds.value() <= 0.0f) {
        return PlannerResult<SimulationSettings>::err(
            PlannerError(ErrorCode::InvalidTickSettings,
                         "simulation needs at least one entity and a positive tick length"));
    }

    auto archetypeName = config.getOr<std::string>("simulation.archetype", "worker");
    if (!archetypeName) {
        return PlannerResult<SimulationSettings>::err(archetypeName.error());
    }
    auto archetype = abp::behavior::ParseArchetype(archetypeName.value());
    if (!archetype) {
        return PlannerResult<SimulationSettings>::err(
            PlannerError(archetype.error().code(), std::string(archetype.error().message()),
                         "simulation.archetype"));
    }

    auto levelName = config.getOr<std::string>("logging.level", "info");
    if (!levelName) {
        return PlannerResult<SimulationSettings>::err(levelName.error());
    }
    auto level = abp::foundation::parseLogLevel(levelName.value());
    if (!level) {
        return PlannerResult<SimulationSettings>::err(
            PlannerError(ErrorCode::ConfigTypeMismatch,
                         "unknown log level: " + levelName.value(), "logging.level"));
    }

    settings.entities = entities.value();
    settings.ticks = ticks.value();
    settings.tickSeconds = tickSeconds.value();
    settings.archetype = archetype.value();
    settings.logLevel = *level;
    return PlannerResult<SimulationSettings>::ok(settings);
}

/// Lays the floor out on a grid: stations in a row, areas at fixed anchors.
class FloorLayout : public abp::behavior::ITargetResolver {
public:
    FloorLayout(uint32_t entityCount, uint64_t seed) : entityCount_(entityCount), rng_(seed) {}

    Position Station(EntityId entity) const {
        return {static_cast<float>(entity.value()) * kStationSpacing, -10.0f};
    }

    std::optional<ResolvedTarget> Resolve(EntityId entity, const PlanStep& step) override {
        using abp::behavior::ArrivalCue;
        ResolvedTarget target;
        float seatOffset = static_cast<float>(step.seatIndex.value_or(0)) * 0.8f;

        switch (step.kind) {
            case StepKind::ReturnToStation:
                target.position = Station(entity);
                target.cue.animation = "typing";
                break;
            case StepKind::VisitKitchen:
                target.position = {-12.0f + seatOffset, 6.0f};
                target.cue = ArrivalCue{"sitting", 0.0f, 0.45f};
                break;
            case StepKind::SitOnCouch:
                target.position = {-6.0f + seatOffset, 10.0f};
                target.cue = ArrivalCue{"sitting", 3.14159f, 0.4f};
                break;
            case StepKind::VisitBreakRoom:
                target.position = {6.0f + seatOffset, 10.0f};
                target.cue = ArrivalCue{"sitting", 3.14159f, 0.45f};
                break;
            case StepKind::PlayPoker:
                target.position = {12.0f + seatOffset, 6.0f};
                target.cue = ArrivalCue{"sitting", 1.5708f, 0.45f};
                break;
            case StepKind::PerformOnStage:
                target.position = {0.0f, 14.0f};
                target.cue.animation = "dancing";
                break;
            case StepKind::WatchStage:
                target.position = {randomIn(-4.0f, 4.0f), randomIn(8.0f, 11.0f)};
                target.cue = ArrivalCue{"idle", 0.0f, std::nullopt};
                break;
            case StepKind::Present:
                target.position = {3.0f, 14.0f};
                target.cue.animation = "presenting";
                break;
            case StepKind::CheckOnWorker: {
                if (entityCount_ < 2) {
                    return std::nullopt;
                }
                auto other = static_cast<uint64_t>(rng_.UniformInt(1, entityCount_));
                if (other == entity.value()) {
                    return std::nullopt;
                }
                auto station = Station(EntityId(other));
                target.position = {station.x, station.z + 1.0f};
                target.cue.animation = "talking";
                break;
            }
            case StepKind::WalkInCircle:
                target.position = {randomIn(-2.0f, 2.0f), randomIn(-2.0f, 2.0f)};
                break;
            case StepKind::PlayOutdoorSportA:
                target.position = {randomIn(-30.0f, -24.0f), randomIn(20.0f, 26.0f)};
                target.cue.animation = "playing";
                break;
            case StepKind::PlayOutdoorSportB:
                target.position = {randomIn(24.0f, 30.0f), randomIn(20.0f, 26.0f)};
                target.cue.animation = "golfing";
                break;
            case StepKind::SitOutdoors:
                target.position = {randomIn(-4.0f, 4.0f), 24.0f};
                target.cue = ArrivalCue{"sitting", std::nullopt, 0.45f};
                break;
            case StepKind::Wander:
                target.position = {randomIn(-15.0f, 15.0f), randomIn(-8.0f, 8.0f)};
                break;
        }
        return target;
    }

private:
    float randomIn(float lo, float hi) { return static_cast<float>(rng_.Uniform(lo, hi)); }

    uint32_t entityCount_;
    RandomStream rng_;
};

struct SimEntity {
    std::unique_ptr<BehaviorController> controller;
    Position position;
    float conversationEnds = 0.0f;
    std::map<std::string_view, float> timeByThought;
};

/// Step @p from towards @p to; true once the target is reached.
bool walk(Position& from, const Position& to, float dt) {
    float dx = to.x - from.x;
    float dz = to.z - from.z;
    float distance = std::sqrt(dx * dx + dz * dz);
    float step = kWalkSpeed * dt;
    if (distance <= step) {
        from = to;
        return true;
    }
    from.x += dx / distance * step;
    from.z += dz / distance * step;
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    registry.set_default_logger(std::make_shared<abp::tools::ConsoleLogger>(
        std::clog, kcenon::common::interfaces::log_level::trace));

    ConfigManager config;
    auto configPath = abp::tools::parseConfigArg(argc, argv);
    if (!configPath.empty()) {
        auto loadResult = config.load(configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    BehaviorCatalog catalog;
    auto applied = catalog.ApplyConfig(config);
    if (!applied) {
        std::cerr << "Invalid catalog entry '" << applied.error().key()
                  << "': " << applied.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto planner = abp::behavior::LoadPlannerSettings(config);
    if (!planner) {
        std::cerr << "Invalid planner settings: " << planner.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto simulation = loadSimulationSettings(config);
    if (!simulation) {
        std::cerr << "Invalid simulation settings: " << simulation.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto overrides = abp::tools::parseOverrides(argc, argv, simulation.value().entities);
    if (!overrides) {
        std::cerr << overrides.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const PlannerSettings& settings = planner.value();
    const SimulationSettings& sim = simulation.value();

    auto& logger = abp::foundation::PlannerLogger::instance();
    for (std::size_t i = 0; i < abp::foundation::kLogCategoryCount; ++i) {
        logger.setCategoryLevel(static_cast<abp::foundation::LogCategory>(i), sim.logLevel);
    }

    abp::behavior::PlanGenerator generator(catalog);
    abp::world::SeatBoard board(catalog);
    FloorLayout layout(sim.entities, abp::behavior::DeriveSeed(settings.seed, 0));
    RandomStream crowdRng(abp::behavior::DeriveSeed(settings.seed, sim.entities + 1));

    std::vector<SimEntity> crowd;
    crowd.reserve(sim.entities);
    for (uint32_t i = 1; i <= sim.entities; ++i) {
        EntityId id(i);
        SimEntity entity;
        entity.controller = std::make_unique<BehaviorController>(
            id, catalog.Weights(sim.archetype), generator, board, layout, settings);
        entity.position = layout.Station(id);
        crowd.push_back(std::move(entity));
    }

    std::cout << "Simulating " << sim.entities << " " << abp::behavior::ArchetypeName(sim.archetype)
              << " entities for " << sim.ticks << " ticks of " << sim.tickSeconds << "s (seed "
              << settings.seed << ")\n";

    for (uint32_t tick = 0; tick < sim.ticks; ++tick) {
        float now = static_cast<float>(tick) * sim.tickSeconds;

        // Occasionally pair two free entities for a short chat.
        if (sim.entities >= 2 && crowdRng.Chance(kConversationChance)) {
            auto a = crowdRng.UniformInt(1, sim.entities);
            auto b = crowdRng.UniformInt(1, sim.entities);
            if (a != b && !board.InConversation(EntityId(a)) && !board.InConversation(EntityId(b)) &&
                board.StartConversation(EntityId(a), EntityId(b))) {
                crowd[a - 1].conversationEnds = now + kConversationSeconds;
                crowd[b - 1].conversationEnds = now + kConversationSeconds;
            }
        }

        std::optional<EntityId> performer;
        for (auto& entity : crowd) {
            auto id = entity.controller->Entity();
            if (board.InConversation(id) && now >= entity.conversationEnds) {
                board.EndConversation(id);
            }

            abp::behavior::TickInput input;
            input.now = now;
            input.inConversation = board.InConversation(id);
            input.stagePerformer = board.StagePerformer();
            if (tick == 0) {
                for (const auto& o : overrides.value()) {
                    if (o.entity == id) {
                        input.command = o.kind;
                    }
                }
            }

            auto directive = entity.controller->Tick(input);
            entity.timeByThought[directive.thought] += sim.tickSeconds;

            if (directive.action == DriverAction::MoveToTarget && directive.target) {
                if (walk(entity.position, *directive.target, sim.tickSeconds)) {
                    entity.controller->NotifyArrived(now);
                }
            } else if (directive.action == DriverAction::Dwell &&
                       directive.kind == StepKind::PerformOnStage) {
                performer = id;
            }
        }

        if (performer) {
            board.SetStagePerformer(*performer);
        } else if (board.StagePerformer()) {
            board.ClearStagePerformer();
        }
    }

    std::cout << std::fixed << std::setprecision(1);
    for (const auto& entity : crowd) {
        std::cout << "entity " << entity.controller->Entity().value() << ":";
        for (const auto& [thought, seconds] : entity.timeByThought) {
            std::cout << " " << thought << "=" << seconds << "s";
        }
        std::cout << "\n";
    }

    auto flushed = logger.flush();
    if (!flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
