#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include "abp/behavior/plan_executor.hpp"
#include "abp/foundation/planner_logger.hpp"

using namespace abp::behavior;
using abp::foundation::EntityId;
using abp::foundation::LogCategory;
using abp::foundation::LogLevel;
using abp::foundation::PlannerLogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

namespace {

// ---------------------------------------------------------------------------
// RecordingLogger: keeps every message it receives
// ---------------------------------------------------------------------------

class RecordingLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level /*level*/, const std::string& message) override {
        std::lock_guard lock(mutex_);
        messages_.push_back(message);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level /*level*/) const override { return true; }

    kcenon::common::VoidResult set_level(log_level /*level*/) override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return log_level::trace; }

    kcenon::common::VoidResult flush() override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<std::string> messages() const {
        std::lock_guard lock(mutex_);
        return messages_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

class NoAvailability : public IAvailabilitySource {
public:
    AvailabilitySnapshot Snapshot() const override { return {}; }
};

}  // namespace

class ExecutorLoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        recorder_ = std::make_shared<RecordingLogger>();
        registry.set_default_logger(recorder_);
        savedLevel_ = PlannerLogger::instance().getCategoryLevel(LogCategory::Executor);
    }

    void TearDown() override {
        PlannerLogger::instance().setCategoryLevel(LogCategory::Executor, savedLevel_);
        GlobalLoggerRegistry::instance().clear();
    }

    PlanExecutor makeExecutor() {
        return PlanExecutor(EntityId(4), PersonalityWeights{{StepKind::PlayPoker, 1.0f}},
                            generator_, availability_, 1, {1, 1});
    }

    std::shared_ptr<RecordingLogger> recorder_;
    LogLevel savedLevel_ = LogLevel::Info;
    PlanGenerator generator_;
    NoAvailability availability_;
};

TEST_F(ExecutorLoggingTest, GenerationLoggedAtDebug) {
    PlannerLogger::instance().setCategoryLevel(LogCategory::Executor, LogLevel::Debug);
    auto executor = makeExecutor();
    executor.NewPlan();

    auto messages = recorder_->messages();
    ASSERT_EQ(messages.size(), 1u);
    const auto& message = messages[0];
    EXPECT_EQ(message.rfind("[Executor] Generated plan {entity_id=4", 0), 0u) << message;
    EXPECT_NE(message.find("reason=requested"), std::string::npos) << message;
    EXPECT_NE(message.find("steps=1"), std::string::npos) << message;
    EXPECT_NE(message.find("first=go_to_poker_table"), std::string::npos) << message;
}

TEST_F(ExecutorLoggingTest, GenerationSilentAboveDebug) {
    PlannerLogger::instance().setCategoryLevel(LogCategory::Executor, LogLevel::Info);
    auto executor = makeExecutor();
    executor.NewPlan();
    executor.Advance();

    EXPECT_TRUE(recorder_->messages().empty());
    EXPECT_EQ(executor.CurrentKind(), StepKind::PlayPoker);
}
