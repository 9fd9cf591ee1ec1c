// =================================================================
// tests/CycleAgentManagerTest.cpp
// =================================================================
// Unit tests for multi-agent orchestration over a scripted invoker.

#include "Tandem/CycleAgentManager.hpp"
#include "Tandem/Errors.hpp"
#include <cassert>
#include <deque>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>

using namespace Tandem;

namespace {

const std::string REVIEW_PREFIX = "Review the answer";
const std::string PLAN_PREFIX = "Break the following task";

/**
 * @brief ModelInvoker that answers from a script and records every call
 */
class ScriptedInvoker : public ModelInvoker {
public:
    std::string invoke(AgentRole role, const std::string& prompt, const std::string&) override {
        std::function<void(AgentRole)> hook;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            calls.emplace_back(role, prompt);
            if (failures_remaining[role] > 0) {
                failures_remaining[role]--;
                throw ModelInvocationError(InvocationErrorKind::NETWORK_ERROR, "connection reset");
            }
            if (broken_roles.count(role) > 0) {
                throw std::runtime_error("unexpected reply shape");
            }
            if (prompt.compare(0, REVIEW_PREFIX.size(), REVIEW_PREFIX) == 0) {
                if (review_replies.empty()) {
                    return "APPROVED";
                }
                std::string reply = review_replies.front();
                review_replies.pop_front();
                return reply;
            }
            if (prompt.compare(0, PLAN_PREFIX.size(), PLAN_PREFIX) == 0) {
                return plan_reply;
            }
            hook = on_invoke;
        }
        if (hook) {
            hook(role);
        }
        return AgentCapabilityUtils::roleToString(role) + " result";
    }

    void warmUp(AgentRole role) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        warmups.push_back(role);
        if (warmup_failures_remaining[role] > 0) {
            warmup_failures_remaining[role]--;
            throw ModelInvocationError(InvocationErrorKind::MODEL_UNAVAILABLE, "model failed to load");
        }
    }

    std::vector<std::string> promptsFor(AgentRole role) {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> prompts;
        for (const auto& call : calls) {
            if (call.first == role) {
                prompts.push_back(call.second);
            }
        }
        return prompts;
    }

    std::vector<std::pair<AgentRole, std::string>> calls;
    std::vector<AgentRole> warmups;
    std::map<AgentRole, int> failures_remaining;
    std::map<AgentRole, int> warmup_failures_remaining;
    std::set<AgentRole> broken_roles;
    std::deque<std::string> review_replies;
    std::string plan_reply = R"({"steps": ["Read the code", "Write the fix"]})";
    std::function<void(AgentRole)> on_invoke;

private:
    std::mutex m_mutex;
};

std::unique_ptr<ModelTierManager> makeTiers(double ram_gb, bool vision_enabled = true) {
    TierManagerConfig config;
    config.system_ram_gb = ram_gb;
    auto tiers = std::make_unique<ModelTierManager>(config);
    tiers->updateConfiguration({
        {AgentRole::ORCHESTRATOR, ModelTier::SMALL, true},
        {AgentRole::CODER, ModelTier::SMALL, true},
        {AgentRole::RESEARCHER, ModelTier::SMALL, true},
        {AgentRole::VISION, ModelTier::SMALL, vision_enabled},
    });
    return tiers;
}

OrchestratorConfig withPreset(QualityPreset preset) {
    OrchestratorConfig config;
    config.preset = preset;
    return config;
}

bool hasEvent(const std::vector<ProgressEvent>& events, ProgressEventType type) {
    for (const auto& event : events) {
        if (event.type == type) {
            return true;
        }
    }
    return false;
}

size_t countEvents(const std::vector<ProgressEvent>& events, ProgressEventType type) {
    size_t count = 0;
    for (const auto& event : events) {
        if (event.type == type) {
            count++;
        }
    }
    return count;
}

} // namespace

class CycleAgentManagerTest {
public:
    void testAgentPool() {
        std::cout << "Testing agent pool construction..." << std::endl;

        auto tiers = makeTiers(32, false);
        ScriptedInvoker invoker;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        CycleAgentManager manager(*tiers, invoker, classifier, events);

        assert(manager.getAgents().size() == 3 && "Disabled roles are not registered");
        assert(manager.findAgent("vision") == nullptr);
        assert(manager.findAgent("coder") != nullptr);
        assert(manager.findAgent("coder")->model.tag == "qwen2.5-coder:7b");
        assert(manager.getState() == OrchestrationState::IDLE);

        OrchestrationStatistics stats = manager.getStatistics();
        assert(!stats.can_run_parallel && "32 GB is below the parallel threshold");
        assert(stats.registered_agents == 3);
        assert(stats.model_switch_count == 0);
        assert(stats.warm_agent.empty());

        std::cout << "✓ Agent pool test passed" << std::endl;
    }

    void testSelectBestAgent() {
        std::cout << "Testing best agent selection..." << std::endl;

        auto tiers = makeTiers(32, false);
        ScriptedInvoker invoker;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        CycleAgentManager manager(*tiers, invoker, classifier, events);

        assert(manager.selectBestAgent({TaskCapability::RESEARCH}).id == "researcher");
        assert(manager.selectBestAgent({TaskCapability::DEBUGGING}).id == "coder");
        assert(manager.selectBestAgent({TaskCapability::CODE_GENERATION, TaskCapability::DOCUMENTATION}).id == "coder"
               && "Equal scores fall back to priority");
        assert(manager.selectBestAgent({}).id == "orchestrator");
        assert(manager.selectBestAgent({TaskCapability::IMAGE_ANALYSIS}).id == "orchestrator"
               && "Unmatched capability falls back to the orchestrator");

        std::cout << "✓ Best agent selection test passed" << std::endl;
    }

    void testPipelineChainsOutputs() {
        std::cout << "Testing pipeline execution..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        auto subscription = events.subscribe();
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::FAST));

        TaskContext context;
        OrchestrationResult result = manager.planAndExecute("Add a retry flag", context, {"researcher", "coder"});

        assert(result.success);
        assert(result.strategy == ExecutionStrategy::PIPELINE);
        assert(result.results.size() == 2);
        assert(result.results[0].agent_id == "researcher");
        assert(result.results[1].agent_id == "coder");
        assert(result.output == "coder result");
        assert(!result.results[0].verified && "FAST runs no review");

        auto coder_prompts = invoker.promptsFor(AgentRole::CODER);
        assert(coder_prompts.size() == 1);
        assert(coder_prompts[0] == "Add a retry flag\n\nPrevious result:\nresearcher result");
        assert(invoker.promptsFor(AgentRole::RESEARCHER)[0] == "Add a retry flag");

        assert(context.previous_results.size() == 2);
        assert(manager.getState() == OrchestrationState::COMPLETED);
        assert(manager.getProgress() == 1.0);

        auto received = subscription->drain();
        assert(hasEvent(received, ProgressEventType::RUN_STARTED));
        assert(hasEvent(received, ProgressEventType::RUN_COMPLETED));
        assert(countEvents(received, ProgressEventType::MODEL_SWITCH) == 2);
        assert(countEvents(received, ProgressEventType::STEP_COMPLETED) == 2);

        std::cout << "✓ Pipeline execution test passed" << std::endl;
    }

    void testSwitchCounting() {
        std::cout << "Testing model switch counting..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::FAST));

        TaskContext context;
        manager.planAndExecute("Task", context, {"researcher", "coder", "researcher"});
        assert(manager.getStatistics().model_switch_count == 3 && "One resident model at a time");
        assert(invoker.warmups.size() == 3);

        manager.planAndExecute("Task", context, {"researcher", "researcher"});
        OrchestrationStatistics stats = manager.getStatistics();
        assert(stats.model_switch_count == 3 && "Warm model is reused");
        assert(stats.cache_hits == 2);
        assert(stats.warm_agent == "researcher");

        std::cout << "✓ Switch counting test passed" << std::endl;
    }

    void testParallelCapableHost() {
        std::cout << "Testing parallel-capable host..." << std::endl;

        TierManagerConfig config;
        config.system_ram_gb = 128;
        ModelTierManager tiers(config);
        ScriptedInvoker invoker;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        CycleAgentManager manager(tiers, invoker, classifier, events, withPreset(QualityPreset::FAST));

        assert(manager.getStatistics().can_run_parallel);

        TaskContext context;
        manager.planAndExecute("Task", context, {"researcher", "coder", "researcher"});
        assert(manager.getStatistics().model_switch_count == 2 && "Both models stay resident");

        std::cout << "✓ Parallel-capable host test passed" << std::endl;
    }

    void testAutoSelectsByCapability() {
        std::cout << "Testing automatic agent selection..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::FAST));

        TaskContext context;
        OrchestrationResult debug = manager.planAndExecute("Fix the crash in the parser", context);
        assert(debug.success);
        assert(debug.strategy == ExecutionStrategy::AUTO);
        assert(debug.results.size() == 1);
        assert(debug.results[0].agent_id == "coder");
        assert(debug.plan.empty() && "FAST skips planning");

        OrchestrationResult vague = manager.planAndExecute("hello there", context);
        assert(vague.results[0].agent_id == "orchestrator");

        std::cout << "✓ Automatic selection test passed" << std::endl;
    }

    void testBalancedPlansAndReviews() {
        std::cout << "Testing planning and review..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::BALANCED));

        TaskContext context;
        OrchestrationResult result = manager.planAndExecute("Fix the crash in the parser", context);

        assert(result.success);
        assert(!result.plan.empty());
        assert(result.results.size() == 1);
        assert(result.results[0].verified);
        assert(result.results[0].attempts == 1);

        auto coder_prompts = invoker.promptsFor(AgentRole::CODER);
        assert(coder_prompts.size() == 1);
        assert(coder_prompts[0].find("Plan:\n1. Read the code\n2. Write the fix") != std::string::npos);

        std::cout << "✓ Planning and review test passed" << std::endl;
    }

    void testRejectedOutputIsRetried() {
        std::cout << "Testing rejected output retry..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        invoker.review_replies = {"NOT APPROVED: missing tests", "APPROVED"};
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::BALANCED));

        TaskContext context;
        OrchestrationResult result = manager.planAndExecute("Write a parser", context, {"coder"});

        assert(result.success);
        assert(result.results[0].attempts == 2);
        assert(result.results[0].verified);

        auto coder_prompts = invoker.promptsFor(AgentRole::CODER);
        assert(coder_prompts.size() == 2);
        assert(coder_prompts[1].find("Reviewer feedback:\nNOT APPROVED: missing tests") != std::string::npos);

        // Every attempt rejected: the step is kept but unverified
        ScriptedInvoker stubborn;
        stubborn.review_replies = {"NOT APPROVED", "NOT APPROVED"};
        CycleAgentManager strict(*tiers, stubborn, classifier, events, withPreset(QualityPreset::BALANCED));
        OrchestrationResult rejected = strict.planAndExecute("Write a parser", context, {"coder"});
        assert(rejected.success);
        assert(!rejected.results[0].verified);
        assert(rejected.results[0].attempts == 2);

        std::cout << "✓ Rejected output retry test passed" << std::endl;
    }

    void testInvocationRetry() {
        std::cout << "Testing invocation retry..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        invoker.failures_remaining[AgentRole::CODER] = 1;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        auto subscription = events.subscribe();
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::BALANCED));

        TaskContext context;
        OrchestrationResult result = manager.planAndExecute("Write a parser", context, {"coder"});

        assert(result.success);
        assert(result.results[0].attempts == 2);
        assert(hasEvent(subscription->drain(), ProgressEventType::STEP_RETRY));

        std::cout << "✓ Invocation retry test passed" << std::endl;
    }

    void testFailureKeepsPartialResults() {
        std::cout << "Testing failure with partial results..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        invoker.failures_remaining[AgentRole::CODER] = 10;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        auto subscription = events.subscribe();
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::FAST));

        TaskContext context;
        OrchestrationResult result = manager.planAndExecute("Task", context, {"researcher", "coder"});

        assert(!result.success);
        assert(!result.cancelled);
        assert(result.error_kind == OrchestrationErrorKind::INVOCATION_FAILED);
        assert(result.error_message.find("network_error") == 0);
        assert(result.results.size() == 1 && "Completed steps are kept");
        assert(result.results[0].agent_id == "researcher");
        assert(manager.getState() == OrchestrationState::FAILED);
        assert(hasEvent(subscription->drain(), ProgressEventType::RUN_FAILED));
        assert(!manager.isRunning());

        bool threw = false;
        try {
            manager.execute("Task", context, {"researcher", "coder"});
        } catch (const TaskExecutionError& e) {
            threw = e.agentId() == "coder";
        }
        assert(threw && "execute reports the failing agent");

        std::cout << "✓ Failure with partial results test passed" << std::endl;
    }

    void testReviewLoadsAreNotSwitches() {
        std::cout << "Testing planning and review loads..." << std::endl;

        auto tiers = makeTiers(32);
        KeywordCapabilityClassifier classifier;
        EventChannel events;

        ScriptedInvoker balanced_invoker;
        auto subscription = events.subscribe();
        CycleAgentManager balanced(*tiers, balanced_invoker, classifier, events, withPreset(QualityPreset::BALANCED));
        TaskContext context;
        OrchestrationResult result = balanced.planAndExecute("Write a parser", context, {"coder", "coder"});
        assert(result.success);

        OrchestrationStatistics stats = balanced.getStatistics();
        assert(stats.model_switch_count == 1 && "Reviews do not count as step switches");
        assert(stats.auxiliary_loads == 2 && "One reviewer load per step");
        assert(stats.warm_agent == "coder");
        assert(stats.cache_hits == 1);
        assert(countEvents(subscription->drain(), ProgressEventType::MODEL_SWITCH) == 1);

        balanced.planAndExecute("Task", context, {"researcher", "coder", "researcher"});
        stats = balanced.getStatistics();
        assert(stats.model_switch_count == 4);
        assert(stats.auxiliary_loads == 5);

        // Expert review also asks the step's own model, which is already resident
        ScriptedInvoker thorough_invoker;
        CycleAgentManager thorough(*tiers, thorough_invoker, classifier, events, withPreset(QualityPreset::THOROUGH));
        result = thorough.planAndExecute("Write a parser", context, {"coder", "coder"});
        assert(result.success);
        assert(result.results[0].verified && result.results[1].verified);
        stats = thorough.getStatistics();
        assert(stats.model_switch_count == 1);
        assert(stats.auxiliary_loads == 2);
        assert(thorough_invoker.warmups.size() == 3);
        assert(thorough_invoker.promptsFor(AgentRole::CODER).size() == 4 && "Two steps and two self-reviews");

        // AUTO planning loads the orchestrator before the chosen agent runs
        ScriptedInvoker auto_invoker;
        CycleAgentManager planner(*tiers, auto_invoker, classifier, events, withPreset(QualityPreset::BALANCED));
        result = planner.planAndExecute("Fix the crash in the parser", context);
        assert(result.success);
        stats = planner.getStatistics();
        assert(stats.model_switch_count == 1);
        assert(stats.auxiliary_loads == 2 && "Planning and review");

        std::cout << "✓ Planning and review load test passed" << std::endl;
    }

    void testFailedLoadIsNotASwitch() {
        std::cout << "Testing failed model load..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        invoker.warmup_failures_remaining[AgentRole::CODER] = 1;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        auto subscription = events.subscribe();
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::BALANCED));

        TaskContext context;
        OrchestrationResult result = manager.planAndExecute("Write a parser", context, {"coder"});

        assert(result.success);
        assert(result.results[0].attempts == 2);
        assert(invoker.warmups.size() == 3 && "Failed load, reload, reviewer load");
        OrchestrationStatistics stats = manager.getStatistics();
        assert(stats.model_switch_count == 1 && "Only the completed load is a switch");
        assert(stats.warm_agent == "coder");

        auto received = subscription->drain();
        assert(countEvents(received, ProgressEventType::MODEL_SWITCH) == 1);
        assert(hasEvent(received, ProgressEventType::STEP_RETRY));

        // Load never succeeds: nothing is left resident
        ScriptedInvoker unloadable;
        unloadable.warmup_failures_remaining[AgentRole::CODER] = 10;
        CycleAgentManager failing(*tiers, unloadable, classifier, events, withPreset(QualityPreset::FAST));
        result = failing.planAndExecute("Write a parser", context, {"coder"});
        assert(!result.success);
        assert(result.error_message.find("model_unavailable") == 0);
        assert(failing.getStatistics().model_switch_count == 0);
        assert(failing.getStatistics().warm_agent.empty());

        std::cout << "✓ Failed model load test passed" << std::endl;
    }

    void testUnexpectedErrorFailsRun() {
        std::cout << "Testing unexpected step error..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        invoker.broken_roles.insert(AgentRole::CODER);
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        auto subscription = events.subscribe();
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::FAST));

        TaskContext context;
        bool threw = false;
        try {
            manager.planAndExecute("Task", context, {"researcher", "coder"});
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()) == "unexpected reply shape";
        }
        assert(threw && "The original error reaches the caller");

        assert(manager.getState() == OrchestrationState::FAILED);
        assert(!manager.isRunning());
        assert(manager.getResults().size() == 1 && "Completed steps are kept");
        assert(manager.getResults()[0].agent_id == "researcher");

        bool reported = false;
        for (const auto& event : subscription->drain()) {
            if (event.type == ProgressEventType::RUN_FAILED) {
                reported = event.agent_id == "coder" && event.message == "unexpected reply shape";
            }
        }
        assert(reported && "RUN_FAILED names the failing agent");

        // The manager accepts the next run
        invoker.broken_roles.clear();
        OrchestrationResult next = manager.planAndExecute("Task", context, {"coder"});
        assert(next.success);
        assert(manager.getState() == OrchestrationState::COMPLETED);

        std::cout << "✓ Unexpected step error test passed" << std::endl;
    }

    void testAutoFailureNamesAgent() {
        std::cout << "Testing automatic run failure..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        invoker.failures_remaining[AgentRole::CODER] = 10;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::FAST));

        TaskContext context;
        OrchestrationResult result = manager.planAndExecute("Fix the crash in the parser", context);
        assert(!result.success);
        assert(result.agents.size() == 1 && result.agents[0] == "coder");
        assert(result.failed_agent == "coder");

        bool threw = false;
        try {
            manager.execute("Fix the crash in the parser", context);
        } catch (const TaskExecutionError& e) {
            threw = e.agentId() == "coder";
        }
        assert(threw && "execute reports the automatically chosen agent");

        // Planning failures are attributed to the orchestrator
        ScriptedInvoker planner_down;
        planner_down.failures_remaining[AgentRole::ORCHESTRATOR] = 10;
        CycleAgentManager planning(*tiers, planner_down, classifier, events, withPreset(QualityPreset::BALANCED));
        result = planning.planAndExecute("Fix the crash in the parser", context);
        assert(!result.success);
        assert(result.failed_agent == "orchestrator");
        assert(result.results.empty());

        OrchestrationResult pipeline = manager.planAndExecute("Task", context, {"researcher"});
        assert(pipeline.success);
        assert(pipeline.failed_agent.empty());
        assert(pipeline.agents.size() == 1 && pipeline.agents[0] == "researcher");

        std::cout << "✓ Automatic run failure test passed" << std::endl;
    }

    void testInvalidSelectionRejectedUpFront() {
        std::cout << "Testing invalid agent selections..." << std::endl;

        auto tiers = makeTiers(32, false);
        ScriptedInvoker invoker;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::FAST));

        TaskContext context;
        bool threw = false;
        try {
            manager.planAndExecute("Task", context, {"researcher", "planner"});
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Unknown agent id");

        threw = false;
        try {
            manager.planAndExecute("Task", context, {"vision"});
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Disabled agent");

        assert(invoker.calls.empty() && "Nothing runs before validation");
        assert(!manager.isRunning());

        // A single model that cannot fit in memory
        TierManagerConfig small_host;
        small_host.system_ram_gb = 16;
        ModelTierManager cramped(small_host);
        cramped.updateConfiguration({{AgentRole::CODER, ModelTier::LARGE, true}}, true);
        CycleAgentManager overcommitted(cramped, invoker, classifier, events, withPreset(QualityPreset::FAST));

        threw = false;
        try {
            overcommitted.planAndExecute("Task", context, {"coder"});
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Model larger than usable RAM");
        assert(invoker.calls.empty());

        std::cout << "✓ Invalid selection test passed" << std::endl;
    }

    void testCancelBetweenSteps() {
        std::cout << "Testing cancellation..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        auto subscription = events.subscribe();
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::FAST));
        invoker.on_invoke = [&manager](AgentRole role) {
            if (role == AgentRole::RESEARCHER) {
                manager.cancel();
            }
        };

        TaskContext context;
        OrchestrationResult result = manager.planAndExecute("Task", context, {"researcher", "coder"});

        assert(result.cancelled);
        assert(!result.success);
        assert(result.error_kind == OrchestrationErrorKind::NONE);
        assert(result.results.size() == 1);
        assert(invoker.promptsFor(AgentRole::CODER).empty());
        assert(manager.getState() == OrchestrationState::CANCELLED);
        assert(hasEvent(subscription->drain(), ProgressEventType::RUN_CANCELLED));

        // The next run starts clean
        invoker.on_invoke = nullptr;
        OrchestrationResult next = manager.planAndExecute("Task", context, {"coder"});
        assert(next.success);

        std::cout << "✓ Cancellation test passed" << std::endl;
    }

    void testConcurrentRunIsBusy() {
        std::cout << "Testing concurrent run rejection..." << std::endl;

        auto tiers = makeTiers(32);
        ScriptedInvoker invoker;
        KeywordCapabilityClassifier classifier;
        EventChannel events;
        CycleAgentManager manager(*tiers, invoker, classifier, events, withPreset(QualityPreset::FAST));

        std::promise<void> started;
        std::promise<void> release;
        std::shared_future<void> released = release.get_future().share();
        bool signalled = false;
        invoker.on_invoke = [&](AgentRole) {
            if (!signalled) {
                signalled = true;
                started.set_value();
                released.wait();
            }
        };

        auto pending = manager.planAndExecuteAsync("Long task", TaskContext(), {"coder"});
        started.get_future().wait();
        assert(manager.isRunning());

        TaskContext context;
        OrchestrationResult busy = manager.planAndExecute("Second task", context, {"researcher"});
        assert(!busy.success);
        assert(busy.error_kind == OrchestrationErrorKind::BUSY);
        assert(busy.results.empty());

        release.set_value();
        OrchestrationResult first = pending.get();
        assert(first.success);
        assert(!manager.isRunning());

        std::cout << "✓ Concurrent run rejection test passed" << std::endl;
    }

    void testParsePlan() {
        std::cout << "Testing plan parsing..." << std::endl;

        auto json_steps = CycleAgentManager::parsePlan(R"(Here you go: {"steps": ["a", "", "b"]})");
        assert(json_steps.size() == 2);
        assert(json_steps[0] == "a" && json_steps[1] == "b");

        auto list_steps = CycleAgentManager::parsePlan("1. Read the code\n2) Write the fix\n- Run tests\n\n");
        assert(list_steps.size() == 3);
        assert(list_steps[0] == "Read the code");
        assert(list_steps[1] == "Write the fix");
        assert(list_steps[2] == "Run tests");

        assert(CycleAgentManager::stateToString(OrchestrationState::CANCELLED) == "cancelled");
        assert(CycleAgentManager::errorKindToString(OrchestrationErrorKind::BUSY) == "busy");

        std::cout << "✓ Plan parsing test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CycleAgentManager tests...\n" << std::endl;

        testAgentPool();
        testSelectBestAgent();
        testPipelineChainsOutputs();
        testSwitchCounting();
        testParallelCapableHost();
        testAutoSelectsByCapability();
        testBalancedPlansAndReviews();
        testRejectedOutputIsRetried();
        testInvocationRetry();
        testFailureKeepsPartialResults();
        testReviewLoadsAreNotSwitches();
        testFailedLoadIsNotASwitch();
        testUnexpectedErrorFailsRun();
        testAutoFailureNamesAgent();
        testInvalidSelectionRejectedUpFront();
        testCancelBetweenSteps();
        testConcurrentRunIsBusy();
        testParsePlan();

        std::cout << "\nAll CycleAgentManager tests passed!" << std::endl;
    }
};

int main() {
    try {
        CycleAgentManagerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
