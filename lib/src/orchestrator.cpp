#include "orchestrator.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <thread>

namespace veriloop::lib::flow
{

    namespace
    {

        class Watchdog
        {
        public:
            Watchdog(std::chrono::milliseconds timeout, std::function<void()> onExpire)
                : timeout_(timeout),
                  onExpire_(std::move(onExpire)),
                  thread_([this]() { run(); })
            {
            }

            Watchdog(const Watchdog &) = delete;
            Watchdog &operator=(const Watchdog &) = delete;

            ~Watchdog()
            {
                cancel();
                if (thread_.joinable())
                {
                    thread_.join();
                }
            }

            void cancel()
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    cancelled_ = true;
                }
                cv_.notify_one();
            }

        private:
            void run()
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (cv_.wait_for(lock, timeout_, [this]() { return cancelled_; }))
                {
                    return;
                }
                onExpire_();
            }

            std::chrono::milliseconds timeout_;
            std::function<void()> onExpire_;
            std::mutex mutex_;
            std::condition_variable cv_;
            bool cancelled_ = false;
            std::thread thread_;
        };

        design::ModuleResult makeAborted(const std::string &node, std::string reason)
        {
            design::ModuleResult result;
            result.node = node;
            result.status = design::ModuleStatus::Aborted;
            result.reason = std::move(reason);
            return result;
        }

        design::ModuleResult makeSkipped(const std::string &node, const std::string &failed)
        {
            design::ModuleResult result;
            result.node = node;
            result.status = design::ModuleStatus::Skipped;
            result.reason = "dependency '" + failed + "' did not verify";
            return result;
        }

        std::string joinNames(const std::vector<std::string> &names)
        {
            std::string out;
            for (const std::string &name : names)
            {
                if (!out.empty())
                {
                    out.append(", ");
                }
                out.append(name);
            }
            return out;
        }

    } // namespace

    bool NodeTaskQueue::push(std::size_t node)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
        {
            return false;
        }
        queue_.push_back(node);
        cv_.notify_one();
        return true;
    }

    bool NodeTaskQueue::waitPop(std::size_t &out)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]() { return closed_ || !queue_.empty(); });
        if (queue_.empty())
        {
            return false;
        }
        out = queue_.front();
        queue_.pop_front();
        return true;
    }

    void NodeTaskQueue::close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    std::size_t NodeTaskQueue::drain()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::size_t dropped = queue_.size();
        queue_.clear();
        cv_.notify_all();
        return dropped;
    }

    bool NodeTaskQueue::closed() const noexcept
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t NodeTaskQueue::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    Orchestrator::Orchestrator(gen::GenerationClient &client, verify::VerificationRunner &runner,
                               const gen::PromptBuilder &prompts, OrchestratorOptions options,
                               proc::CancellationToken &cancel, Logger *logger, diag::Diagnostics *diags)
        : client_(client),
          runner_(runner),
          prompts_(prompts),
          options_(options),
          cancel_(cancel),
          logger_(logger),
          diags_(diags),
          classifier_(prompts.markers())
    {
        if (options_.maxRetries == 0)
        {
            throw std::invalid_argument("max_retries must be at least 1");
        }
        if (options_.parallelism == 0)
        {
            options_.parallelism = 1;
        }
    }

    void Orchestrator::expireBudget()
    {
        budgetExpired_.store(true);
        logTo(logger_, LogLevel::Error, "orchestrate",
              "run budget of " + std::to_string(options_.runBudget.count()) + "ms expired; cancelling");
        cancel_.cancel();
    }

    design::DesignResult Orchestrator::run(const design::DesignRequest &request)
    {
        budgetExpired_.store(false);
        std::optional<Watchdog> watchdog;
        if (options_.runBudget.count() > 0)
        {
            watchdog.emplace(options_.runBudget, [this]() { expireBudget(); });
        }

        std::optional<plan::DesignPlan> designPlan;
        std::string failure;
        plan::PlanBuilder builder(client_, prompts_, logger_, diags_);
        try
        {
            designPlan.emplace(builder.build(request));
        }
        catch (const plan::PlanningError &ex)
        {
            failure = std::string("planning failed (") + plan::toString(ex.kind()) + "): " + ex.what();
        }
        catch (const gen::GenerationError &ex)
        {
            failure = std::string("planning failed: ") + ex.what();
        }

        if (!designPlan)
        {
            logTo(logger_, LogLevel::Error, "orchestrate", failure);
            design::DesignResult result;
            result.status = design::DesignStatus::Aborted;
            result.reason = budgetExpired_.load() ? "run budget expired during planning" : failure;
            return result;
        }
        return executePlan(*designPlan);
    }

    design::DesignResult Orchestrator::execute(const plan::DesignPlan &plan)
    {
        budgetExpired_.store(false);
        std::optional<Watchdog> watchdog;
        if (options_.runBudget.count() > 0)
        {
            watchdog.emplace(options_.runBudget, [this]() { expireBudget(); });
        }
        return executePlan(plan);
    }

    design::DesignResult Orchestrator::executePlan(const plan::DesignPlan &plan)
    {
        design::ModuleContext context;
        gen::ModuleGenerator generator(client_, prompts_, logger_);
        ModuleVerifier verifier(generator, runner_, classifier_, options_.maxRetries, logger_);
        verifier.setAttemptObserver(observer_);
        verifier.setSimulationTimeout(options_.simTimeout);

        ResultSlots results(plan.size());
        const bool parallel = options_.parallelism > 1 && plan.size() > 1;
        logTo(logger_, LogLevel::Info, "orchestrate",
              "executing " + std::to_string(plan.size()) + " module(s)" +
                  (parallel ? " on " + std::to_string(options_.parallelism) + " workers" : std::string()));
        if (parallel)
        {
            runParallel(plan, verifier, context, results);
        }
        else
        {
            runSerial(plan, verifier, context, results);
        }
        return compose(plan, std::move(results));
    }

    design::ModuleResult Orchestrator::runNode(ModuleVerifier &verifier, const design::PlanNode &node,
                                               const design::ModuleContext &context)
    {
        if (cancel_.cancelled())
        {
            return makeAborted(node.name, "run cancelled before the module started");
        }
        try
        {
            return verifier.run(node, context.snapshot(), &cancel_);
        }
        catch (const std::exception &ex)
        {
            logTo(logger_, LogLevel::Error, "orchestrate", node.name + ": " + ex.what());
            return makeAborted(node.name, std::string("internal error: ") + ex.what());
        }
    }

    void Orchestrator::runSerial(const plan::DesignPlan &plan, ModuleVerifier &verifier,
                                 design::ModuleContext &context, ResultSlots &results)
    {
        const auto &nodes = plan.nodes();
        for (std::size_t i = 0; i < nodes.size(); ++i)
        {
            if (results[i])
            {
                continue;
            }
            design::ModuleResult result = runNode(verifier, nodes[i], context);
            if (result.status == design::ModuleStatus::Verified)
            {
                context.add(*result.verified);
            }
            else if (!cancel_.cancelled())
            {
                for (const std::string &dependent : plan.transitiveDependents(nodes[i].name))
                {
                    const std::size_t index = plan.indexOf(dependent);
                    if (!results[index])
                    {
                        logTo(logger_, LogLevel::Warn, "orchestrate", "skipping " + dependent);
                        results[index] = makeSkipped(dependent, nodes[i].name);
                    }
                }
            }
            results[i] = std::move(result);
        }
    }

    void Orchestrator::runParallel(const plan::DesignPlan &plan, ModuleVerifier &verifier,
                                   design::ModuleContext &context, ResultSlots &results)
    {
        const auto &nodes = plan.nodes();
        const std::size_t total = nodes.size();

        std::vector<std::size_t> waiting(total, 0);
        std::vector<std::vector<std::size_t>> dependents(total);
        for (std::size_t i = 0; i < total; ++i)
        {
            waiting[i] = nodes[i].dependencies.size();
            for (const std::string &dep : nodes[i].dependencies)
            {
                dependents[plan.indexOf(dep)].push_back(i);
            }
        }

        NodeTaskQueue queue;
        std::mutex stateMutex;
        std::size_t resolved = 0;

        // Caller holds stateMutex.
        auto resolve = [&](std::size_t index, design::ModuleResult result) {
            if (results[index])
            {
                return;
            }
            results[index] = std::move(result);
            if (++resolved == total)
            {
                queue.close();
            }
        };

        for (std::size_t i = 0; i < total; ++i)
        {
            if (waiting[i] == 0)
            {
                queue.push(i);
            }
        }

        auto worker = [&]() {
            std::size_t index = 0;
            while (queue.waitPop(index))
            {
                const design::PlanNode &node = nodes[index];
                design::ModuleResult result = runNode(verifier, node, context);

                std::lock_guard<std::mutex> lock(stateMutex);
                const design::ModuleStatus status = result.status;
                if (status == design::ModuleStatus::Verified)
                {
                    context.add(*result.verified);
                }
                resolve(index, std::move(result));

                if (status == design::ModuleStatus::Verified)
                {
                    for (std::size_t dependent : dependents[index])
                    {
                        if (--waiting[dependent] == 0 && !results[dependent])
                        {
                            queue.push(dependent);
                        }
                    }
                    continue;
                }
                const bool cancelled = cancel_.cancelled();
                for (const std::string &name : plan.transitiveDependents(node.name))
                {
                    if (cancelled)
                    {
                        resolve(plan.indexOf(name), makeAborted(name, "run cancelled before the module started"));
                    }
                    else
                    {
                        logTo(logger_, LogLevel::Warn, "orchestrate", "skipping " + name);
                        resolve(plan.indexOf(name), makeSkipped(name, node.name));
                    }
                }
            }
        };

        const std::size_t workerCount = std::min<std::size_t>(options_.parallelism, total);
        std::vector<std::thread> workers;
        workers.reserve(workerCount);
        for (std::size_t i = 0; i < workerCount; ++i)
        {
            workers.emplace_back(worker);
        }
        for (std::thread &thread : workers)
        {
            thread.join();
        }
    }

    design::DesignResult Orchestrator::compose(const plan::DesignPlan &plan, ResultSlots results) const
    {
        design::DesignResult result;
        result.top = plan.top().name;
        bool allVerified = true;
        const auto &nodes = plan.nodes();
        for (std::size_t i = 0; i < nodes.size(); ++i)
        {
            design::ModuleResult module =
                results[i] ? std::move(*results[i]) : makeAborted(nodes[i].name, "never scheduled");
            if (module.status != design::ModuleStatus::Verified)
            {
                allVerified = false;
                if (module.status == design::ModuleStatus::Skipped)
                {
                    result.skippedNodes.push_back(module.node);
                }
                else
                {
                    result.failedNodes.push_back(module.node);
                }
            }
            result.modules.push_back(std::move(module));
        }

        if (allVerified)
        {
            for (const design::ModuleResult &module : result.modules)
            {
                if (!result.integratedDesign.empty())
                {
                    result.integratedDesign.push_back('\n');
                }
                result.integratedDesign.append(module.verified->implementation);
                if (result.integratedDesign.back() != '\n')
                {
                    result.integratedDesign.push_back('\n');
                }
            }
            result.status = design::DesignStatus::Verified;
            logTo(logger_, LogLevel::Info, "orchestrate", "design '" + result.top + "' verified");
            return result;
        }

        if (budgetExpired_.load() || cancel_.cancelled())
        {
            result.status = design::DesignStatus::Aborted;
            result.reason = budgetExpired_.load()
                                ? "run budget of " + std::to_string(options_.runBudget.count()) + "ms expired"
                                : std::string("run cancelled");
        }
        else
        {
            result.status = design::DesignStatus::PartiallyFailed;
            result.reason = "failed: " + joinNames(result.failedNodes);
            if (!result.skippedNodes.empty())
            {
                result.reason.append("; skipped: ");
                result.reason.append(joinNames(result.skippedNodes));
            }
        }
        logTo(logger_, LogLevel::Error, "orchestrate",
              std::string(design::toString(result.status)) + ": " + result.reason);
        return result;
    }

} // namespace veriloop::lib::flow
