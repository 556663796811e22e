// ============================================================================
// TaskGroup Tests
// ============================================================================
//
// Groups on an InlineExecutor run every stage on the calling thread in a
// fixed order, which makes cancellation outcomes deterministic. Groups on a
// ThreadPoolExecutor cover the concurrent paths.
//
// ============================================================================

#include "paratask/core/task_group.hpp"

#include <gtest/gtest.h>

#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

#include "paratask/io/inline_executor.hpp"
#include "paratask/io/thread_pool_executor.hpp"

using namespace paratask;
using namespace std::chrono_literals;

namespace {

class TaskGroupTest : public ::testing::Test {
   protected:
    void SetUp() override {
        SetLogSink([this](LogLevel, std::string_view message) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.emplace_back(message);
        });
    }

    void TearDown() override { SetLogSink(nullptr); }

    bool Logged(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& l : lines_) {
            if (l == line) return true;
        }
        return false;
    }

   private:
    std::mutex mutex_;
    std::vector<std::string> lines_;
};

template <typename R>
typename TaskGroup<R>::Options PoolOptions(size_t threads) {
    typename TaskGroup<R>::Options options;
    options.num_threads = threads;
    return options;
}

Outcome<std::string> ContainsApple(const std::any& value, std::exception_ptr, const std::string&) {
    Outcome<std::string> outcome;
    if (const auto* body = std::any_cast<std::string>(&value)) {
        outcome.SetValue(*body).SetSucceeded(body->find("apple") != std::string::npos);
    }
    return outcome;
}

// Block until cancelled, bounded so a broken sweep fails instead of hanging
std::string WaitForCancel(const CancellationToken& token, const std::string& body) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!token.IsCancelled() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    token.ThrowIfCancelled();
    return body;
}

void SpinUntil(const std::atomic<int>& counter, int target) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (counter.load() < target && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::yield();
    }
}

class CountingContext : public LoggingContext {
   public:
    void Acquire() override { ++acquired; }
    void Release() override { ++released; }

    std::atomic<int> acquired{0};
    std::atomic<int> released{0};
};

}  // namespace

// ============================================================================
// Basic Lifecycle
// ============================================================================

TEST_F(TaskGroupTest, RunsAllTasksAndCompletionCallback) {
    TaskGroup<std::string> group(PoolOptions<std::string>(2));
    std::atomic<bool> completed{false};

    auto a = group.AddTask("a", [] { return std::string("A"); }).Value();
    auto b = group.AddTask("b", [] { return std::string("B"); }).Value();
    auto c = group.AddTask("c", [] { return std::string("C"); }).Value();
    ASSERT_FALSE(group.SetCompletionCallback([&completed] { completed = true; }));

    EXPECT_FALSE(group.WaitForTasks());

    EXPECT_TRUE(completed.load());
    EXPECT_TRUE(group.IsDone());
    EXPECT_TRUE(group.Registry().IsEmpty());
    EXPECT_EQ(a->GetValue(), "A");
    EXPECT_EQ(b->GetValue(), "B");
    EXPECT_EQ(c->GetValue(), "C");
    EXPECT_EQ(b->Status(), TaskStatus::Succeeded);
    EXPECT_EQ(group.CountRemaining(), 0u);
}

TEST_F(TaskGroupTest, NothingRunsBeforeStart) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);
    bool ran = false;

    group.AddTask("t", [&ran] {
        ran = true;
        return 1;
    });

    EXPECT_FALSE(ran);
    EXPECT_FALSE(group.IsStarted());
    EXPECT_FALSE(group.IsDone());
    EXPECT_EQ(group.Size(), 1u);
    EXPECT_EQ(group.CountRemaining(), 1u);

    EXPECT_FALSE(group.Start());
    EXPECT_TRUE(ran);
    EXPECT_TRUE(group.IsDone());
}

TEST_F(TaskGroupTest, StartIsIdempotent) {
    TaskGroup<int> group(PoolOptions<int>(2));
    std::atomic<int> runs{0};
    group.AddTask("t", [&runs] { return ++runs; });

    EXPECT_FALSE(group.Start());
    EXPECT_FALSE(group.Start());
    EXPECT_FALSE(group.WaitForTasks());

    EXPECT_EQ(runs.load(), 1);
}

TEST_F(TaskGroupTest, VoidWorkProducesMonostate) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);
    int calls = 0;

    auto task = group.AddTask("side-effect", [&calls] { ++calls; }).Value();
    static_assert(std::is_same_v<decltype(task), TaskHandle<std::monostate>*>);

    EXPECT_FALSE(group.WaitForTasks());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(task->Status(), TaskStatus::Succeeded);
}

TEST_F(TaskGroupTest, SharedExecutorAcrossGroups) {
    ThreadPoolExecutor pool(2);
    TaskGroup<int> first(pool);
    TaskGroup<int> second(pool);

    first.AddTask("one", [] { return 1; });
    second.AddTask("two", [] { return 2; });

    EXPECT_EQ(&first.GetExecutor(), &pool);
    EXPECT_FALSE(first.WaitForTasks());
    EXPECT_FALSE(second.WaitForTasks());
    EXPECT_TRUE(pool.IsRunning());
}

TEST_F(TaskGroupTest, DestructorWaitsForStartedGroup) {
    std::atomic<int> finished{0};
    {
        TaskGroup<int> group(PoolOptions<int>(2));
        for (int i = 0; i < 4; ++i) {
            group.AddTask("slow", [&finished, i] {
                std::this_thread::sleep_for(10ms);
                finished++;
                return i;
            });
        }
        ASSERT_FALSE(group.Start());
    }
    EXPECT_EQ(finished.load(), 4);
}

TEST_F(TaskGroupTest, UnstartedGroupDestroysWithoutRunning) {
    std::atomic<bool> ran{false};
    {
        TaskGroup<int> group(PoolOptions<int>(1));
        group.AddTask("never", [&ran] {
            ran = true;
            return 0;
        });
    }
    EXPECT_FALSE(ran.load());
}

// ============================================================================
// Structural Errors
// ============================================================================

TEST_F(TaskGroupTest, EmptyGroupHasNoTasks) {
    TaskGroup<int> group(PoolOptions<int>(1));

    EXPECT_EQ(group.Start(), Errc::NoTasks);
    EXPECT_EQ(group.WaitForTasks(), Errc::NoTasks);
    EXPECT_EQ(group.WaitForResults().Error(), Errc::NoTasks);
    EXPECT_FALSE(group.IsStarted());
}

TEST_F(TaskGroupTest, MutationAfterStartFails) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);
    auto task = group.AddTask("t", [] { return 1; }).Value();
    ASSERT_FALSE(group.Start());

    auto late = group.AddTask("late", [] { return 2; });
    ASSERT_TRUE(late.IsErr());
    EXPECT_EQ(late.Error(), Errc::AlreadyStarted);

    EXPECT_EQ(group.SetEvaluator([](const std::any&, std::exception_ptr, const std::string&) {
        return Outcome<int>::Success(1);
    }), Errc::AlreadyStarted);
    EXPECT_EQ(group.SetCompletionCallback([] {}), Errc::AlreadyStarted);
    EXPECT_EQ(task->AttachCallback([](const std::optional<int>&, std::exception_ptr) {}), Errc::AlreadyStarted);
    EXPECT_EQ(group.Size(), 1u);
}

TEST_F(TaskGroupTest, EmptyCallablesRejected) {
    TaskGroup<int> group(PoolOptions<int>(1));

    auto added = group.AddTask("empty", std::function<int()>{});
    ASSERT_TRUE(added.IsErr());
    EXPECT_EQ(added.Error(), Errc::InvalidArgument);
    EXPECT_EQ(group.SetEvaluator(EvaluatorFn<int>{}), Errc::InvalidArgument);
    EXPECT_EQ(group.SetCompletionCallback(nullptr), Errc::InvalidArgument);
    EXPECT_EQ(group.Size(), 0u);
}

TEST_F(TaskGroupTest, StoppedExecutorRefusesToStart) {
    ThreadPoolExecutor pool(2);
    pool.Stop();
    std::atomic<bool> ran{false};

    {
        TaskGroup<int> group(pool);
        group.AddTask("t", [&ran] {
            ran = true;
            return 1;
        });

        EXPECT_EQ(group.Start(), Errc::ExecutorStopped);
        EXPECT_EQ(group.WaitForTasks(), Errc::ExecutorStopped);
        EXPECT_EQ(group.WaitForSingleResult().Error(), Errc::ExecutorStopped);
        EXPECT_FALSE(group.IsStarted());
        EXPECT_TRUE(Logged("Cannot start 1 tasks on a stopped executor"));
    }
    EXPECT_FALSE(ran.load());
}

TEST_F(TaskGroupTest, StoppedInlineExecutorRefusesToStart) {
    InlineExecutor executor;
    executor.Stop();
    TaskGroup<int> group(executor);
    group.AddTask("t", [] { return 1; });

    EXPECT_EQ(group.WaitForTasks(), Errc::ExecutorStopped);
    EXPECT_FALSE(group.IsDone());
}

// ============================================================================
// Work Failures
// ============================================================================

TEST_F(TaskGroupTest, WorkErrorGoesToErrorHandler) {
    std::mutex mutex;
    std::vector<std::string> reported;

    TaskGroup<int>::Options options;
    options.num_threads = 2;
    options.error_handler = [&](const std::string& name, std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex);
        reported.push_back(name + ": " + DescribeException(error));
    };
    TaskGroup<int> group(options);

    auto bad = group.AddTask("bad", []() -> int { throw std::runtime_error("boom"); }).Value();
    group.AddTask("good", [] { return 1; });

    // Work failures never surface through the wait
    EXPECT_FALSE(group.WaitForTasks());

    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0], "bad: boom");
    EXPECT_EQ(bad->Status(), TaskStatus::Failed);
    EXPECT_FALSE(bad->GetValue().has_value());
    EXPECT_EQ(DescribeException(bad->Exception()), "boom");
}

TEST_F(TaskGroupTest, WorkErrorLoggedByDefault) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);
    group.AddTask("fetch", []() -> int { throw std::runtime_error("connection refused"); });

    EXPECT_FALSE(group.WaitForTasks());
    EXPECT_TRUE(Logged("Exception running task [fetch]: connection refused"));
}

TEST_F(TaskGroupTest, ThrowingErrorHandlerIsContained) {
    InlineExecutor executor;
    TaskGroup<int>::Options options;
    options.executor = &executor;
    options.error_handler = [](const std::string&, std::exception_ptr) { throw std::runtime_error("handler"); };
    TaskGroup<int> group(options);
    group.AddTask("t", []() -> int { throw std::runtime_error("work"); });

    EXPECT_FALSE(group.WaitForTasks());
    EXPECT_TRUE(group.IsDone());
    EXPECT_TRUE(Logged("Exception in error handler for task [t]: handler"));
}

// ============================================================================
// Per-Task Callbacks
// ============================================================================

TEST_F(TaskGroupTest, CallbackSeesValueOrError) {
    TaskGroup<int> group(PoolOptions<int>(2));
    std::atomic<int> seen_value{0};
    std::atomic<bool> seen_error{false};

    auto ok = group.AddTask("ok", [] { return 42; }).Value();
    auto bad = group.AddTask("bad", []() -> int { throw std::runtime_error("nope"); }).Value();

    ASSERT_FALSE(ok->AttachCallback([&](const std::optional<int>& value, std::exception_ptr error) {
        if (value && !error) seen_value = *value;
    }));
    ASSERT_FALSE(bad->AttachCallback([&](const std::optional<int>& value, std::exception_ptr error) {
        seen_error = !value && error != nullptr;
    }));

    EXPECT_FALSE(group.WaitForTasks());

    EXPECT_EQ(seen_value.load(), 42);
    EXPECT_TRUE(seen_error.load());
    // The callback owns the failure; the default channel stays quiet
    EXPECT_FALSE(Logged("Exception running task [bad]: nope"));
}

TEST_F(TaskGroupTest, CallbackRunsBeforeEvaluation) {
    InlineExecutor executor;
    TaskGroup<std::string> group(executor);
    std::vector<std::string> order;

    auto task = group.AddTask("t", [&order] {
        order.push_back("work");
        return std::string("pear");
    }).Value();
    ASSERT_FALSE(task->AttachCallback([&order](const std::optional<std::string>&, std::exception_ptr) {
        order.push_back("callback");
    }));
    ASSERT_FALSE(group.SetEvaluator([&order](const std::any& value, std::exception_ptr error,
                                             const std::string& name) {
        order.push_back("evaluate");
        return ContainsApple(value, error, name);
    }));
    ASSERT_FALSE(group.SetCompletionCallback([&order] { order.push_back("complete"); }));

    EXPECT_FALSE(group.WaitForTasks());
    EXPECT_EQ(order, (std::vector<std::string>{"work", "callback", "evaluate", "complete"}));
    EXPECT_EQ(task->State(), TaskState::EvaluationDone);
}

TEST_F(TaskGroupTest, ThrowingCallbackDoesNotStopPipeline) {
    InlineExecutor executor;
    TaskGroup<std::string> group(executor);

    auto task = group.AddTask("t", [] { return std::string("apple"); }).Value();
    ASSERT_FALSE(task->AttachCallback([](const std::optional<std::string>&, std::exception_ptr) {
        throw std::runtime_error("oops");
    }));
    ASSERT_FALSE(group.SetEvaluator(ContainsApple));

    auto single = group.WaitForSingleResult();
    ASSERT_TRUE(single.IsOk());
    EXPECT_EQ(single.Value(), "apple");
    EXPECT_TRUE(Logged("Exception executing callback for [t]: oops"));
}

// ============================================================================
// Completion Callback
// ============================================================================

TEST_F(TaskGroupTest, WaitObservesCompletionCallbackEffects) {
    TaskGroup<int> group(PoolOptions<int>(2));
    int written = 0;

    group.AddTask("t", [] { return 1; });
    ASSERT_FALSE(group.SetCompletionCallback([&written] {
        std::this_thread::sleep_for(20ms);
        written = 7;
    }));

    EXPECT_FALSE(group.WaitForTasks());
    EXPECT_EQ(written, 7);
}

TEST_F(TaskGroupTest, ThrowingCompletionCallbackStillResolves) {
    TaskGroup<int> group(PoolOptions<int>(1));
    group.AddTask("t", [] { return 1; });
    ASSERT_FALSE(group.SetCompletionCallback([] { throw std::runtime_error("final"); }));

    EXPECT_FALSE(group.WaitForTasks());
    EXPECT_TRUE(group.IsDone());
    EXPECT_TRUE(Logged("Exception executing completion callback: final"));
}

// ============================================================================
// Definition of Done
// ============================================================================

TEST_F(TaskGroupTest, FirstMatchCancelsSiblings) {
    TaskGroup<std::string> group(PoolOptions<std::string>(4));

    auto google = group.AddTask("google", [](const CancellationToken& token) {
        return WaitForCancel(token, "google.com");
    }).Value();
    auto apple = group.AddTask("apple", [] { return std::string("<html>apple</html>"); }).Value();
    auto yahoo = group.AddTask("yahoo", [](const CancellationToken& token) {
        return WaitForCancel(token, "yahoo.com");
    }).Value();
    ASSERT_FALSE(group.SetEvaluator(ContainsApple));

    auto single = group.WaitForSingleResult();
    ASSERT_TRUE(single.IsOk()) << single.Error().message();
    EXPECT_EQ(single.Value(), "<html>apple</html>");

    EXPECT_EQ(google->Status(), TaskStatus::Cancelled);
    EXPECT_EQ(yahoo->Status(), TaskStatus::Cancelled);
    EXPECT_EQ(apple->State(), TaskState::EvaluationDone);

    EXPECT_TRUE(group.Registry().ResultFor(apple->Id())->IsSuccessful());
    EXPECT_FALSE(group.Registry().Contains(google->Id()));
    EXPECT_FALSE(group.Registry().Contains(yahoo->Id()));
}

TEST_F(TaskGroupTest, InlineCancellationIsDeterministic) {
    InlineExecutor executor;
    TaskGroup<std::string> group(executor);
    bool third_ran = false;

    auto t1 = group.AddTask("t1", [] { return std::string("pear"); }).Value();
    auto t2 = group.AddTask("t2", [] { return std::string("apple"); }).Value();
    auto t3 = group.AddTask("t3", [&third_ran] {
        third_ran = true;
        return std::string("apple too");
    }).Value();
    ASSERT_FALSE(group.SetEvaluator(ContainsApple));

    auto results = group.WaitForResults();
    ASSERT_TRUE(results.IsOk());

    EXPECT_FALSE(third_ran);
    EXPECT_EQ(t1->State(), TaskState::EvaluationDone);
    EXPECT_EQ(t2->State(), TaskState::EvaluationDone);
    EXPECT_EQ(t3->State(), TaskState::Cancelled);

    const auto& snapshot = results.Value();
    EXPECT_EQ(snapshot.GetTasks(), (std::vector<std::string>{"t1", "t2"}));
    EXPECT_FALSE(snapshot.Find("t1")->IsSuccessful());
    EXPECT_TRUE(snapshot.Find("t2")->IsSuccessful());
    EXPECT_EQ(snapshot.SuccessCount(), 1u);
}

TEST_F(TaskGroupTest, EvaluationRunsWithoutCallbacks) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);

    group.AddTask("a", [] { return 1; });
    group.AddTask("b", []() -> int { throw std::runtime_error("fail"); });
    ASSERT_FALSE(group.SetEvaluator([](const std::any& value, std::exception_ptr error, const std::string&) {
        Outcome<int> outcome;
        if (!error) outcome.SetValue(std::any_cast<int>(value));
        return outcome;
    }));

    auto results = group.WaitForResults();
    ASSERT_TRUE(results.IsOk());
    EXPECT_EQ(results.Value().Size(), 2u);
    EXPECT_EQ(results.Value().Find("a")->Value(), 1);
    EXPECT_FALSE(results.Value().Find("b")->HasValue());
}

TEST_F(TaskGroupTest, MixedValueTypesInOneGroup) {
    InlineExecutor executor;
    TaskGroup<std::string> group(executor);

    group.AddTask("number", [] { return 404; });
    group.AddTask("body", [] { return std::string("found"); });
    ASSERT_FALSE(group.SetEvaluator([](const std::any& value, std::exception_ptr, const std::string&) {
        Outcome<std::string> outcome;
        if (const auto* code = std::any_cast<int>(&value)) {
            outcome.SetValue(std::to_string(*code));
        } else if (const auto* body = std::any_cast<std::string>(&value)) {
            outcome.SetValue(*body).SetSucceeded(true);
        }
        return outcome;
    }));

    auto single = group.WaitForSingleResult();
    ASSERT_TRUE(single.IsOk());
    EXPECT_EQ(single.Value(), "found");

    auto number = group.Registry().Snapshot().Find("number");
    ASSERT_TRUE(number.has_value());
    EXPECT_EQ(number->Value(), "404");
}

TEST_F(TaskGroupTest, ThrowingEvaluatorRecordsUnsuccessfulOutcome) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);
    group.AddTask("t", [] { return 1; });
    ASSERT_FALSE(group.SetEvaluator([](const std::any&, std::exception_ptr, const std::string&) -> Outcome<int> {
        throw std::runtime_error("evaluator");
    }));

    auto single = group.WaitForSingleResult();
    ASSERT_TRUE(single.IsErr());
    EXPECT_EQ(single.Error(), Errc::NoResult);
    EXPECT_EQ(group.Registry().Size(), 1u);
    EXPECT_TRUE(Logged("Exception with definition of done on task [t]: evaluator"));
}

TEST_F(TaskGroupTest, DuplicateNamesRecordedSeparately) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);
    auto first = group.AddTask("dup", [] { return 1; }).Value();
    auto second = group.AddTask("dup", [] { return 2; }).Value();
    ASSERT_FALSE(group.SetEvaluator([](const std::any& value, std::exception_ptr, const std::string&) {
        return Outcome<int>(false, std::any_cast<int>(value));
    }));

    auto results = group.WaitForResults().Value();
    EXPECT_EQ(results.Size(), 2u);
    EXPECT_EQ(results.GetResults().size(), 1u);
    EXPECT_EQ(results.ResultFor(first->Id())->Value(), 1);
    EXPECT_EQ(results.ResultFor(second->Id())->Value(), 2);
}

// ============================================================================
// WaitForSingleResult
// ============================================================================

TEST_F(TaskGroupTest, SingleResultWithoutEvaluatorIsNoResult) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);
    group.AddTask("t", [] { return 1; });

    auto single = group.WaitForSingleResult();
    ASSERT_TRUE(single.IsErr());
    EXPECT_EQ(single.Error(), Errc::NoResult);
}

TEST_F(TaskGroupTest, SingleResultWithoutValueIsEmptyResult) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);
    group.AddTask("t", [] { return 1; });
    ASSERT_FALSE(group.SetEvaluator([](const std::any&, std::exception_ptr, const std::string&) {
        return Outcome<int>().SetSucceeded(true);
    }));

    auto single = group.WaitForSingleResult();
    ASSERT_TRUE(single.IsErr());
    EXPECT_EQ(single.Error(), Errc::EmptyResult);
}

TEST_F(TaskGroupTest, SimultaneousSuccessesAreAmbiguous) {
    TaskGroup<int> group(PoolOptions<int>(2));
    std::atomic<int> evaluating{0};

    group.AddTask("a", [] { return 1; });
    group.AddTask("b", [] { return 2; });
    // Both evaluations are past their cancellation check before either
    // returns, so neither sweep can stop the other.
    ASSERT_FALSE(group.SetEvaluator([&evaluating](const std::any& value, std::exception_ptr, const std::string&) {
        evaluating++;
        SpinUntil(evaluating, 2);
        return Outcome<int>::Success(std::any_cast<int>(value));
    }));

    auto results = group.WaitForResults();
    ASSERT_TRUE(results.IsOk());
    EXPECT_TRUE(results.Value().HasMoreThanOneResult());

    auto single = group.WaitForSingleResult();
    ASSERT_TRUE(single.IsErr());
    EXPECT_EQ(single.Error(), Errc::AmbiguousResult);
}

// ============================================================================
// Manual Cancellation
// ============================================================================

TEST_F(TaskGroupTest, CancelBeforeStartSkipsAllWork) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);
    bool ran = false;
    bool completed = false;

    auto task = group.AddTask("t", [&ran] {
        ran = true;
        return 1;
    }).Value();
    ASSERT_FALSE(group.SetCompletionCallback([&completed] { completed = true; }));

    group.CancelRemaining();
    EXPECT_FALSE(group.WaitForTasks());

    EXPECT_FALSE(ran);
    EXPECT_TRUE(completed);
    EXPECT_EQ(task->Status(), TaskStatus::Cancelled);
    EXPECT_FALSE(task->Cancel());
}

TEST_F(TaskGroupTest, CancelledCallbackIsSkipped) {
    InlineExecutor executor;
    TaskGroup<int> group(executor);
    bool callback_ran = false;

    TaskHandle<int>* task = nullptr;
    task = group.AddTask("t", [&task] {
        // Cancellation arriving after the work finished still skips the
        // stages that have not begun
        task->Cancel();
        return 1;
    }).Value();
    ASSERT_FALSE(task->AttachCallback([&callback_ran](const std::optional<int>&, std::exception_ptr) {
        callback_ran = true;
    }));

    EXPECT_FALSE(group.WaitForTasks());
    EXPECT_FALSE(callback_ran);
    EXPECT_EQ(task->State(), TaskState::Cancelled);
    EXPECT_EQ(task->GetValue(), 1);
}

TEST_F(TaskGroupTest, SkippedCallbackHandsErrorToHandler) {
    InlineExecutor executor;
    std::vector<std::string> reported;
    bool callback_ran = false;

    TaskGroup<int>::Options options;
    options.executor = &executor;
    options.error_handler = [&reported](const std::string& name, std::exception_ptr error) {
        reported.push_back(name + ": " + DescribeException(error));
    };
    TaskGroup<int> group(options);

    TaskHandle<int>* task = nullptr;
    task = group.AddTask("t", [&task]() -> int {
        task->Cancel();
        throw std::runtime_error("late failure");
    }).Value();
    ASSERT_FALSE(task->AttachCallback([&callback_ran](const std::optional<int>&, std::exception_ptr) {
        callback_ran = true;
    }));

    EXPECT_FALSE(group.WaitForTasks());
    EXPECT_FALSE(callback_ran);
    EXPECT_EQ(task->Status(), TaskStatus::Cancelled);
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0], "t: late failure");
}

// ============================================================================
// Logging Context
// ============================================================================

TEST_F(TaskGroupTest, LoggingContextWrapsEveryStage) {
    InlineExecutor executor;
    auto context = std::make_shared<CountingContext>();

    TaskGroup<int>::Options options;
    options.executor = &executor;
    options.logging_context = context;
    TaskGroup<int> group(options);

    auto with_callback = group.AddTask("a", [&context] {
        EXPECT_EQ(context->acquired.load() - context->released.load(), 1);
        return 1;
    }).Value();
    group.AddTask("b", [] { return 2; });
    ASSERT_FALSE(with_callback->AttachCallback([](const std::optional<int>&, std::exception_ptr) {}));
    ASSERT_FALSE(group.SetEvaluator([](const std::any&, std::exception_ptr, const std::string&) {
        return Outcome<int>::Failure();
    }));
    ASSERT_FALSE(group.SetCompletionCallback([] {}));

    EXPECT_FALSE(group.WaitForTasks());

    // a: work, callback, evaluation; b: work, evaluation; completion callback
    EXPECT_EQ(context->acquired.load(), 6);
    EXPECT_EQ(context->released.load(), 6);
}
