// ============================================================================
// Example 02: Per-Task Callbacks and a Completion Callback
// ============================================================================
//
// No definition of done here: every task runs to completion. Each task's
// callback sees its value or its error, and the group's completion callback
// runs once after all of them. Work failures of tasks without a callback go
// to the group's error handler.
//
// RUN:
//   cd build && ./02_callbacks
//
// ============================================================================

#include "paratask/paratask.hpp"

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace paratask;

int main() {
    std::cout << "=== Paratask Example 02: Callbacks ===" << std::endl;
    std::cout << std::endl;

    TaskGroup<int>::Options options;
    options.num_threads = 2;
    options.error_handler = [](const std::string& name, std::exception_ptr error) {
        std::cout << "  [error handler] " << name << ": " << DescribeException(error) << std::endl;
    };
    TaskGroup<int> group(options);

    std::atomic<int> total{0};

    for (int i = 1; i <= 3; ++i) {
        auto task = group.AddTask("square-" + std::to_string(i), [i] { return i * i; }).Value();
        auto ec = task->AttachCallback([&total, i](const std::optional<int>& value, std::exception_ptr) {
            if (value) {
                std::cout << "  square-" << i << " = " << *value << std::endl;
                total += *value;
            }
        });
        if (ec) {
            std::cerr << "AttachCallback: " << ec.message() << std::endl;
            return 1;
        }
    }

    // No callback: the failure reaches the error handler
    group.AddTask("broken", []() -> int { throw std::runtime_error("disk on fire"); });

    if (auto ec = group.SetCompletionCallback([&total] { std::cout << "  all done, total = " << total << std::endl; })) {
        std::cerr << "SetCompletionCallback: " << ec.message() << std::endl;
        return 1;
    }

    if (auto ec = group.WaitForTasks()) {
        std::cerr << "WaitForTasks: " << ec.message() << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
