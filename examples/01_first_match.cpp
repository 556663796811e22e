// ============================================================================
// Example 01: First Match Wins
// ============================================================================
//
// Three "mirrors" are queried in parallel. The definition of done accepts the
// first response that mentions the wanted package; the slower mirrors see
// their token cancelled and stop early.
//
// RUN:
//   cd build && ./01_first_match
//
// ============================================================================

#include "paratask/paratask.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace paratask;
using namespace std::chrono_literals;

// Pretend to download an index, a slice at a time
std::string FetchIndex(const CancellationToken& token, const std::string& mirror,
                       std::chrono::milliseconds latency, const std::string& body) {
    auto deadline = std::chrono::steady_clock::now() + latency;
    while (std::chrono::steady_clock::now() < deadline) {
        token.ThrowIfCancelled();
        std::this_thread::sleep_for(5ms);
    }
    std::cout << "  " << mirror << " answered" << std::endl;
    return body;
}

int main() {
    std::cout << "=== Paratask Example 01: First Match ===" << std::endl;
    std::cout << std::endl;

    SetLogLevel(LogLevel::Debug);

    TaskGroup<std::string> group;

    auto eu = group.AddTask("eu-mirror", [](const CancellationToken& token) {
        return FetchIndex(token, "eu-mirror", 400ms, "zlib openssl");
    }).Value();
    auto us = group.AddTask("us-mirror", [](const CancellationToken& token) {
        return FetchIndex(token, "us-mirror", 50ms, "zlib fmt openssl");
    }).Value();
    auto ap = group.AddTask("ap-mirror", [](const CancellationToken& token) {
        return FetchIndex(token, "ap-mirror", 800ms, "fmt");
    }).Value();

    auto ec = group.SetEvaluator([](const std::any& value, std::exception_ptr error, const std::string& name) {
        Outcome<std::string> outcome;
        if (error) return outcome;
        const auto& body = std::any_cast<const std::string&>(value);
        if (body.find("fmt") != std::string::npos) {
            outcome.SetValue(name).SetSucceeded(true);
        }
        return outcome;
    });
    if (ec) {
        std::cerr << "SetEvaluator: " << ec.message() << std::endl;
        return 1;
    }

    auto winner = group.WaitForSingleResult();
    if (winner.IsErr()) {
        std::cerr << "No single winner: " << winner.Error().message() << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "Winner: " << winner.Value() << std::endl;
    for (auto* task : {eu, us, ap}) {
        std::cout << "  " << task->Name() << ": " << ToString(task->Status()) << std::endl;
    }

    std::cout << std::endl;
    std::cout << "=== Done! ===" << std::endl;
    return 0;
}
