#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "application/ScanCoordinator.hpp"

using pdfcatalog::application::ScanCoordinator;

int main() {
    std::cout << "[Test] Starting ScanCoordinator test..." << std::endl;
    ScanCoordinator coordinator;
    std::atomic<bool> release{false};

    std::cout << "[Test] Single-flight rejection..." << std::endl;
    auto first = coordinator.trySubmit("slow scan", [&release]() {
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return 42;
    });
    assert(first.has_value());
    assert(coordinator.isBusy());

    auto rejected = coordinator.trySubmit("second scan", []() { return 7; });
    assert(!rejected.has_value());

    release = true;
    assert(first->get() == 42);
    std::cout << "[PASS] Single-flight rejection" << std::endl;

    std::cout << "[Test] Resubmission after completion..." << std::endl;
    auto second = coordinator.trySubmit("follow-up scan", []() { return 7; });
    assert(second.has_value());
    assert(second->get() == 7);
    std::cout << "[PASS] Resubmission" << std::endl;

    std::cout << "[Test] Exceptions reach the caller..." << std::endl;
    auto failing = coordinator.trySubmit("failing scan", []() -> int { throw std::runtime_error("disk gone"); });
    assert(failing.has_value());
    bool threw = false;
    try {
        failing->get();
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "disk gone";
    }
    assert(threw);
    coordinator.wait();
    assert(!coordinator.isBusy());
    std::cout << "[PASS] Exceptions" << std::endl;

    std::cout << "[Test] Many concurrent submitters, one winner at a time..." << std::endl;
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};
    std::atomic<int> completed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([&]() {
            auto result = coordinator.trySubmit("stress scan", [&]() {
                int now = ++running;
                int seen = maxRunning.load();
                while (now > seen && !maxRunning.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                --running;
                return 1;
            });
            if (result) {
                completed += result->get();
            }
        });
    }
    for (auto& t : threads) t.join();
    coordinator.wait();
    assert(maxRunning == 1);
    assert(completed >= 1);
    std::cout << "[PASS] Concurrent submitters (" << completed << " accepted)" << std::endl;

    std::cout << "[PASS] ScanCoordinatorTest" << std::endl;
    return 0;
}
