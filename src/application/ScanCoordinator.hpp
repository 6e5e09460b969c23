/**
 * @file ScanCoordinator.hpp
 * @brief Runs one library scan at a time on a background thread.
 */

#pragma once

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include "infrastructure/Log.hpp"

namespace pdfcatalog::application {

/**
 * @class ScanCoordinator
 * @brief Single-flight background execution.
 *
 * A second submission while a scan is outstanding is rejected. Scans cannot
 * be cancelled: a caller that no longer wants the result drops the future.
 * The destructor waits for the running scan.
 */
class ScanCoordinator {
public:
    ScanCoordinator() = default;
    ~ScanCoordinator() { wait(); }

    ScanCoordinator(const ScanCoordinator&) = delete;
    ScanCoordinator& operator=(const ScanCoordinator&) = delete;

    /**
     * @brief Starts f on the worker thread unless a scan is already running.
     * @return Future for f's result (exceptions propagate through get()), or
     * std::nullopt when rejected.
     */
    template <typename F>
    std::optional<std::future<std::invoke_result_t<F>>> trySubmit(const std::string& description, F&& f) {
        using Result = std::invoke_result_t<F>;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_busy) {
            infrastructure::Log::Warn("ScanCoordinator", "Rejected '" + description + "': '" + m_description +
                                      "' is still running");
            return std::nullopt;
        }
        if (m_worker.joinable()) {
            m_worker.join();
        }

        m_busy = true;
        m_description = description;

        auto promise = std::make_shared<std::promise<Result>>();
        std::future<Result> future = promise->get_future();

        // The busy flag is cleared before the result is published, so a caller
        // that resubmits right after get() is never rejected.
        m_worker = std::thread([this, promise, fn = std::decay_t<F>(std::forward<F>(f))]() mutable {
            try {
                if constexpr (std::is_void_v<Result>) {
                    fn();
                    m_busy = false;
                    promise->set_value();
                } else {
                    Result result = fn();
                    m_busy = false;
                    promise->set_value(std::move(result));
                }
            } catch (...) {
                m_busy = false;
                promise->set_exception(std::current_exception());
            }
        });
        return future;
    }

    /** @brief True while a scan is running. */
    bool isBusy() const { return m_busy; }

    /** @brief Blocks until the current scan (if any) has finished. */
    void wait() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_worker.joinable()) {
            m_worker.join();
        }
    }

private:
    std::atomic<bool> m_busy{false};
    std::string m_description;
    std::thread m_worker;
    std::mutex m_mutex;
};

} // namespace pdfcatalog::application
