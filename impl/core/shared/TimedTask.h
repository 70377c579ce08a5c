#pragma once

#ifndef TIMED_TASK_H
#define TIMED_TASK_H

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <thread>
#include <utility>

namespace MDS {
    // Runs `task` on a worker thread and waits up to `timeout` for it.
    // Returns std::nullopt on timeout, leaving the worker detached; the worker owns
    // its promise and its copy of the task, so it may finish after the caller returns.
    // An exception thrown by the task is rethrown here.
    template<typename Result>
    std::optional<Result> runWithTimeout(std::function<Result()> task, std::chrono::milliseconds timeout) {
        std::promise<Result> prom;
        auto fut = prom.get_future();
        std::thread th([prom = std::move(prom), task = std::move(task)]() mutable {
            try {
                prom.set_value(task());
            }
            catch (...) {
                prom.set_exception(std::current_exception());
            }
        });
        if (fut.wait_for(timeout) != std::future_status::ready) {
            th.detach();
            return std::nullopt;
        }
        th.join();
        return fut.get();
    }
}

#endif // TIMED_TASK_H
