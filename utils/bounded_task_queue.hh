/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <algorithm>
#include <exception>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <vector>

#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/util/noncopyable_function.hh>

namespace utils {

class queue_finalized_error : public std::logic_error {
public:
    queue_finalized_error()
        : std::logic_error("Attempted to add to a task queue that has already been executed")
    {}
};

// Runs the tasks of an ordered backlog, at most `concurrency` of them at any
// time, with a fixed pool of worker fibers that pull the next unstarted task
// from a shared cursor.
//
// execute() resolves with the results in submission order, independent of the
// order in which the tasks complete, or fails with the exception of the first
// task that failed. Once the outcome is known no further task is started.
// Tasks that are already running when a task fails are left to finish and
// their results are dropped; close() waits for them.
//
// The queue must be closed before it is destroyed if execute() was called.
template <typename T>
class bounded_task_queue {
public:
    using task = seastar::noncopyable_function<seastar::future<T>()>;

private:
    const unsigned _concurrency;
    std::vector<task> _backlog;
    std::vector<std::optional<T>> _results;
    std::vector<T> _ordered;
    size_t _submitted = 0;
    size_t _cursor = 0;
    unsigned _in_flight = 0;
    unsigned _max_in_flight = 0;
    bool _finalized = false;
    bool _done = false;
    seastar::shared_promise<std::vector<T>> _outcome;
    seastar::gate _workers;

    // _ordered is reserved by execute(), so nothing here allocates
    void resolve() {
        _done = true;
        for (auto& r : _results) {
            _ordered.push_back(std::move(*r));
        }
        _results.clear();
        _backlog.clear();
        _outcome.set_value(std::move(_ordered));
    }

    void reject(std::exception_ptr ex) {
        _done = true;
        _results.clear();
        _ordered.clear();
        _backlog.clear();
        _outcome.set_exception(std::move(ex));
    }

    seastar::future<> run_worker() {
        while (!_done && _cursor < _backlog.size()) {
            auto idx = _cursor++;
            auto fn = std::move(_backlog[idx]);
            ++_in_flight;
            _max_in_flight = std::max(_max_in_flight, _in_flight);

            std::exception_ptr ex;
            std::optional<T> res;
            try {
                res.emplace(co_await seastar::futurize_invoke(fn));
            } catch (...) {
                ex = std::current_exception();
            }
            --_in_flight;

            if (_done) {
                // Some other task failed while this one was running
                co_return;
            }
            if (ex) {
                reject(std::move(ex));
                co_return;
            }
            _results[idx] = std::move(res);
        }

        if (!_done && _in_flight == 0 && _cursor == _backlog.size()) {
            try {
                resolve();
            } catch (...) {
                reject(std::current_exception());
            }
        }
    }

public:
    explicit bounded_task_queue(unsigned concurrency) noexcept
        : _concurrency(concurrency)
    {}

    bounded_task_queue(const bounded_task_queue&) = delete;
    bounded_task_queue& operator=(const bounded_task_queue&) = delete;

    void add(task t) {
        if (_finalized) {
            throw queue_finalized_error();
        }
        _backlog.emplace_back(std::move(t));
        ++_submitted;
    }

    // Starts the workers on the first call. Subsequent calls don't start
    // anything, they return another future for the same outcome.
    seastar::future<std::vector<T>> execute() {
        if (!_finalized) {
            _finalized = true;
            try {
                _results.resize(_backlog.size());
                _ordered.reserve(_backlog.size());
            } catch (...) {
                reject(std::current_exception());
                return _outcome.get_shared_future();
            }

            auto workers = std::min<size_t>(_concurrency, _backlog.size());
            if (workers == 0) {
                // Nothing will ever run, not even with a non-empty backlog
                _results.clear();
                resolve();
            }
            for (size_t i = 0; i < workers; ++i) {
                auto gh = _workers.hold();
                // run_worker() never fails, errors are reported through _outcome
                std::ignore = run_worker().finally([gh = std::move(gh)] {});
            }
        }
        return _outcome.get_shared_future();
    }

    // Waits for every worker, including the ones still running a task after
    // the outcome was decided.
    seastar::future<> close() noexcept {
        return _workers.close();
    }

    unsigned concurrency() const noexcept { return _concurrency; }
    size_t size() const noexcept { return _submitted; }
    size_t started() const noexcept { return _cursor; }
    unsigned in_flight() const noexcept { return _in_flight; }
    unsigned max_in_flight() const noexcept { return _max_in_flight; }
    bool finalized() const noexcept { return _finalized; }
};

} // namespace utils
