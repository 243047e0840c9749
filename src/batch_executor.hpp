#pragma once

// Parallel fan-out for batch patch application, built on Taskflow.
//
// One process-global tf::Executor (work-stealing, sized to
// std::thread::hardware_concurrency()) runs one task per document.
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

#include <cstddef>
#include <utility>

namespace jsonmerge_cpp::detail {

// Created on first batch, destroyed at exit.
inline auto batch_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

// Call fn(i) for every i in [0, count) and block until all calls return.
// Callers capture expected failures per index; anything else propagates.
template <typename Fn>
void for_each_document(std::size_t count, Fn&& fn) {
    if (count == 0) return;

    auto first = std::size_t{0};
    auto last = count;
    auto step = std::size_t{1};

    auto taskflow = tf::Taskflow{"patch_batch"};
    taskflow.for_each_index(first, last, step, std::forward<Fn>(fn));
    batch_executor().run(taskflow).get();
}

}  // namespace jsonmerge_cpp::detail
