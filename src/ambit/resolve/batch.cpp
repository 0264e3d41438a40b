// batch.cpp created on 2026-09-20 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "batch.h"
#include <ambit/core/sys.h>
#include <ambit/core/log.h>

#include <thread>
#include <atomic>
#include <mutex>
#include <exception>
#include <algorithm>

namespace ambit::resolve {

using namespace ambit::core;


std::vector<BatchResult> resolve_batch(const Resolver& resolver, const DeclarationTable& table,
                                       const std::vector<BatchJob>& jobs, unsigned n_threads)
{
    if (n_threads == 0)
        n_threads = unsigned(std::max(cpu_count(), 1));
    n_threads = std::min<unsigned>(n_threads, std::max<size_t>(jobs.size(), 1));

    std::vector<BatchResult> results(jobs.size());
    std::atomic<size_t> next {0};
    std::atomic<bool> abort {false};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&] {
        for (;;) {
            const size_t i = next.fetch_add(1);
            if (i >= jobs.size() || abort)
                return;
            const auto& job = jobs[i];
            try {
                results[i].call = resolver.bind_call(table, job.frames, job.call);
            } catch (const ResolveError& e) {
                results[i].error = e;
            } catch (const ContractViolation& e) {
                log::error("batch job {} ({}): {}", i, job.call.name, e);
                std::lock_guard lock(failure_mutex);
                if (!failure)
                    failure = std::current_exception();
                abort = true;
            } catch (const std::exception& e) {
                log::error("batch job {} ({}): {}", i, job.call.name, e.what());
                std::lock_guard lock(failure_mutex);
                if (!failure)
                    failure = std::current_exception();
                abort = true;
            }
        }
    };

    log::debug("Resolving {} call sites on {} threads", jobs.size(), n_threads);
    std::vector<std::thread> threads;
    threads.reserve(n_threads);
    for (unsigned t = 0; t != n_threads; ++t)
        threads.emplace_back(worker);
    for (auto& th : threads)
        th.join();

    if (failure)
        std::rethrow_exception(failure);
    return results;
}


} // namespace ambit::resolve
