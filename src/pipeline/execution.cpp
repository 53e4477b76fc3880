#include "lucky_stack/pipeline/execution.hpp"
#include "lucky_stack/core/errors.hpp"
#include "lucky_stack/registration/registration.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>

namespace lucky_stack::pipeline {

int compute_worker_count(int requested, size_t task_count) {
    const int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    int workers = requested;
    if (workers < 1) {
        workers = cpu_cores > 0 ? cpu_cores : 1;
    }
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(task_count));
    }
    return std::max(1, workers);
}

RegistrationBatch register_frames(const std::vector<Matrix2Df>& frames,
                                  const Matrix2Df& reference,
                                  const RegistrationParams& params,
                                  ExecutionMode mode,
                                  int workers,
                                  const ProgressFn& progress) {
    return register_frames(frames, 0, frames.size(), reference, params, mode, workers,
                           progress);
}

RegistrationBatch register_frames(const std::vector<Matrix2Df>& frames,
                                  size_t first,
                                  size_t count,
                                  const Matrix2Df& reference,
                                  const RegistrationParams& params,
                                  ExecutionMode mode,
                                  int workers,
                                  const ProgressFn& progress) {
    if (first > frames.size() || count > frames.size() - first) {
        throw DimensionError("frame range [" + std::to_string(first) + ", " +
                             std::to_string(first + count) + ") outside " +
                             std::to_string(frames.size()) + " frames");
    }
    if (mode != ExecutionMode::PARALLEL && mode != ExecutionMode::SERIAL) {
        throw ConfigError("unsupported execution mode " +
                          std::to_string(static_cast<int>(mode)));
    }
    registration::validate_params(params, static_cast<int>(reference.rows()),
                                  static_cast<int>(reference.cols()));
    const ReferenceAnchor anchor = registration::prepare_reference(reference, params);

    const size_t n = count;
    RegistrationBatch batch;
    batch.shifted_frames.resize(n);
    batch.shifts.resize(n);
    batch.peak_values.assign(n, 0.0f);

    auto run_one = [&](size_t fi) {
        FrameRegistration reg =
            registration::register_frame(frames[first + fi], reference, anchor, params);
        batch.shifted_frames[fi] = std::move(reg.shifted);
        batch.shifts[fi] = reg.shift;
        batch.peak_values[fi] = reg.peak_value;
    };

    if (mode == ExecutionMode::SERIAL) {
        for (size_t fi = 0; fi < n; ++fi) {
            run_one(fi);
            if (progress) progress(fi + 1, n);
        }
        return batch;
    }

    const int n_workers = compute_worker_count(workers, n);
    std::cerr << "[REG] Using " << n_workers << " parallel workers for " << n
              << " frames (method=" << alignment_method_to_string(params.method) << ")"
              << std::endl;

    std::mutex error_mutex;
    std::mutex progress_mutex;
    std::atomic<size_t> next{0};
    size_t done = 0;  // guarded by progress_mutex
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            const size_t fi = next.fetch_add(1);
            if (fi >= n) {
                break;
            }
            try {
                run_one(fi);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true, std::memory_order_relaxed);
                break;
            }
            if (progress) {
                std::lock_guard<std::mutex> lock(progress_mutex);
                progress(++done, n);
            }
        }
    };

    if (n_workers > 1) {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return batch;
}

} // namespace lucky_stack::pipeline
