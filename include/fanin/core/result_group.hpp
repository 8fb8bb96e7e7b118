// ============================================================================
// fanin/core/result_group.hpp - Result-Collecting Task Group
// ============================================================================
//
// ResultGroup<T> runs any number of independent units of work in parallel,
// each on its own thread, and collects every unit's partial results and
// error. Wait() blocks until all launched units have reported and returns the
// concatenated results together with a MultiError of everything that failed.
//
// A group built with an error threshold derives a cancellation token from a
// parent token. Once `threshold` errors have been recorded the token is
// cancelled so that running units can stop early; errors past the threshold
// are dropped. Wait() always cancels the derived token on the way out.
//
// Results and errors are ordered by completion, not by launch.
//
// USAGE:
// ------
//   ResultGroup<int> group;            // unlimited errors, no cancellation
//   for (int i = 0; i < 5; ++i) {
//       group.Go([i]() -> UnitResult<int> { return {{i}, {}}; });
//   }
//   auto [results, err] = group.Wait();
//   if (err) { std::cerr << *err << std::endl; }
//
// WITH A THRESHOLD:
// -----------------
//   CancellationSource root;
//   ResultGroup<int> group(root.GetToken(), 2);
//   auto token = group.Token();
//   group.Go([token]() -> UnitResult<int> {
//       if (token.WaitFor(100ms)) return {{}, token.Reason()};
//       return {{1}, {}};
//   });
//   auto [results, err] = group.Wait();
//
// A group is single-use. Units may keep calling Go() while Wait() is
// draining, but Go() once Wait() has drained, and a second Wait(), abort.
//
// ============================================================================

#pragma once

#include "fanin/core/cancellation.hpp"
#include "fanin/core/check.hpp"
#include "fanin/core/defer.hpp"
#include "fanin/core/error.hpp"
#include "fanin/core/multi_error.hpp"
#include "fanin/io/unit_thread.hpp"
#include "fanin/sync/wait_group.hpp"

#include <atomic>
#include <cassert>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fanin {

// What a single unit of work reports. Both members may be set at once:
// a unit can return partial results alongside an error.
template <typename T>
struct UnitResult {
    std::vector<T> values;
    Error error;
};

// What Wait() returns. `error` is std::nullopt when no unit failed.
template <typename T>
struct WaitResult {
    std::vector<T> results;
    std::optional<MultiError> error;
};

template <typename T>
class ResultGroup {
   public:
    using Unit = std::function<UnitResult<T>()>;

    // ========================================================================
    // Options
    // ========================================================================
    struct Options {
        // Unit threads are named "prefix-0", "prefix-1", ... (empty: unnamed)
        std::string thread_name_prefix = "fanin-unit";

        // CPUs to pin unit threads to, round-robin: unit[i] -> cpus[i % size]
        std::vector<int> cpus;

        // Nice value for unit threads (0: inherit)
        int nice_value = 0;

        Options() = default;
    };

    // ========================================================================
    // Construction
    // ========================================================================

    // Plain group: every error is recorded, nothing is ever cancelled
    ResultGroup() : ResultGroup(Options{}) {}

    explicit ResultGroup(Options options) : options_(std::move(options)), shared_(std::make_shared<SharedState>()) {}

    // Threshold group: derives a cancellation token from `parent` and cancels
    // it once `threshold` errors have been recorded. Aborts if threshold < 1.
    ResultGroup(CancellationToken parent, int threshold) : ResultGroup(std::move(parent), threshold, Options{}) {}

    ResultGroup(CancellationToken parent, int threshold, Options options)
        : options_(std::move(options)), shared_(std::make_shared<SharedState>()) {
        FANIN_CHECK(threshold >= 1, "error threshold must be greater than or equal to 1");
        shared_->threshold = static_cast<size_t>(threshold);
        shared_->source.emplace(std::move(parent));
    }

    // Non-copyable, non-movable
    ResultGroup(const ResultGroup&) = delete;
    ResultGroup& operator=(const ResultGroup&) = delete;
    ResultGroup(ResultGroup&&) = delete;
    ResultGroup& operator=(ResultGroup&&) = delete;

    ~ResultGroup() {
        assert(shared_->outstanding.Count() == 0 &&
               "ResultGroup destroyed with outstanding units. Did you forget Wait()?");
    }

    // ========================================================================
    // Go - Run a unit of work on a new thread
    // ========================================================================
    void Go(Unit unit) {
        FANIN_CHECK(!drained_.load(std::memory_order_acquire), "ResultGroup::Go() called after Wait()");

        // Count the unit before it can possibly finish, so Wait() never sees
        // a false "all done".
        shared_->outstanding.Add(1);
        UnitThreadConfig config = MakeUnitThreadConfig(launched_.fetch_add(1, std::memory_order_relaxed));

        auto shared = shared_;  // capture shared_ptr, not this
        try {
            std::thread([shared, unit = std::move(unit), config = std::move(config)]() mutable {
                Defer done([&shared] { shared->outstanding.Done(); });
                ApplyUnitThreadConfig(config);  // best effort

                UnitResult<T> outcome;
                {
                    // The unit and its captures die before the group learns
                    // it is done
                    Unit local = std::exchange(unit, nullptr);
                    outcome = local();
                }
                shared->Report(std::move(outcome));
            }).detach();
        } catch (...) {
            shared_->outstanding.Done();
            throw;
        }
    }

    // ========================================================================
    // Wait - Block until every unit has reported
    // ========================================================================
    [[nodiscard]] WaitResult<T> Wait() {
        FANIN_CHECK(!waiting_.exchange(true, std::memory_order_acq_rel), "ResultGroup::Wait() called twice");

        // Running units may still Go() here; the count cannot reach zero
        // while any of them is alive.
        shared_->outstanding.Wait();
        drained_.store(true, std::memory_order_release);

        // Releases the derived token even when nothing failed
        if (shared_->source) {
            shared_->source->Cancel();
        }

        std::lock_guard<std::mutex> lock(shared_->mutex);
        WaitResult<T> out;
        out.results = shared_->results;
        if (!shared_->errors.empty()) {
            out.error.emplace(shared_->errors);
        }
        return out;
    }

    // ========================================================================
    // Query
    // ========================================================================

    // Token derived from the parent; a never-cancelled token for plain groups
    CancellationToken Token() const {
        return shared_->source ? shared_->source->GetToken() : CancellationToken::None();
    }

    // 0 means unlimited
    size_t Threshold() const noexcept { return shared_->threshold; }

    bool HasCancellation() const noexcept { return shared_->source.has_value(); }

    // Launched units that have not finished reporting yet
    size_t Outstanding() const { return shared_->outstanding.Count(); }

    // True once some thread has entered Wait()
    bool Waiting() const noexcept { return waiting_.load(std::memory_order_acquire); }

   private:
    struct SharedState {
        std::mutex mutex;
        std::vector<T> results;
        std::vector<Error> errors;
        size_t threshold{0};
        std::optional<CancellationSource> source;
        WaitGroup outstanding;

        void Report(UnitResult<T> outcome) {
            if (outcome.error) {
                RecordError(outcome.error);
            }
            AppendResults(std::move(outcome.values));
        }

        void RecordError(const Error& error) {
            bool reached = false;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (threshold == 0 || errors.size() < threshold) {
                    errors.push_back(error);
                    reached = errors.size() == threshold;
                }
            }
            // Fires once, on the append that reaches the threshold
            if (reached && source) {
                source->Cancel();
            }
        }

        void AppendResults(std::vector<T> values) {
            std::lock_guard<std::mutex> lock(mutex);
            results.insert(results.end(), std::make_move_iterator(values.begin()),
                           std::make_move_iterator(values.end()));
        }
    };

    UnitThreadConfig MakeUnitThreadConfig(size_t index) const {
        UnitThreadConfig config;
        if (!options_.thread_name_prefix.empty()) {
            config.name = options_.thread_name_prefix + "-" + std::to_string(index);
        }
        if (!options_.cpus.empty()) {
            config.cpu = options_.cpus[index % options_.cpus.size()];
        }
        config.nice_value = options_.nice_value;
        return config;
    }

    Options options_;
    std::shared_ptr<SharedState> shared_;
    std::atomic<size_t> launched_{0};
    std::atomic<bool> waiting_{false};
    std::atomic<bool> drained_{false};
};

// ============================================================================
// WithErrorThreshold - Factory returning the group and its derived token
// ============================================================================
template <typename T>
struct ThresholdGroup {
    std::unique_ptr<ResultGroup<T>> group;
    CancellationToken token;
};

template <typename T>
ThresholdGroup<T> WithErrorThreshold(CancellationToken parent, int threshold) {
    auto group = std::make_unique<ResultGroup<T>>(std::move(parent), threshold);
    auto token = group->Token();
    return {std::move(group), std::move(token)};
}

template <typename T>
ThresholdGroup<T> WithErrorThreshold(CancellationToken parent, int threshold,
                                     typename ResultGroup<T>::Options options) {
    auto group = std::make_unique<ResultGroup<T>>(std::move(parent), threshold, std::move(options));
    auto token = group->Token();
    return {std::move(group), std::move(token)};
}

}  // namespace fanin
