#pragma once

/// @file search_stream.hpp
/// @brief Debounced, last-query-wins search pipeline.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/foundation/kit_logger.hpp"
#include "rsk/stream/stream_channel.hpp"

namespace rsk::stream {

/// Configuration for a SearchStream instance.
struct SearchStreamConfig {
    /// Quiet period after the last search() before the query is issued.
    std::chrono::milliseconds debounce{300};

    /// Debounced queries shorter than this are dropped.
    std::size_t minQueryLength = 2;

    /// Human-readable name for logging.
    std::string name = "search";
};

/// Search pipeline: debounce, drop a query equal to the previous debounced
/// one, drop short queries, mark loading, run the search function.
///
/// Only the latest issued query can reach results(): when a newer query is
/// issued, the older one's eventual outcome is discarded and does not touch
/// the loading flag. A failing search is logged and published as an empty
/// result list.
///
/// Example:
/// @code
///   SearchStream<Product> search(loop, [&](const std::string& q) { return catalog.find(q); });
///   search.results().subscribe([](const std::vector<Product>& hits) { render(hits); });
///   search.loading().subscribe([](bool busy) { spinner(busy); });
///   search.search("lam");
///   search.search("lamp");   // within the debounce window: only "lamp" runs
/// @endcode
template <typename T>
class SearchStream {
public:
    using SearchFunction = std::function<rsk::foundation::Future<std::vector<T>>(const std::string&)>;

    SearchStream(rsk::foundation::EventLoop& loop, SearchFunction searchFn,
                 SearchStreamConfig config = {})
        : state_(std::make_shared<State>(loop, std::move(searchFn), std::move(config))) {}

    ~SearchStream() { destroy(); }

    SearchStream(const SearchStream&) = delete;
    SearchStream& operator=(const SearchStream&) = delete;

    /// Feed a query into the pipeline. Restarts the debounce window.
    void search(std::string query) {
        auto& state = *state_;
        if (state.destroyed) {
            return;
        }
        if (state.debounceTimer != rsk::foundation::EventLoop::kInvalidTimer) {
            state.loop.cancel(state.debounceTimer);
        }
        std::weak_ptr<State> weak = state_;
        state.debounceTimer = state.loop.schedule(
            state.config.debounce, [weak, query = std::move(query)]() {
                if (auto locked = weak.lock()) {
                    locked->debounceTimer = rsk::foundation::EventLoop::kInvalidTimer;
                    issue(locked, query);
                }
            });
    }

    /// Latest results; new subscribers receive them immediately.
    [[nodiscard]] SnapshotChannel<std::vector<T>>& results() { return state_->results; }

    /// Loading flag; published only when it changes.
    [[nodiscard]] SnapshotChannel<bool>& loading() { return state_->loading; }

    [[nodiscard]] bool isLoading() const { return state_->loading.value(); }

    /// Number of queries handed to the search function so far.
    [[nodiscard]] uint64_t generation() const { return state_->generation; }

    /// Last query that survived the debounce, if any.
    [[nodiscard]] const std::optional<std::string>& lastQuery() const { return state_->lastDebounced; }

    /// Cancel the pending debounce, discard any in-flight result and close
    /// both channels. Idempotent.
    void destroy() {
        auto& state = *state_;
        if (state.destroyed) {
            return;
        }
        state.destroyed = true;
        if (state.debounceTimer != rsk::foundation::EventLoop::kInvalidTimer) {
            state.loop.cancel(state.debounceTimer);
            state.debounceTimer = rsk::foundation::EventLoop::kInvalidTimer;
        }
        state.results.complete();
        state.loading.complete();
    }

private:
    struct State {
        rsk::foundation::EventLoop& loop;
        SearchFunction searchFn;
        SearchStreamConfig config;

        SnapshotChannel<std::vector<T>> results;
        SnapshotChannel<bool> loading;

        std::optional<std::string> lastDebounced;
        rsk::foundation::EventLoop::TimerId debounceTimer = rsk::foundation::EventLoop::kInvalidTimer;
        uint64_t generation = 0;
        bool destroyed = false;

        State(rsk::foundation::EventLoop& l, SearchFunction fn, SearchStreamConfig c)
            : loop(l),
              searchFn(std::move(fn)),
              config(std::move(c)),
              results({}, config.name + ".results"),
              loading(false, config.name + ".loading") {}

        void setLoading(bool value) {
            if (loading.value() != value) {
                loading.publish(value);
            }
        }
    };

    static void issue(const std::shared_ptr<State>& state, const std::string& query) {
        using rsk::foundation::KitResult;
        using rsk::foundation::LogCategory;

        if (state->lastDebounced && *state->lastDebounced == query) {
            return;
        }
        state->lastDebounced = query;
        if (query.size() < state->config.minQueryLength) {
            return;
        }

        const uint64_t generation = ++state->generation;
        state->setLoading(true);

        rsk::foundation::TaskFactory<std::vector<T>> call = [state, query]() {
            return state->searchFn(query);
        };
        std::weak_ptr<State> weak = state;
        rsk::foundation::invokeFactory(call).onComplete(
            [weak, generation, query](const KitResult<std::vector<T>>& outcome) {
                auto locked = weak.lock();
                if (!locked || locked->destroyed || generation != locked->generation) {
                    // Superseded or torn down.
                    return;
                }
                if (outcome) {
                    locked->results.publish(outcome.value());
                } else {
                    RSK_LOG_ERROR(LogCategory::Stream, "search '" + locked->config.name
                                                           + "' failed for '" + query
                                                           + "': " + outcome.error().describe());
                    locked->results.publish({});
                }
                locked->setLoading(false);
            });
    }

    std::shared_ptr<State> state_;
};

} // namespace rsk::stream
