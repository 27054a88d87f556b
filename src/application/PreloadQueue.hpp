/**
 * @file PreloadQueue.hpp
 * @brief Bounded, non-blocking queue of ideas worth generating ahead of demand.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include "domain/IdeaProfile.hpp"

namespace ideasnapshot::application {

/**
 * @struct PreloadRequest
 * @brief One idea queued after a cache miss or partial hit.
 */
struct PreloadRequest {
    std::string ideaSummary;
    domain::IdeaProfile profile;
    std::string ideaHash;
    std::chrono::system_clock::time_point enqueuedAt;
};

/**
 * @class PreloadQueue
 * @brief Producers never block: a full queue drops the request.
 */
class PreloadQueue {
public:
    explicit PreloadQueue(size_t capacity = 100);

    /** @brief Enqueues unless full or closed. Returns whether the request was accepted. */
    bool tryPush(PreloadRequest request);

    /**
     * @brief Blocks until a request is available or the queue is closed.
     * @return nullopt once closed and drained.
     */
    std::optional<PreloadRequest> waitPop();

    /** @brief Wakes every waiter; later pushes are rejected. */
    void close();

    size_t size() const;
    size_t capacity() const { return m_capacity; }

private:
    size_t m_capacity;
    std::deque<PreloadRequest> m_items;
    bool m_closed = false;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace ideasnapshot::application
