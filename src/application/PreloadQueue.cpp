/**
 * @file PreloadQueue.cpp
 * @brief Implementation of PreloadQueue.
 */

#include "application/PreloadQueue.hpp"

namespace ideasnapshot::application {

PreloadQueue::PreloadQueue(size_t capacity) : m_capacity(capacity) {}

bool PreloadQueue::tryPush(PreloadRequest request) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || m_items.size() >= m_capacity) {
            return false;
        }
        m_items.push_back(std::move(request));
    }
    m_cv.notify_one();
    return true;
}

std::optional<PreloadRequest> PreloadQueue::waitPop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_items.empty() || m_closed; });
    if (m_items.empty()) {
        return std::nullopt;
    }
    PreloadRequest request = std::move(m_items.front());
    m_items.pop_front();
    return request;
}

void PreloadQueue::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

size_t PreloadQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items.size();
}

} // namespace ideasnapshot::application
