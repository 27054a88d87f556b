/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace ideasnapshot::infrastructure {

namespace fs = std::filesystem;

namespace {

bool EnsureParentDirectory(const fs::path& path) {
    try {
        if (path.has_parent_path() && !fs::exists(path.parent_path())) {
            fs::create_directories(path.parent_path());
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[PersistenceService] Error creating directories: " << e.what() << std::endl;
        return false;
    }
}

} // namespace

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::future<bool> PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    return enqueue(SaveTask{filename, content, false, nullptr});
}

std::future<bool> PersistenceService::appendTextAsync(const std::string& filename, const std::string& content) {
    return enqueue(SaveTask{filename, content, true, nullptr});
}

std::future<bool> PersistenceService::enqueue(SaveTask task) {
    task.done = std::make_shared<std::promise<bool>>();
    auto future = task.done->get_future();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Rejected write after stop: " << task.filename << std::endl;
            task.done->set_value(false);
            return future;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
    return future;
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // Process outside lock
        bool ok = task.append ? performAppend(task) : performAtomicWrite(task);
        if (task.done) task.done->set_value(ok);
    }
}

bool PersistenceService::performAtomicWrite(const SaveTask& task) {
    fs::path finalPath = task.filename;

    // Unique temp path per operation: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    if (!EnsureParentDirectory(finalPath)) return false;

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

bool PersistenceService::performAppend(const SaveTask& task) {
    fs::path path = task.filename;
    if (!EnsureParentDirectory(path)) return false;

    std::ofstream ofs(path, std::ios::app);
    if (!ofs.is_open()) {
        std::cerr << "[PersistenceService] Failed to open for append: " << path << std::endl;
        return false;
    }
    ofs << task.content;
    ofs.flush();
    if (ofs.fail()) {
        std::cerr << "[PersistenceService] Append failed: " << path << std::endl;
        return false;
    }
    return true;
}

} // namespace ideasnapshot::infrastructure
