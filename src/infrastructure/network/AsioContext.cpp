#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace portsy::infra {

AsioContext::AsioContext(size_t threadCount, std::string name)
    : threadCount_(threadCount > 0 ? threadCount : 1), name_(std::move(name)) {
    spdlog::debug("AsioContext '{}' created with {} threads", name_, threadCount_);
}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    keepAlive_.emplace(asio::make_work_guard(ioContext_));

    workers_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        workers_.emplace_back([this]() { ioContext_.run(); });
    }

    spdlog::debug("AsioContext '{}' started with {} worker threads", name_, threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    keepAlive_.reset();
    ioContext_.stop();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workers_.clear();

    ioContext_.restart();
    spdlog::debug("AsioContext '{}' stopped", name_);
}

} // namespace portsy::infra
