#include "stager/staging/staging_pool.hpp"

#include <spdlog/spdlog.h>

namespace stager::staging {

StagingPool::StagingPool(std::size_t threads)
    : threads_(threads == 0 ? 1 : threads),
      pool_(threads_) {
    spdlog::debug("Staging pool started with {} threads", threads_);
}

StagingPool::~StagingPool() {
    wait();
}

void StagingPool::wait() {
    if (joined_) {
        return;
    }
    pool_.join();
    joined_ = true;
    spdlog::debug("Staging pool drained");
}

} // namespace stager::staging
