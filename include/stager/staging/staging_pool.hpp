#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <utility>

namespace stager::staging {

/**
 * @brief Fixed-size worker pool owned by a single staging call.
 *
 * The destructor waits for every submitted unit to finish, so leaving the
 * owning scope on any path drains in-flight work before the threads go away.
 */
class StagingPool {
public:
    explicit StagingPool(std::size_t threads);
    ~StagingPool();

    StagingPool(const StagingPool&) = delete;
    StagingPool& operator=(const StagingPool&) = delete;
    StagingPool(StagingPool&&) = delete;
    StagingPool& operator=(StagingPool&&) = delete;

    template<typename Task>
    void submit(Task&& task) {
        boost::asio::post(pool_, std::forward<Task>(task));
    }

    /// Block until all submitted units have completed.
    void wait();

    [[nodiscard]] std::size_t size() const noexcept { return threads_; }

private:
    std::size_t threads_;
    boost::asio::thread_pool pool_;
    bool joined_ = false;
};

} // namespace stager::staging
