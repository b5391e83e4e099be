#ifndef COPR_COPROCESSOR_READ_POOL_H_
#define COPR_COPROCESSOR_READ_POOL_H_

#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <functional>
#include <memory>

#include "copr/proto/coprocessor.pb.h"

namespace copr {

/*! \brief Worker threads that run coprocessor tasks, one pool per priority. */
class ReadPool {
 public:
  using Task = std::function<void()>;

  ReadPool(size_t high_concurrency, size_t normal_concurrency,
           size_t low_concurrency);
  ReadPool(const ReadPool& other) = delete;
  ReadPool& operator=(const ReadPool& other) = delete;
  ~ReadPool();

  /*!
   * \brief Queues `task`.
   * \return false if the pool has stopped and the task was not queued.
   */
  bool Post(CommandPri priority, Task task);

  /*! \brief Stops the workers and waits for running tasks. Queued tasks
   *   that have not started are discarded without running. */
  void Stop();

 private:
  boost::asio::thread_pool& PoolFor(CommandPri priority);

  std::unique_ptr<boost::asio::thread_pool> high_;
  std::unique_ptr<boost::asio::thread_pool> normal_;
  std::unique_ptr<boost::asio::thread_pool> low_;
  std::atomic<bool> stopped_;
};

}  // namespace copr

#endif  // COPR_COPROCESSOR_READ_POOL_H_
