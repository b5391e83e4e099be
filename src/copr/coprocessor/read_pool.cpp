#include "copr/coprocessor/read_pool.h"

#include <glog/logging.h>

#include <boost/asio/post.hpp>
#include <utility>

namespace copr {

ReadPool::ReadPool(size_t high_concurrency, size_t normal_concurrency,
                   size_t low_concurrency)
    : high_(std::make_unique<boost::asio::thread_pool>(high_concurrency)),
      normal_(std::make_unique<boost::asio::thread_pool>(normal_concurrency)),
      low_(std::make_unique<boost::asio::thread_pool>(low_concurrency)),
      stopped_(false) {
  LOG(INFO) << "Read pool started with " << high_concurrency << "/"
            << normal_concurrency << "/" << low_concurrency
            << " high/normal/low workers";
}

ReadPool::~ReadPool() { Stop(); }

boost::asio::thread_pool& ReadPool::PoolFor(CommandPri priority) {
  switch (priority) {
    case CommandPri::High:
      return *high_;
    case CommandPri::Low:
      return *low_;
    default:
      return *normal_;
  }
}

bool ReadPool::Post(CommandPri priority, Task task) {
  if (stopped_) {
    VLOG(1) << "Read pool stopped, refusing task";
    return false;
  }
  boost::asio::post(PoolFor(priority), std::move(task));
  return true;
}

void ReadPool::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  for (auto* pool : {high_.get(), normal_.get(), low_.get()}) {
    pool->stop();
    pool->join();
  }
  LOG(INFO) << "Read pool stopped";
}

}  // namespace copr
