#pragma once
#include "corpus.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

struct BrokerClosed : std::runtime_error {
  explicit BrokerClosed(const std::string& why) : std::runtime_error(why) {}
};

// Sole owner of the corpus while serving. A dedicated worker reads one quote
// ahead of demand, then waits for a request and hands that quote over, so at
// most one corpus read is ever in flight. Requests are answered FIFO.
class QuoteBroker {
public:
  using FailureHandler = std::function<void(const std::string&)>;

  QuoteBroker(Corpus corpus, uint64_t seed, size_t capacity = 32);
  ~QuoteBroker();

  QuoteBroker(const QuoteBroker&) = delete;
  QuoteBroker& operator=(const QuoteBroker&) = delete;

  // Called once, from the worker thread, if the worker stops on an error.
  void on_failure(FailureHandler handler);

  // Blocks while the queue is full. Throws BrokerClosed once the worker is gone.
  std::future<std::string> submit();

  // submit() and wait for the reply.
  std::string request();

  bool closed() const;

  // Stops the worker and fails queued requests with BrokerClosed. Idempotent.
  void close();

private:
  void run();
  void fail(const std::string& why);

  Corpus corpus_;
  std::mt19937_64 rng_;
  size_t capacity_;

  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<std::promise<std::string>> pending_;
  bool closed_ = false;
  bool stopping_ = false;
  FailureHandler on_failure_;

  std::thread worker_;
};
