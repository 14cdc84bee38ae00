#include "broker.hpp"
#include "log.hpp"

QuoteBroker::QuoteBroker(Corpus corpus, uint64_t seed, size_t capacity)
  : corpus_(std::move(corpus)), rng_(seed), capacity_(capacity ? capacity : 1) {
  worker_ = std::thread([this] { run(); });
}

QuoteBroker::~QuoteBroker() {
  close();
}

void QuoteBroker::close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) worker_.join();
}

void QuoteBroker::on_failure(FailureHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  on_failure_ = std::move(handler);
}

bool QuoteBroker::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

std::future<std::string> QuoteBroker::submit() {
  std::unique_lock<std::mutex> lock(mu_);
  not_full_.wait(lock, [this] { return closed_ || stopping_ || pending_.size() < capacity_; });
  if (closed_ || stopping_) throw BrokerClosed("broker: quote channel closed");
  pending_.emplace_back();
  auto fut = pending_.back().get_future();
  lock.unlock();
  not_empty_.notify_one();
  return fut;
}

std::string QuoteBroker::request() {
  return submit().get();
}

void QuoteBroker::run() {
  for (;;) {
    std::string quote;
    try {
      quote = corpus_.random_quote(rng_);
    } catch (const std::exception& e) {
      fail(std::string("broker: failed to choose quote: ") + e.what());
      return;
    }
    log_debug("broker", "Chose quote, waiting");

    std::promise<std::string> reply;
    {
      std::unique_lock<std::mutex> lock(mu_);
      not_empty_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
      if (stopping_) {
        closed_ = true;
        for (auto& p : pending_)
          p.set_exception(std::make_exception_ptr(BrokerClosed("broker: shutting down")));
        pending_.clear();
        return;
      }
      reply = std::move(pending_.front());
      pending_.pop_front();
    }
    not_full_.notify_one();

    log_trace("broker", "Sending quote to requesting task");
    reply.set_value(std::move(quote));
  }
}

void QuoteBroker::fail(const std::string& why) {
  log_error("broker", why);
  FailureHandler handler;
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
    for (auto& p : pending_)
      p.set_exception(std::make_exception_ptr(BrokerClosed(why)));
    pending_.clear();
    handler = on_failure_;
  }
  not_full_.notify_all();
  if (handler) handler(why);
}
