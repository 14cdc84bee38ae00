#pragma once
#include "broker.hpp"
#include "corpus.hpp"
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <string>

// Largest quote sent over UDP is UDP_QUOTE_LIMIT - 1 bytes.
constexpr size_t UDP_QUOTE_LIMIT = 512;

// RFC 865 Quote of the Day service on one TCP listener and one UDP socket
// sharing a port. Each connection or datagram is handed to a task on the pool.
class Server {
public:
  explicit Server(size_t threads = 0);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Binds TCP first; UDP then binds to the TCP listener's resolved address so
  // that port 0 yields the same port for both. Throws on failure.
  void bind(const std::string& host, uint16_t port);

  boost::asio::ip::tcp::endpoint local_endpoint() const;

  // Runs until stop() or until the broker fails; the latter throws BrokerClosed.
  void serve(Corpus corpus, uint64_t seed);

  // Safe to call from any thread.
  void stop();

private:
  enum class State { Unbound, Bound, Serving, Stopped };

  void accept_next();
  void receive_next();
  void handle_tcp(std::shared_ptr<boost::asio::ip::tcp::socket> conn);
  void handle_udp(boost::asio::ip::udp::endpoint client);
  void broker_failed(const std::string& why);

  boost::asio::io_context io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::ip::udp::socket udp_;
  boost::asio::thread_pool tasks_;
  State state_ = State::Unbound;

  std::unique_ptr<QuoteBroker> broker_;
  std::string failure_;   // touched only on the io thread

  boost::asio::ip::udp::endpoint udp_sender_;
  char udp_buf_[UDP_QUOTE_LIMIT];
};
