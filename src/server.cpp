#include "server.hpp"
#include "log.hpp"
#include <stdexcept>
#include <thread>

namespace asio = boost::asio;
using asio::ip::tcp;
using asio::ip::udp;

static size_t default_threads(size_t n) {
  if (n) return n;
  unsigned hw = std::thread::hardware_concurrency();
  return hw ? hw : 2;
}

Server::Server(size_t threads)
  : acceptor_(io_), udp_(io_), tasks_(default_threads(threads)) {}

Server::~Server() {
  tasks_.stop();
  tasks_.join();
}

void Server::bind(const std::string& host, uint16_t port) {
  if (state_ != State::Unbound) throw std::runtime_error("server: already bound");

  tcp::resolver resolver(io_);
  boost::system::error_code ec;
  auto results = resolver.resolve(host, std::to_string(port), ec);
  if (ec || results.empty())
    throw std::runtime_error("server: could not resolve " + host + ": " + ec.message());
  tcp::endpoint ep = results.begin()->endpoint();

  log_trace("server", "Binding TCP socket");
  try {
    acceptor_.open(ep.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen();
  } catch (const boost::system::system_error& e) {
    acceptor_.close(ec);
    throw std::runtime_error(std::string("server: failed to bind TCP port: ") + e.what());
  }
  tcp::endpoint bound = acceptor_.local_endpoint();
  log_debug("server", "Bound to TCP ", bound);

  // port 0 means "any": reuse whatever the TCP listener got
  log_trace("server", "Binding UDP socket");
  udp::endpoint uep(bound.address(), bound.port());
  try {
    udp_.open(uep.protocol());
    udp_.bind(uep);
  } catch (const boost::system::system_error& e) {
    udp_.close(ec);
    acceptor_.close(ec);
    throw std::runtime_error(std::string("server: failed to bind UDP port: ") + e.what());
  }
  log_debug("server", "Bound to UDP ", udp_.local_endpoint());
  state_ = State::Bound;
}

tcp::endpoint Server::local_endpoint() const {
  if (state_ == State::Unbound) throw std::runtime_error("server: not bound");
  return acceptor_.local_endpoint();
}

void Server::serve(Corpus corpus, uint64_t seed) {
  if (state_ != State::Bound) throw std::runtime_error("server: not bound to TCP/UDP sockets");
  state_ = State::Serving;

  broker_.reset(new QuoteBroker(std::move(corpus), seed));
  broker_->on_failure([this](const std::string& why) {
    asio::post(io_, [this, why] { broker_failed(why); });
  });

  auto ep = acceptor_.local_endpoint();
  log_info("server", "Now listening on TCP/UDP ", ep.address(), ":", ep.port());

  accept_next();
  receive_next();
  io_.run();

  boost::system::error_code ec;
  acceptor_.close(ec);
  udp_.close(ec);
  // fail anything still waiting on the broker before draining the pool
  broker_->close();
  tasks_.join();
  broker_.reset();
  state_ = State::Stopped;

  if (!failure_.empty()) throw BrokerClosed(failure_);
}

void Server::stop() {
  io_.stop();
}

void Server::broker_failed(const std::string& why) {
  log_error("server", "Quote channel closed: ", why);
  failure_ = why;
  io_.stop();
}

void Server::accept_next() {
  if (broker_->closed()) {
    broker_failed("broker: quote channel closed");
    return;
  }
  auto conn = std::make_shared<tcp::socket>(io_);
  acceptor_.async_accept(*conn, [this, conn](const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted) return;
    if (ec) {
      log_warn("server", "Failed to connect TCP client: ", ec.message());
    } else {
      boost::system::error_code pec;
      log_info("server", "TCP client connected: ", conn->remote_endpoint(pec));
      asio::post(tasks_, [this, conn] { handle_tcp(conn); });
    }
    accept_next();
  });
}

void Server::receive_next() {
  if (broker_->closed()) {
    broker_failed("broker: quote channel closed");
    return;
  }
  udp_.async_receive_from(asio::buffer(udp_buf_), udp_sender_,
    [this](const boost::system::error_code& ec, size_t) {
      if (ec == asio::error::operation_aborted) return;
      if (ec) {
        log_warn("server", "Failed to receive UDP datagram: ", ec.message());
      } else {
        udp::endpoint client = udp_sender_;
        log_info("server", "UDP client connected: ", client);
        asio::post(tasks_, [this, client] { handle_udp(client); });
      }
      receive_next();
    });
}

void Server::handle_tcp(std::shared_ptr<tcp::socket> conn) {
  std::shared_ptr<std::string> quote;
  try {
    log_debug("tcp", "Getting quote");
    quote = std::make_shared<std::string>(broker_->request());
  } catch (const std::exception& e) {
    log_warn("tcp", "No quote for client: ", e.what());
    // no io operation holds conn yet, and io_ may already be stopped
    boost::system::error_code ec;
    conn->close(ec);
    return;
  }

  // socket I/O stays on the io thread
  asio::post(io_, [conn, quote] {
    log_debug("tcp", "Sending quote to client");
    asio::async_write(*conn, asio::buffer(*quote),
      [conn, quote](const boost::system::error_code& ec, size_t) {
        boost::system::error_code ignored;
        if (ec) {
          log_warn("tcp", "Failed to send quote: ", ec.message());
        } else {
          log_info("tcp", "Served quote (", quote->size(), " bytes), closing connection");
          conn->shutdown(tcp::socket::shutdown_both, ignored);
        }
        conn->close(ignored);
      });
  });
}

void Server::handle_udp(udp::endpoint client) {
  std::shared_ptr<std::string> quote;
  try {
    log_debug("udp", "Getting quote");
    quote = std::make_shared<std::string>(broker_->request());
  } catch (const std::exception& e) {
    log_warn("udp", "No quote for ", client, ": ", e.what());
    return;
  }

  if (quote->size() >= UDP_QUOTE_LIMIT) {
    // Requeue behind other clients instead of holding this pool thread.
    // No retry cap: a corpus holding only oversize quotes never answers UDP.
    log_info("udp", "Quote too long for UDP client (", quote->size(), "), retrying");
    asio::post(tasks_, [this, client] { handle_udp(client); });
    return;
  }

  asio::post(io_, [this, client, quote] {
    udp_.async_send_to(asio::buffer(*quote), client,
      [client, quote](const boost::system::error_code& ec, size_t) {
        if (ec) log_warn("udp", "Failed to send quote to ", client, ": ", ec.message());
        else log_info("udp", "Served quote (", quote->size(), " bytes) to ", client);
      });
  });
}
