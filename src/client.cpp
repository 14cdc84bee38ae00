#include "cli.hpp"
#include "server.hpp"

#include <boost/asio.hpp>
#include <iostream>
#include <string>

namespace asio = boost::asio;
using asio::ip::tcp;
using asio::ip::udp;

// The server closes the stream after one quote, so read to EOF.
static std::string fetch_tcp(asio::io_context& io, const ClientArgs& a) {
  tcp::resolver resolver(io);
  tcp::socket sock(io);
  asio::connect(sock, resolver.resolve(a.host, std::to_string(a.port)));

  std::string out;
  boost::system::error_code ec;
  asio::read(sock, asio::dynamic_buffer(out), ec);
  if (ec && ec != asio::error::eof) throw boost::system::system_error(ec);
  return out;
}

// Any datagram triggers a reply; send an empty one.
static std::string fetch_udp(asio::io_context& io, const ClientArgs& a) {
  udp::resolver resolver(io);
  udp::endpoint server = *resolver.resolve(a.host, std::to_string(a.port)).begin();
  udp::socket sock(io);
  sock.open(server.protocol());
  sock.connect(server);
  sock.send(asio::buffer(static_cast<const void*>(nullptr), 0));

  char buf[UDP_QUOTE_LIMIT];
  size_t n = sock.receive(asio::buffer(buf));
  return std::string(buf, n);
}

int main(int argc, char** argv) {
  auto args = parse_client_cli(argc, argv);
  asio::io_context io;
  try {
    std::string quote = args.tcp ? fetch_tcp(io, args) : fetch_udp(io, args);
    auto end = quote.find_last_not_of(" \t\r\n");
    quote.erase(end == std::string::npos ? 0 : end + 1);
    std::cout << quote << "\n";
  } catch (const std::exception& e) {
    std::cerr << "qotd: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
