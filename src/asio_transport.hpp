#pragma once
/*
 * AsioTransport
 *
 * Purpose: ITransport over a plain TCP socket (Twitch IRC on port 6667).
 * Lifetime: owned by shared_ptr; pending handlers keep the object alive.
 */
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/streambuf.hpp>
#include "transport.hpp"

class AsioTransport : public ITransport, public std::enable_shared_from_this<AsioTransport> {
public:
  explicit AsioTransport(boost::asio::io_context& io);
  ~AsioTransport() override;

  void async_connect(const std::string& host, const std::string& port, ConnectHandler h) override;
  void async_read_line(LineHandler h) override;
  void async_write(std::string data, WriteHandler h) override;
  void close() override;

  static TransportFactory factory();

private:
  void write_next();

  boost::asio::ip::tcp::resolver resolver_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::streambuf rbuf_;
  std::deque<std::pair<std::string, WriteHandler>> writes_;
  bool closed_ = false;
};
