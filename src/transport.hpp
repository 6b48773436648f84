#pragma once
/*
 * ITransport
 *
 * Purpose: abstract line transport under IrcSession (TCP in production, fakes in tests).
 * Contract: completion handlers run on the session's io_context; writes are
 *           queued and delivered in call order; close() aborts pending operations
 *           with boost::asio::error::operation_aborted.
 */
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

class ITransport {
public:
  using ConnectHandler = std::function<void(const boost::system::error_code&)>;
  using LineHandler = std::function<void(const boost::system::error_code&, std::string)>;
  using WriteHandler = std::function<void(const boost::system::error_code&)>;

  virtual ~ITransport() = default;
  virtual void async_connect(const std::string& host, const std::string& port, ConnectHandler h) = 0;
  // delivers one line without the trailing CRLF
  virtual void async_read_line(LineHandler h) = 0;
  virtual void async_write(std::string data, WriteHandler h) = 0;
  virtual void close() = 0;
};

// called on the io thread once per connection attempt
using TransportFactory = std::function<std::shared_ptr<ITransport>(boost::asio::io_context&)>;
