#include "asio_transport.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include "config.hpp"

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

AsioTransport::AsioTransport(asio::io_context& io)
  : resolver_(io), socket_(io), rbuf_(VICHAT_MAX_LINE_BYTES) {}

AsioTransport::~AsioTransport() {
  boost::system::error_code ignored;
  socket_.close(ignored);
}

TransportFactory AsioTransport::factory() {
  return [](asio::io_context& io) -> std::shared_ptr<ITransport> { return std::make_shared<AsioTransport>(io); };
}

void AsioTransport::async_connect(const std::string& host, const std::string& port, ConnectHandler h) {
  auto self = shared_from_this();
  resolver_.async_resolve(host, port,
    [self, h = std::move(h)](const boost::system::error_code& ec, tcp::resolver::results_type results) mutable {
      if (ec) { h(ec); return; }
      if (self->closed_) { h(asio::error::operation_aborted); return; }
      asio::async_connect(self->socket_, results,
        [self, h = std::move(h)](const boost::system::error_code& ec2, const tcp::endpoint&) {
          if (!ec2) {
            boost::system::error_code ignored;
            self->socket_.set_option(tcp::no_delay(true), ignored);
          }
          h(ec2);
        });
    });
}

void AsioTransport::async_read_line(LineHandler h) {
  auto self = shared_from_this();
  asio::async_read_until(socket_, rbuf_, "\r\n",
    [self, h = std::move(h)](const boost::system::error_code& ec, std::size_t n) {
      if (ec) { h(ec, std::string()); return; }
      auto data = self->rbuf_.data();
      std::string line(asio::buffers_begin(data), asio::buffers_begin(data) + static_cast<std::ptrdiff_t>(n));
      self->rbuf_.consume(n);
      while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
      h(ec, std::move(line));
    });
}

void AsioTransport::async_write(std::string data, WriteHandler h) {
  if (closed_) {
    asio::post(socket_.get_executor(), [h = std::move(h)]{ h(asio::error::operation_aborted); });
    return;
  }
  writes_.emplace_back(std::move(data), std::move(h));
  if (writes_.size() == 1) write_next();
}

void AsioTransport::write_next() {
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(writes_.front().first),
    [self](const boost::system::error_code& ec, std::size_t) {
      WriteHandler h = std::move(self->writes_.front().second);
      self->writes_.pop_front();
      if (ec) {
        // fail everything queued behind the broken write as well
        auto rest = std::move(self->writes_);
        self->writes_.clear();
        h(ec);
        for (auto& w : rest) w.second(ec);
        return;
      }
      if (!self->writes_.empty()) self->write_next();
      h(ec);
    });
}

void AsioTransport::close() {
  if (closed_) return;
  closed_ = true;
  resolver_.cancel();
  boost::system::error_code ignored;
  socket_.shutdown(tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}
