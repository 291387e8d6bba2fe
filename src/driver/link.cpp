#include "link.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace zwlink {

SerialPortLink::SerialPortLink(asio::io_context &io, const std::string &device,
                               unsigned baud)
    : port_(io), device_(device) {
  port_.open(device);
  port_.set_option(asio::serial_port_base::baud_rate(baud));
  port_.set_option(asio::serial_port_base::character_size(8));
  port_.set_option(
      asio::serial_port_base::parity(asio::serial_port_base::parity::none));
  port_.set_option(asio::serial_port_base::stop_bits(
      asio::serial_port_base::stop_bits::one));
  port_.set_option(asio::serial_port_base::flow_control(
      asio::serial_port_base::flow_control::none));
  Logger::instance().log_tagged(LogLevel::INFO, kLogSerial,
                                "opened %s at %u baud", device.c_str(), baud);
}

void SerialPortLink::async_read_some(asio::mutable_buffer buf, ReadHandler h) {
  port_.async_read_some(buf, std::move(h));
}

void SerialPortLink::async_write(const std::vector<uint8_t> &data,
                                 WriteHandler h) {
  asio::async_write(port_, asio::buffer(data),
                    [h](std::error_code ec, std::size_t) { h(ec); });
}

void SerialPortLink::close() {
  std::error_code ec;
  port_.close(ec);
}

TcpLink::TcpLink(asio::io_context &io, const std::string &host, uint16_t port)
    : sock_(io), host_(host), port_(port) {
  tcp::resolver res(io);
  auto results = res.resolve(host, std::to_string(port));
  asio::connect(sock_, results);
  sock_.set_option(tcp::no_delay(true));
  Logger::instance().log_tagged(LogLevel::INFO, kLogSerial, "connected to %s",
                                describe().c_str());
}

void TcpLink::async_read_some(asio::mutable_buffer buf, ReadHandler h) {
  sock_.async_read_some(buf, std::move(h));
}

void TcpLink::async_write(const std::vector<uint8_t> &data, WriteHandler h) {
  asio::async_write(sock_, asio::buffer(data),
                    [h](std::error_code ec, std::size_t) { h(ec); });
}

void TcpLink::close() {
  std::error_code ec;
  sock_.shutdown(tcp::socket::shutdown_both, ec);
  sock_.close(ec);
}

std::string TcpLink::describe() const {
  return "tcp://" + host_ + ":" + std::to_string(port_);
}

std::unique_ptr<Link> open_link(asio::io_context &io, const std::string &target,
                                unsigned baud) {
  static const std::string kTcpPrefix = "tcp://";
  if (target.compare(0, kTcpPrefix.size(), kTcpPrefix) == 0) {
    std::string host;
    uint16_t port;
    if (!parse_host_port(target.substr(kTcpPrefix.size()), host, port))
      throw std::system_error(
          std::make_error_code(std::errc::invalid_argument),
          "bad tcp link " + target);
    return std::unique_ptr<Link>(new TcpLink(io, host, port));
  }
  return std::unique_ptr<Link>(new SerialPortLink(io, target, baud));
}

} // namespace zwlink
