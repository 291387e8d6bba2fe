#pragma once
#include <asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace zwlink {

// Byte stream to the controller. All operations run on the io_context the
// link was created with.
class Link {
public:
    using ReadHandler = std::function<void(std::error_code, std::size_t)>;
    using WriteHandler = std::function<void(std::error_code)>;

    virtual ~Link() = default;
    virtual void async_read_some(asio::mutable_buffer buf, ReadHandler h) = 0;
    // `data` must stay alive until the handler runs.
    virtual void async_write(const std::vector<uint8_t>& data, WriteHandler h) = 0;
    virtual void close() = 0;
    virtual std::string describe() const = 0;
};

// 8N1, no flow control.
class SerialPortLink : public Link {
public:
    SerialPortLink(asio::io_context& io, const std::string& device, unsigned baud);
    void async_read_some(asio::mutable_buffer buf, ReadHandler h) override;
    void async_write(const std::vector<uint8_t>& data, WriteHandler h) override;
    void close() override;
    std::string describe() const override { return device_; }
private:
    asio::serial_port port_;
    std::string device_;
};

// Serial API over a TCP bridge such as ser2net.
class TcpLink : public Link {
public:
    using tcp = asio::ip::tcp;
    TcpLink(asio::io_context& io, const std::string& host, uint16_t port);
    void async_read_some(asio::mutable_buffer buf, ReadHandler h) override;
    void async_write(const std::vector<uint8_t>& data, WriteHandler h) override;
    void close() override;
    std::string describe() const override;
private:
    tcp::socket sock_;
    std::string host_;
    uint16_t port_;
};

// "tcp://host:port" selects TcpLink, anything else is a serial device.
// Throws std::system_error if the link cannot be opened.
std::unique_ptr<Link> open_link(asio::io_context& io, const std::string& target, unsigned baud);

} // namespace zwlink
