#include "SerialSampleSource.hpp"
#include "SampleParser.hpp"
#include <iostream>
#include <istream>

namespace asio = boost::asio;

SerialSampleSource::SerialSampleSource(const std::string& device, SampleKind kind,
                                       unsigned int baud)
  : serial_(io_), device_(device), kind_(kind) {
  boost::system::error_code ec;
  serial_.open(device_, ec);
  if (ec) {
    std::cerr << "Serial port " << device_ << " unavailable: " << ec.message() << "\n";
    return;
  }

  // stop at the first option the port refuses; a later success clears ec
  serial_.set_option(asio::serial_port_base::baud_rate(baud), ec);
  if (!ec)
    serial_.set_option(asio::serial_port_base::character_size(8), ec);
  if (!ec)
    serial_.set_option(
      asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none), ec);
  if (!ec)
    serial_.set_option(
      asio::serial_port_base::parity(asio::serial_port_base::parity::none), ec);
  if (!ec)
    serial_.set_option(
      asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one), ec);
  if (ec) {
    std::cerr << "Serial port " << device_ << " setup failed: " << ec.message() << "\n";
    boost::system::error_code close_ec;
    serial_.close(close_ec);
    if (close_ec) {
      std::cerr << "Closing " << device_ << " failed: " << close_ec.message() << "\n";
    }
    return;
  }

  std::cerr << "Opened serial port " << device_ << " @ " << baud << "\n";
}

bool SerialSampleSource::subscribe(SampleHandler handler, int interval_ms) {
  if (!available()) return false;

  // ask the device for the requested cadence; it may ignore it
  std::string req = "{\"interval_ms\":" + std::to_string(interval_ms) + "}\n";
  boost::system::error_code ec;
  asio::write(serial_, asio::buffer(req), ec);
  if (ec) {
    std::cerr << "Could not send interval to " << device_ << ": " << ec.message() << "\n";
  }

  handler_ = std::move(handler);
  return true;
}

void SerialSampleSource::unsubscribe() {
  handler_ = nullptr;
}

bool SerialSampleSource::read_line(std::string& line) {
  boost::system::error_code ec;
  asio::read_until(serial_, buffer_, '\n', ec);
  if (ec) {
    std::cerr << "Serial read from " << device_ << " failed: " << ec.message() << "\n";
    return false;
  }

  std::istream is(&buffer_);
  std::getline(is, line);
  return true;
}

void SerialSampleSource::run(const std::function<void()>& after_frame) {
  std::string line;
  while (handler_ && available()) {
    if (!read_line(line)) break;

    Sample s;
    if (!parse_sample_line(line, kind_, s)) {
      continue; // skip if read/parse failed
    }

    SampleHandler handler = handler_;
    handler(s);
    if (after_frame) after_frame();
  }
}
