#pragma once
#include "ISampleSource.hpp"
#include <boost/asio.hpp>
#include <boost/asio/serial_port.hpp>
#include <string>

// Live samples from a device streaming one JSON frame per line over a
// serial link, e.g.
// {"t_ms":120,"accel_with_gravity":{"x":0.1,"y":0.2,"z":-9.6}}
class SerialSampleSource : public ISampleSource {
public:
  // Never throws on a missing port: the source just reports unavailable.
  SerialSampleSource(const std::string& device, SampleKind kind,
                     unsigned int baud = 115200);

  bool available() const { return serial_.is_open(); }

  SampleKind kind() const override { return kind_; }
  bool subscribe(SampleHandler handler, int interval_ms) override;
  void unsubscribe() override;
  bool subscribed() const override { return static_cast<bool>(handler_); }

  // Blocks reading frames until unsubscribed or the port fails.
  // after_frame runs once per delivered frame.
  void run(const std::function<void()>& after_frame = nullptr);

private:
  bool read_line(std::string& line);

  boost::asio::io_context io_;
  boost::asio::serial_port serial_;
  boost::asio::streambuf buffer_;
  std::string device_;
  SampleKind kind_;
  SampleHandler handler_;
};
