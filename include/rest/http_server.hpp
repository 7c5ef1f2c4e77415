// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp (Boost 1.74, C++20)
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace chainquery {
namespace rest {

class RestService;

/**
 * HttpServer - minimal HTTP/1.1 front end for RestService.
 *
 * One request per connection: read the request head, answer, close. Bodies
 * are not read (every endpoint is a GET). Connections are accepted on a
 * pool of io threads; each session runs on its own strand.
 */
class HttpServer {
public:
  static constexpr size_t MAX_REQUEST_SIZE = 8192;
  static constexpr std::chrono::seconds REQUEST_TIMEOUT{10};

  // LIFETIME: service must outlive the server
  HttpServer(const RestService &service, size_t io_threads);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  // Bind, listen and start the io threads. port 0 picks an ephemeral port.
  bool Start(const std::string &bind_address, uint16_t port);
  void Stop();

  bool IsRunning() const { return running_; }

  // Bound port (0 if not listening)
  uint16_t GetPort() const { return bound_port_; }

private:
  void StartAccept();
  void HandleAccept(const boost::system::error_code &ec,
                    boost::asio::ip::tcp::socket socket);

  const RestService &service_;
  size_t desired_io_threads_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> bound_port_{0};
};

} // namespace rest
} // namespace chainquery
