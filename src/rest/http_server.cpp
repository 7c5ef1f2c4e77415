// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rest/http_server.hpp"
#include "rest/rest_service.hpp"
#include "util/logging.hpp"
#include <istream>
#include <sstream>

namespace chainquery {
namespace rest {

namespace {

using tcp = boost::asio::ip::tcp;

std::string FormatResponse(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << StatusReason(response.status)
      << "\r\n"
      << "Content-Type: application/json\r\n"
      << "Content-Length: " << response.body.size() << "\r\n"
      << "Connection: close\r\n"
      << "\r\n"
      << response.body;
  return out.str();
}

/**
 * One connection: read head, dispatch, write, close. Owned by the pending
 * async operations through shared_from_this().
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket socket, const RestService &service)
      : socket_(std::move(socket)), timer_(socket_.get_executor()),
        buffer_(HttpServer::MAX_REQUEST_SIZE), service_(service) {}

  void Start() {
    auto self = shared_from_this();

    timer_.expires_after(HttpServer::REQUEST_TIMEOUT);
    timer_.async_wait([self](const boost::system::error_code &ec) {
      if (!ec) {
        LOG_HTTP_DEBUG("Request timed out, closing connection");
        boost::system::error_code ignored;
        self->socket_.close(ignored);
      }
    });

    boost::asio::async_read_until(
        socket_, buffer_, "\r\n\r\n",
        [self](const boost::system::error_code &ec, size_t) {
          self->OnRead(ec);
        });
  }

private:
  void OnRead(const boost::system::error_code &ec) {
    if (ec == boost::asio::error::not_found) {
      // Head did not fit in MAX_REQUEST_SIZE
      LOG_HTTP_WARN("Request head exceeds {} bytes", HttpServer::MAX_REQUEST_SIZE);
      Respond(RestService::Error(400, "Request too large"));
      return;
    }
    if (ec) {
      if (ec != boost::asio::error::operation_aborted &&
          ec != boost::asio::error::eof) {
        LOG_HTTP_TRACE("Read error: {}", ec.message());
      }
      Close();
      return;
    }

    std::istream stream(&buffer_);
    std::string request_line;
    std::getline(stream, request_line);
    if (!request_line.empty() && request_line.back() == '\r') {
      request_line.pop_back();
    }

    std::istringstream parts(request_line);
    std::string method, target, version;
    if (!(parts >> method >> target >> version) ||
        version.rfind("HTTP/", 0) != 0 || target.empty() || target[0] != '/') {
      LOG_HTTP_DEBUG("Unparsable request line '{}'", request_line);
      Respond(RestService::Error(400, "Malformed request"));
      return;
    }

    HttpResponse response = service_.Handle(method, target);
    LOG_HTTP_DEBUG("{} {} -> {}", method, target, response.status);
    Respond(response);
  }

  void Respond(const HttpResponse &response) {
    response_ = FormatResponse(response);
    auto self = shared_from_this();
    boost::asio::async_write(
        socket_, boost::asio::buffer(response_),
        [self](const boost::system::error_code &ec, size_t) {
          if (ec) {
            LOG_HTTP_TRACE("Write error: {}", ec.message());
          }
          self->Close();
        });
  }

  void Close() {
    boost::system::error_code ec;
    timer_.cancel();
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }

  tcp::socket socket_;
  boost::asio::steady_timer timer_;
  boost::asio::streambuf buffer_;
  std::string response_;
  const RestService &service_;
};

} // namespace

HttpServer::HttpServer(const RestService &service, size_t io_threads)
    : service_(service), desired_io_threads_(io_threads == 0 ? 1 : io_threads) {}

HttpServer::~HttpServer() { Stop(); }

bool HttpServer::Start(const std::string &bind_address, uint16_t port) {
  if (running_) {
    LOG_HTTP_TRACE("HTTP server already running");
    return false;
  }

  io_context_ = std::make_unique<boost::asio::io_context>();

  try {
    const auto address = boost::asio::ip::make_address(bind_address);
    const tcp::endpoint endpoint(address, port);

    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);

    boost::system::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    bound_port_ = ec ? 0 : ep.port();
  } catch (const std::exception &e) {
    LOG_HTTP_ERROR("Failed to listen on {}:{}: {}", bind_address, port, e.what());
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    io_context_.reset();
    return false;
  }

  StartAccept();

  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < desired_io_threads_; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
  running_ = true;

  LOG_HTTP_INFO("HTTP server listening on {}:{} ({} threads)", bind_address,
                bound_port_.load(), desired_io_threads_);
  return true;
}

void HttpServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
  }
  work_guard_.reset();
  io_context_->stop();

  for (auto &t : io_threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  io_threads_.clear();

  // Destroy pending sessions while the io_context still exists
  acceptor_.reset();
  io_context_.reset();
  bound_port_ = 0;

  LOG_HTTP_INFO("HTTP server stopped");
}

void HttpServer::StartAccept() {
  if (!acceptor_) {
    return;
  }
  acceptor_->async_accept(
      boost::asio::make_strand(*io_context_),
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        HandleAccept(ec, std::move(socket));
      });
}

void HttpServer::HandleAccept(const boost::system::error_code &ec,
                              tcp::socket socket) {
  if (ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    LOG_HTTP_TRACE("accept error: {}", ec.message());
    StartAccept();
    return;
  }

  std::make_shared<HttpSession>(std::move(socket), service_)->Start();
  StartAccept();
}

} // namespace rest
} // namespace chainquery
