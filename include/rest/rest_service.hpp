// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <functional>
#include <map>
#include <string>

namespace chainquery {

namespace query {
class QueryEngine;
} // namespace query

namespace rest {

struct HttpResponse {
  int status{200};
  std::string body; // JSON document
};

const char *StatusReason(int status);

/**
 * RestService - maps "GET /<endpoint>?<hash>" onto QueryEngine calls.
 *
 * Transport-free: HttpServer parses the request line and hands method and
 * target here, so routing and status codes are testable without sockets.
 *
 * Endpoints taking a hash expect exactly 64 hex characters as the raw query
 * string. latestblock and latestheight take no query string.
 */
class RestService {
public:
  // LIFETIME: engine must outlive the service
  explicit RestService(const query::QueryEngine &engine);

  HttpResponse Handle(const std::string &method, const std::string &target) const;

  static HttpResponse Error(int status, const std::string &message);

private:
  using HashHandler = std::function<HttpResponse(const std::string &)>;
  using PlainHandler = std::function<HttpResponse()>;

  void RegisterHandlers();

  HttpResponse HandleBlockHeader(const std::string &param) const;
  HttpResponse HandleBlockTransactions(const std::string &param) const;
  HttpResponse HandleBlockHeight(const std::string &param) const;
  HttpResponse HandleMainChain(const std::string &param) const;
  HttpResponse HandleLatestBlock() const;
  HttpResponse HandleLatestHeight() const;
  HttpResponse HandleTransactionInfo(const std::string &param) const;
  HttpResponse HandleTransactionInputs(const std::string &param) const;
  HttpResponse HandleTransactionOutputs(const std::string &param) const;

  const query::QueryEngine &engine_;
  std::map<std::string, HashHandler> hash_handlers_;
  std::map<std::string, PlainHandler> plain_handlers_;
};

} // namespace rest
} // namespace chainquery
