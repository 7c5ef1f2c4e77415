// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rest/rest_service.hpp"
#include "query/query_engine.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <nlohmann/json.hpp>

namespace chainquery {
namespace rest {

using json = nlohmann::json;

namespace {

template <typename T> HttpResponse Ok(const T &value) {
  json j = value;
  return HttpResponse{200, j.dump()};
}

HttpResponse NotFound(query::QueryError error) {
  return RestService::Error(404, query::QueryErrorMessage(error));
}

} // namespace

const char *StatusReason(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

RestService::RestService(const query::QueryEngine &engine) : engine_(engine) {
  RegisterHandlers();
}

void RestService::RegisterHandlers() {
  // Endpoints taking a block or transaction hash
  hash_handlers_["/blockheader"] = [this](const auto &p) {
    return HandleBlockHeader(p);
  };
  hash_handlers_["/blocktransactions"] = [this](const auto &p) {
    return HandleBlockTransactions(p);
  };
  hash_handlers_["/blockheight"] = [this](const auto &p) {
    return HandleBlockHeight(p);
  };
  hash_handlers_["/mainchain"] = [this](const auto &p) {
    return HandleMainChain(p);
  };
  hash_handlers_["/transactioninfo"] = [this](const auto &p) {
    return HandleTransactionInfo(p);
  };
  hash_handlers_["/transactioninputs"] = [this](const auto &p) {
    return HandleTransactionInputs(p);
  };
  hash_handlers_["/transactionoutputs"] = [this](const auto &p) {
    return HandleTransactionOutputs(p);
  };

  // Parameterless
  plain_handlers_["/latestblock"] = [this]() { return HandleLatestBlock(); };
  plain_handlers_["/latestheight"] = [this]() { return HandleLatestHeight(); };
}

HttpResponse RestService::Error(int status, const std::string &message) {
  json j = {{"error", message}};
  return HttpResponse{status, j.dump()};
}

HttpResponse RestService::Handle(const std::string &method,
                                 const std::string &target) const {
  if (method != "GET") {
    return Error(405, "Method not allowed");
  }

  const size_t qpos = target.find('?');
  const std::string path = target.substr(0, qpos);
  const bool has_query = qpos != std::string::npos;
  const std::string param = has_query ? target.substr(qpos + 1) : std::string();

  try {
    if (auto it = hash_handlers_.find(path); it != hash_handlers_.end()) {
      return it->second(param);
    }
    if (auto it = plain_handlers_.find(path); it != plain_handlers_.end()) {
      if (has_query) {
        return Error(400, "Endpoint takes no parameters");
      }
      return it->second();
    }
  } catch (const std::exception &e) {
    LOG_HTTP_ERROR("Request '{}' failed: {}", target, e.what());
    return Error(500, "Internal error");
  }

  LOG_HTTP_DEBUG("Unknown endpoint {}", path);
  return Error(404, "Unknown endpoint");
}

HttpResponse RestService::HandleBlockHeader(const std::string &param) const {
  auto hash = util::SafeParseHash(param);
  if (!hash) {
    return Error(400, "Invalid block hash format");
  }
  auto result = engine_.GetBlockHeader(*hash);
  if (!result) {
    return NotFound(result.error());
  }
  return Ok(*result);
}

HttpResponse
RestService::HandleBlockTransactions(const std::string &param) const {
  auto hash = util::SafeParseHash(param);
  if (!hash) {
    return Error(400, "Invalid block hash format");
  }
  auto result = engine_.GetBlockTransactions(*hash);
  if (!result) {
    return NotFound(result.error());
  }
  return Ok(*result);
}

HttpResponse RestService::HandleBlockHeight(const std::string &param) const {
  auto hash = util::SafeParseHash(param);
  if (!hash) {
    return Error(400, "Invalid block hash format");
  }
  auto result = engine_.GetBlockHeight(*hash);
  if (!result) {
    return NotFound(result.error());
  }
  return Ok(json{{"height", *result}});
}

HttpResponse RestService::HandleMainChain(const std::string &param) const {
  auto hash = util::SafeParseHash(param);
  if (!hash) {
    return Error(400, "Invalid block hash format");
  }
  auto result = engine_.IsMainChain(*hash);
  if (!result) {
    return NotFound(result.error());
  }
  return Ok(json{{"main_chain", *result}});
}

HttpResponse RestService::HandleLatestBlock() const {
  auto result = engine_.GetLatestBlock();
  if (!result) {
    return NotFound(result.error());
  }
  return Ok(json{{"hash", result->GetHex()}});
}

HttpResponse RestService::HandleLatestHeight() const {
  auto result = engine_.GetLatestHeight();
  if (!result) {
    return NotFound(result.error());
  }
  return Ok(json{{"height", *result}});
}

HttpResponse
RestService::HandleTransactionInfo(const std::string &param) const {
  auto txid = util::SafeParseHash(param);
  if (!txid) {
    return Error(400, "Invalid transaction hash format");
  }
  auto result = engine_.GetTransactionInfo(*txid);
  if (!result) {
    return NotFound(result.error());
  }
  return Ok(*result);
}

HttpResponse
RestService::HandleTransactionInputs(const std::string &param) const {
  auto txid = util::SafeParseHash(param);
  if (!txid) {
    return Error(400, "Invalid transaction hash format");
  }
  auto result = engine_.GetTransactionInputs(*txid);
  if (!result) {
    return NotFound(result.error());
  }
  return Ok(*result);
}

HttpResponse
RestService::HandleTransactionOutputs(const std::string &param) const {
  auto txid = util::SafeParseHash(param);
  if (!txid) {
    return Error(400, "Invalid transaction hash format");
  }
  auto result = engine_.GetTransactionOutputs(*txid);
  if (!result) {
    return NotFound(result.error());
  }
  return Ok(*result);
}

} // namespace rest
} // namespace chainquery
