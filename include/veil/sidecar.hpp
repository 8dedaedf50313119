#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "veil/pipeline.hpp"
#include "veil/session_registry.hpp"

namespace httplib {
class Server;
}

namespace veil {

struct SidecarResponse {
  int status = 200;
  nlohmann::json body;
};

// JSON-over-HTTP front end for a pipeline and a session registry. Handle()
// does all the routing; Listen() only wires it to a socket.
class Sidecar {
 public:
  Sidecar(std::shared_ptr<const RedactionPipeline> pipeline, SessionRegistry& sessions);
  ~Sidecar();

  Sidecar(const Sidecar&) = delete;
  Sidecar& operator=(const Sidecar&) = delete;

  [[nodiscard]] SidecarResponse Handle(const std::string& method, const std::string& path, const std::string& body);

  // Blocks until Stop() is called or the socket cannot be bound.
  bool Listen(const std::string& host, int port);
  void Stop();

 private:
  using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

  nlohmann::json Health(const nlohmann::json& req);
  nlohmann::json Sessions(const nlohmann::json& req);
  nlohmann::json Redact(const nlohmann::json& req);
  nlohmann::json RedactText(const nlohmann::json& req);
  nlohmann::json Rehydrate(const nlohmann::json& req);
  nlohmann::json Clear(const nlohmann::json& req);

  std::shared_ptr<const RedactionPipeline> pipeline_;
  SessionRegistry& sessions_;
  std::map<std::pair<std::string, std::string>, Handler> routes_;
  std::unique_ptr<httplib::Server> server_;
};

}  // namespace veil
