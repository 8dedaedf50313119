#include "veil/sidecar.hpp"

#include <httplib.h>

#include <stdexcept>

namespace veil {

namespace {

std::string SessionOf(const nlohmann::json& req) {
  auto it = req.find("session_id");
  if (it != req.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
    return it->get<std::string>();
  }
  return "default";
}

std::string RequireText(const nlohmann::json& req) {
  auto it = req.find("text");
  if (it == req.end() || !it->is_string()) {
    throw std::invalid_argument("field 'text' must be a string");
  }
  return it->get<std::string>();
}

nlohmann::json EntityJson(const EntityMatch& m) {
  return {{"type", m.entity_type}, {"text", m.text}, {"start", m.start}, {"end", m.end},
          {"score", m.score},      {"source", m.source}};
}

}  // namespace

Sidecar::Sidecar(std::shared_ptr<const RedactionPipeline> pipeline, SessionRegistry& sessions)
    : pipeline_(std::move(pipeline)), sessions_(sessions) {
  if (!pipeline_) {
    throw std::invalid_argument("Sidecar requires a pipeline");
  }
  routes_[{"GET", "/health"}] = [this](const nlohmann::json& r) { return Health(r); };
  routes_[{"GET", "/sessions"}] = [this](const nlohmann::json& r) { return Sessions(r); };
  routes_[{"POST", "/redact"}] = [this](const nlohmann::json& r) { return Redact(r); };
  routes_[{"POST", "/redact-text"}] = [this](const nlohmann::json& r) { return RedactText(r); };
  routes_[{"POST", "/rehydrate"}] = [this](const nlohmann::json& r) { return Rehydrate(r); };
  routes_[{"POST", "/clear"}] = [this](const nlohmann::json& r) { return Clear(r); };
}

Sidecar::~Sidecar() = default;

SidecarResponse Sidecar::Handle(const std::string& method, const std::string& path, const std::string& body) {
  auto route = routes_.find({method, path});
  if (route == routes_.end()) {
    return {404, {{"error", "not found"}}};
  }

  nlohmann::json req = nlohmann::json::object();
  if (!body.empty()) {
    req = nlohmann::json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object()) {
      return {500, {{"error", "request body must be a JSON object"}}};
    }
  }

  try {
    return {200, route->second(req)};
  } catch (const std::exception& e) {
    return {500, {{"error", e.what()}}};
  }
}

nlohmann::json Sidecar::Health(const nlohmann::json&) {
  return {{"status", "ok"}, {"vault_sessions", sessions_.OpenSessions()}};
}

nlohmann::json Sidecar::Sessions(const nlohmann::json&) {
  return {{"sessions", sessions_.ListSessions()}};
}

nlohmann::json Sidecar::Redact(const nlohmann::json& req) {
  auto it = req.find("messages");
  if (it == req.end() || !it->is_array()) {
    throw std::invalid_argument("field 'messages' must be an array");
  }
  const auto& messages = *it;
  auto redacted = sessions_.WithVault(SessionOf(req), [&](Vault& vault) {
    return pipeline_->RedactMessages(messages, vault);
  });
  return {{"messages", std::move(redacted)}};
}

nlohmann::json Sidecar::RedactText(const nlohmann::json& req) {
  const std::string text = RequireText(req);
  auto result = sessions_.WithVault(SessionOf(req), [&](Vault& vault) { return pipeline_->Redact(text, vault); });

  nlohmann::json entities = nlohmann::json::array();
  for (const auto& m : result.entities) {
    entities.push_back(EntityJson(m));
  }
  return {{"text", result.text}, {"entities", std::move(entities)}, {"token_count", result.token_map.size()}};
}

nlohmann::json Sidecar::Rehydrate(const nlohmann::json& req) {
  const std::string text = RequireText(req);
  auto restored = sessions_.WithVault(SessionOf(req), [&](Vault& vault) { return vault.Rehydrate(text); });
  return {{"text", restored}};
}

nlohmann::json Sidecar::Clear(const nlohmann::json& req) {
  const std::string session = SessionOf(req);
  sessions_.WithVault(session, [](Vault& vault) { vault.Clear(); });
  return {{"status", "cleared"}, {"session_id", session}};
}

bool Sidecar::Listen(const std::string& host, int port) {
  server_ = std::make_unique<httplib::Server>();
  auto serve = [this](const httplib::Request& req, httplib::Response& res) {
    auto out = Handle(req.method, req.path, req.body);
    res.status = out.status;
    res.set_content(out.body.dump(), "application/json");
  };
  for (const auto& kv : routes_) {
    if (kv.first.first == "GET") {
      server_->Get(kv.first.second, serve);
    } else {
      server_->Post(kv.first.second, serve);
    }
  }
  server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404) {
      res.set_content(R"({"error":"not found"})", "application/json");
    }
  });
  return server_->listen(host, port);
}

void Sidecar::Stop() {
  if (server_) {
    server_->stop();
  }
}

}  // namespace veil
