#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <nlohmann/json.hpp>

#include "veil/analyzer_client.hpp"
#include "veil/errors.hpp"
#include "veil/pipeline.hpp"
#include "veil/sqlite_vault.hpp"
#include "veil/stream.hpp"
#include "veil/vault.hpp"

namespace py = pybind11;
using namespace veil;

PYBIND11_MODULE(pyveil, m) {
  py::register_exception<ScanError>(m, "ScanError", PyExc_RuntimeError);
  py::register_exception<StorageError>(m, "StorageError", PyExc_RuntimeError);
  py::register_exception<ConfigError>(m, "ConfigError", PyExc_ValueError);

  py::class_<EntityMatch>(m, "EntityMatch")
      .def(py::init<>())
      .def_readwrite("entity_type", &EntityMatch::entity_type)
      .def_readwrite("start", &EntityMatch::start)
      .def_readwrite("end", &EntityMatch::end)
      .def_readwrite("text", &EntityMatch::text)
      .def_readwrite("score", &EntityMatch::score)
      .def_readwrite("source", &EntityMatch::source);

  py::class_<RedactedMessage>(m, "RedactedMessage")
      .def_readonly("text", &RedactedMessage::text)
      .def_readonly("entities", &RedactedMessage::entities)
      .def_readonly("token_map", &RedactedMessage::token_map);

  py::class_<RedactorOptions>(m, "RedactorOptions")
      .def(py::init<>())
      .def_readwrite("use_model", &RedactorOptions::use_model)
      .def_readwrite("language", &RedactorOptions::language)
      .def_readwrite("score_threshold", &RedactorOptions::score_threshold)
      .def_readwrite("model_entities", &RedactorOptions::model_entities)
      .def_readwrite("skip_types", &RedactorOptions::skip_types)
      .def_readwrite("allow_list", &RedactorOptions::allow_list);

  py::class_<Vault>(m, "Vault")
      .def("get_or_create_token", &Vault::GetOrCreateToken)
      .def("rehydrate", &Vault::Rehydrate)
      .def("lookup_token", &Vault::LookupToken)
      .def("lookup_pii", &Vault::LookupPii)
      .def("size", &Vault::Size)
      .def("longest_token", &Vault::LongestToken)
      .def("dump", &Vault::Dump)
      .def("clear", &Vault::Clear);

  py::class_<InMemoryVault, Vault>(m, "InMemoryVault").def(py::init<>());

  py::class_<SqliteVault, Vault>(m, "SqliteVault")
      .def(py::init<std::string, const std::string&>(), py::arg("session_id"), py::arg("db_path"))
      .def("list_sessions", &SqliteVault::ListSessions)
      .def("delete_session", &SqliteVault::DeleteSession)
      .def("close", &SqliteVault::Close)
      .def_property_readonly("session_id", &SqliteVault::SessionId);

  py::class_<RedactionPipeline>(m, "RedactionPipeline")
      .def(py::init([](RedactorOptions opts, const std::string& analyzer_url) {
             std::shared_ptr<RecognizerCache> recognizers;
             if (opts.use_model) {
               AnalyzerClientOptions aopts;
               aopts.base_url = analyzer_url;
               recognizers = MakeAnalyzerCache(std::move(aopts));
             }
             return std::make_unique<RedactionPipeline>(std::move(opts), std::move(recognizers));
           }),
           py::arg("options") = RedactorOptions{}, py::arg("analyzer_url") = "http://127.0.0.1:5002")
      .def("add_scanner",
           [](RedactionPipeline& self, const std::string& name, FunctionScanner::ScanFn fn) {
             self.AddScanner(std::make_shared<FunctionScanner>(name, std::move(fn)));
           })
      .def("redact", &RedactionPipeline::Redact, py::arg("text"), py::arg("vault"))
      .def("detect", &RedactionPipeline::Detect)
      .def(
          "redact_messages",
          [](const RedactionPipeline& self, const py::object& messages, Vault& vault, const std::string& content_key) {
            // Messages cross the boundary as JSON text.
            py::module_ json = py::module_::import("json");
            const std::string in = py::str(json.attr("dumps")(messages, py::arg("ensure_ascii") = false));
            const std::string out = self.RedactMessages(nlohmann::json::parse(in), vault, content_key).dump();
            return json.attr("loads")(out);
          },
          py::arg("messages"), py::arg("vault"), py::arg("content_key") = "content");

  py::class_<StreamingRehydrator>(m, "StreamingRehydrator")
      .def(py::init<const Vault&, std::size_t>(), py::keep_alive<1, 2>(), py::arg("vault"),
           py::arg("max_token_bytes") = 64)
      .def("feed", &StreamingRehydrator::Feed)
      .def("flush", &StreamingRehydrator::Flush)
      .def_property_readonly("pending", &StreamingRehydrator::Pending);
}
