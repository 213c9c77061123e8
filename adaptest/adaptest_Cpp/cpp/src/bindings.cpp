#include "../include/cat/errors.hpp"
#include "../include/cat/memory_persistence.hpp"
#include "../include/cat/pool_catalog.hpp"
#include "../include/cat/session_engine.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace py = pybind11;

namespace {

nlohmann::json py_to_json(py::handle handle) {
  if (handle.is_none()) {
    return nullptr;
  }
  if (py::isinstance<py::bool_>(handle)) {
    return handle.cast<bool>();
  }
  if (py::isinstance<py::int_>(handle)) {
    return static_cast<long long>(handle.cast<long long>());
  }
  if (py::isinstance<py::float_>(handle)) {
    return handle.cast<double>();
  }
  if (py::isinstance<py::str>(handle)) {
    return handle.cast<std::string>();
  }
  if (py::isinstance<py::dict>(handle)) {
    nlohmann::json json_obj = nlohmann::json::object();
    for (auto item : handle.cast<py::dict>()) {
      auto key = py::cast<std::string>(item.first);
      json_obj[key] = py_to_json(item.second);
    }
    return json_obj;
  }
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle.cast<py::sequence>()) {
      json_array.push_back(py_to_json(item));
    }
    return json_array;
  }
  throw std::invalid_argument("Unsupported Python type for JSON conversion");
}

py::object json_to_py(const nlohmann::json& json_value) {
  if (json_value.is_null()) {
    return py::none();
  }
  if (json_value.is_boolean()) {
    return py::bool_(json_value.get<bool>());
  }
  if (json_value.is_number_unsigned()) {
    return py::int_(json_value.get<unsigned long long>());
  }
  if (json_value.is_number_integer()) {
    return py::int_(json_value.get<long long>());
  }
  if (json_value.is_number_float()) {
    return py::float_(json_value.get<double>());
  }
  if (json_value.is_string()) {
    return py::str(json_value.get<std::string>());
  }
  if (json_value.is_array()) {
    py::list list;
    for (const auto& element : json_value) {
      list.append(json_to_py(element));
    }
    return list;
  }
  if (json_value.is_object()) {
    py::dict dict;
    for (const auto& entry : json_value.items()) {
      dict[py::str(entry.key())] = json_to_py(entry.value());
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

class PySessionEngine {
public:
  PySessionEngine()
      : persistence_(std::make_shared<cat::MemoryPersistence>()),
        engine_(cat::make_engine(persistence_)) {}

  py::object load_pool(py::object document) {
    auto pool = cat::load_pool_json(py_to_json(document));
    auto info = cat::bridge::to_json(pool->info());
    persistence_->add_pool(std::move(pool));
    return json_to_py(info);
  }

  py::object load_pool_file(const std::string& path) {
    auto pool = cat::load_pool_file(path);
    auto info = cat::bridge::to_json(pool->info());
    persistence_->add_pool(std::move(pool));
    return json_to_py(info);
  }

  std::string start_session(const std::string& pool_id, const std::string& examinee_id,
                            py::object config_obj) {
    auto config = cat::bridge::session_config_from_json(py_to_json(config_obj));
    return engine_->start_session(pool_id, examinee_id, config);
  }

  py::object next_question(const std::string& session_id) {
    auto next = engine_->get_next_question(session_id);
    if (auto item = std::get_if<cat::Item>(&next)) {
      return json_to_py(cat::bridge::question_to_json(*item));
    }
    return json_to_py(cat::bridge::to_json(std::get<cat::StopSignal>(next)));
  }

  py::object submit_response(const std::string& session_id, const std::string& item_id,
                             py::object answer, std::optional<double> response_time) {
    auto outcome = engine_->submit_response(session_id, item_id, py_to_json(answer), response_time);
    return json_to_py(cat::bridge::to_json(outcome));
  }

  py::object complete_session(const std::string& session_id) {
    return json_to_py(cat::bridge::to_json(engine_->complete_session(session_id)));
  }

  void abandon_session(const std::string& session_id) {
    engine_->abandon_session(session_id);
  }

  py::object session(const std::string& session_id) {
    return json_to_py(cat::bridge::to_json(engine_->session(session_id)));
  }

  py::object debug_state(const std::string& session_id) {
    return json_to_py(engine_->debug_state(session_id));
  }

  py::object item_statistics(const std::string& pool_id, const std::string& item_id) {
    auto pool = persistence_->load_pool(pool_id);
    return json_to_py(cat::bridge::to_json(pool->item_statistics(item_id)));
  }

private:
  std::shared_ptr<cat::MemoryPersistence> persistence_;
  std::unique_ptr<cat::SessionEngine> engine_;
};

} // namespace

PYBIND11_MODULE(adaptest_py, m) {
  py::register_exception<cat::InvalidItemParameters>(m, "InvalidItemParameters", PyExc_ValueError);
  py::register_exception<cat::NoEligibleItemsError>(m, "NoEligibleItemsError");
  py::register_exception<cat::InvalidStateTransitionError>(m, "InvalidStateTransitionError");
  py::register_exception<cat::EstimationDivergenceError>(m, "EstimationDivergenceError");
  py::register_exception<cat::UnknownItemError>(m, "UnknownItemError", PyExc_KeyError);
  py::register_exception<cat::UnknownSessionError>(m, "UnknownSessionError", PyExc_KeyError);
  py::register_exception<cat::UnknownPoolError>(m, "UnknownPoolError", PyExc_KeyError);

  py::class_<PySessionEngine>(m, "SessionEngine")
      .def(py::init<>())
      .def("load_pool", &PySessionEngine::load_pool, py::arg("document"))
      .def("load_pool_file", &PySessionEngine::load_pool_file, py::arg("path"))
      .def("start_session", &PySessionEngine::start_session, py::arg("pool_id"),
           py::arg("examinee_id"), py::arg("config") = py::none())
      .def("next_question", &PySessionEngine::next_question)
      .def("submit_response", &PySessionEngine::submit_response, py::arg("session_id"),
           py::arg("item_id"), py::arg("answer"), py::arg("response_time") = py::none())
      .def("complete_session", &PySessionEngine::complete_session)
      .def("abandon_session", &PySessionEngine::abandon_session)
      .def("session", &PySessionEngine::session)
      .def("debug_state", &PySessionEngine::debug_state)
      .def("item_statistics", &PySessionEngine::item_statistics, py::arg("pool_id"),
           py::arg("item_id"));
}
