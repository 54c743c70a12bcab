#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "netheal/aliases.hpp"
#include "netheal/api.hpp"
#include "netheal/config.hpp"
#include "netheal/prober.hpp"

namespace py = pybind11;

namespace {

std::shared_ptr<netheal::NetHealSettings> resolve_settings(const std::string& config_path) {
    if (config_path.empty()) {
        return std::make_shared<netheal::NetHealSettings>(netheal::NetHealSettings::load());
    }
    return std::make_shared<netheal::NetHealSettings>(netheal::NetHealSettings::from_toml(config_path));
}

}  // namespace

PYBIND11_MODULE(netheal_python, m) {
    m.doc() = "Pybind11 bindings for the netheal network self-healing core.";

    py::enum_<netheal::ProbeMethod>(m, "ProbeMethod")
        .value("GATEWAY", netheal::ProbeMethod::kGateway)
        .value("PUBLIC_DNS", netheal::ProbeMethod::kPublicDns)
        .value("HTTP", netheal::ProbeMethod::kHttp);

    py::class_<netheal::ReachabilityResult>(m, "ReachabilityResult")
        .def(py::init<>())
        .def_readwrite("reachable", &netheal::ReachabilityResult::reachable)
        .def_readwrite("method", &netheal::ReachabilityResult::method)
        .def_readwrite("observed_at", &netheal::ReachabilityResult::observed_at);

    py::class_<netheal::ReconcileReport>(m, "ReconcileReport")
        .def_readonly("enabled", &netheal::ReconcileReport::enabled)
        .def_readonly("disabled", &netheal::ReconcileReport::disabled)
        .def_readonly("failed", &netheal::ReconcileReport::failed)
        .def_readonly("hosts_updated", &netheal::ReconcileReport::hosts_updated)
        .def("transitions", &netheal::ReconcileReport::transitions);

    m.def("sanitize_hostname", &netheal::sanitize_hostname, py::arg("name"));

    m.def("desired_aliases",
          [](const std::string& hostname, const std::string& config_path) {
              return netheal::desired_aliases(hostname, resolve_settings(config_path)->aliases);
          },
          py::arg("hostname"), py::arg("config_path") = "");

    m.def("probe",
          [](const std::string& config_path) {
              auto runtime = netheal::build_runtime(resolve_settings(config_path));
              py::gil_scoped_release release;
              return runtime.prober->probe();
          },
          py::arg("config_path") = "");

    m.def("reconcile_aliases",
          [](const std::string& hostname, const std::string& config_path) {
              const auto sanitized = netheal::sanitize_hostname(hostname);
              if (sanitized.empty()) {
                  throw py::value_error("hostname has no valid characters: " + hostname);
              }
              auto runtime = netheal::build_runtime(resolve_settings(config_path));
              auto reconciler = netheal::build_alias_reconciler(runtime);
              py::gil_scoped_release release;
              return reconciler->reconcile(sanitized);
          },
          py::arg("hostname"), py::arg("config_path") = "");
}
