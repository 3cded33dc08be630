/*
  Pybind11 module exposing DepotRoute-Core C++ APIs to Python.

  Notes:
    - Tables are passed as lists of Location/Edge objects; the core copies
      them into its own storage, so no Python object outlives a call.
    - Error types are registered as Python exceptions with the same names.
    - The GIL is released while the solver runs, so another Python thread
      can call Planner.cancel() on the same planner.
*/
#include <pybind11/chrono.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <vector>

#include "depotroute/core/error.hpp"
#include "depotroute/core/location_graph.hpp"
#include "depotroute/core/options.hpp"
#include "depotroute/core/planner.hpp"
#include "depotroute/core/solution.hpp"
#include "depotroute/core/solver.hpp"
#include "depotroute/core/types.hpp"

namespace py = pybind11;
using namespace depotroute::core;

PYBIND11_MODULE(_depotroute_core, m) {
  m.doc() = "DepotRoute-Core C++ bindings";

  py::register_exception<ValidationError>(m, "ValidationError", PyExc_ValueError);
  py::register_exception<InfeasibleModel>(m, "InfeasibleModel", PyExc_RuntimeError);
  py::register_exception<SolverTimeout>(m, "SolverTimeout", PyExc_TimeoutError);
  py::register_exception<SolverError>(m, "SolverError", PyExc_RuntimeError);
  py::register_exception<ReconstructionError>(m, "ReconstructionError", PyExc_RuntimeError);

  py::enum_<LocationRole>(m, "LocationRole")
      .value("HUB", LocationRole::Hub)
      .value("DEPOT", LocationRole::Depot);

  py::enum_<FixedDecision>(m, "FixedDecision")
      .value("UNCONSTRAINED", FixedDecision::Unconstrained)
      .value("FORCE_DIRECT", FixedDecision::ForceDirect)
      .value("FORCE_ROUTE", FixedDecision::ForceRoute);

  py::enum_<CostModel>(m, "CostModel")
      .value("FLAT", CostModel::Flat)
      .value("ITEMIZED", CostModel::Itemized);

  py::enum_<SolveStatus>(m, "SolveStatus")
      .value("OPTIMAL", SolveStatus::Optimal)
      .value("TIME_LIMIT_REACHED", SolveStatus::TimeLimitReached)
      .value("INFEASIBLE", SolveStatus::Infeasible)
      .value("FEASIBLE", SolveStatus::Feasible);

  py::class_<Location>(m, "Location")
      .def(py::init([](std::string id, LocationRole role, bool included, double direct_cost, FixedDecision fixed){
        return Location{std::move(id), role, included, direct_cost, fixed};
      }),
        py::arg("id"),
        py::kw_only(),
        py::arg("role") = LocationRole::Depot,
        py::arg("included") = true,
        py::arg("direct_cost") = 0.0,
        py::arg("fixed") = FixedDecision::Unconstrained)
      .def_readwrite("id", &Location::id)
      .def_readwrite("role", &Location::role)
      .def_readwrite("included", &Location::included)
      .def_readwrite("direct_cost", &Location::direct_cost)
      .def_readwrite("fixed", &Location::fixed);

  py::class_<Edge>(m, "Edge")
      .def(py::init([](std::string from, std::string to, double time, std::optional<double> distance){
        return Edge{std::move(from), std::move(to), time, distance};
      }),
        py::arg("src"), py::arg("dst"), py::arg("time"), py::arg("distance") = py::none())
      .def_readwrite("src", &Edge::from)
      .def_readwrite("dst", &Edge::to)
      .def_readwrite("time", &Edge::time)
      .def_readwrite("distance", &Edge::distance);

  py::class_<CostOptions>(m, "CostOptions")
      .def(py::init<>())
      .def_readwrite("model", &CostOptions::model)
      .def_readwrite("cost_per_minute", &CostOptions::cost_per_minute)
      .def_readwrite("gas_cost_per_mile", &CostOptions::gas_cost_per_mile)
      .def_readwrite("staff_cost_per_hour", &CostOptions::staff_cost_per_hour);

  py::class_<SolverOptions>(m, "SolverOptions")
      .def(py::init<>())
      .def_readwrite("backend", &SolverOptions::backend)
      .def_readwrite("time_limit", &SolverOptions::time_limit)
      .def_readwrite("num_threads", &SolverOptions::num_threads)
      .def_readwrite("enable_output", &SolverOptions::enable_output);

  py::class_<PlanOptions>(m, "PlanOptions")
      .def(py::init<>())
      .def_readwrite("max_drive_time", &PlanOptions::max_drive_time)
      .def_readwrite("max_routes", &PlanOptions::max_routes)
      .def_readwrite("cost", &PlanOptions::cost)
      .def_readwrite("start", &PlanOptions::start)
      .def_readwrite("end", &PlanOptions::end)
      .def_readwrite("break_route_symmetry", &PlanOptions::break_route_symmetry)
      .def_readwrite("solver", &PlanOptions::solver);

  m.def("minutes_from_hours", &minutes_from_hours, py::arg("hours"));

  py::class_<LocationGraph>(m, "LocationGraph")
      .def_static(
          "from_tables",
          [](const std::vector<Location>& locations, const std::vector<Edge>& edges, bool mirror) {
            return LocationGraph::from_tables(locations, edges, mirror);
          },
          py::arg("locations"), py::arg("edges"), py::kw_only(), py::arg("mirror") = true)
      .def("num_locations", &LocationGraph::num_locations)
      .def("hub", [](const LocationGraph& g){ return g.location(g.hub()).id; })
      .def("time", [](const LocationGraph& g, const std::string& a, const std::string& b){ return g.time(a, b); })
      .def("distance", [](const LocationGraph& g, const std::string& a, const std::string& b){ return g.distance(a, b); })
      .def("validate_for", &LocationGraph::validate_for, py::arg("options"));

  py::class_<DirectShipment>(m, "DirectShipment")
      .def_readonly("location", &DirectShipment::location)
      .def_readonly("cost", &DirectShipment::cost);

  py::class_<RouteStop>(m, "RouteStop")
      .def_readonly("location", &RouteStop::location)
      .def_readonly("leg_time", &RouteStop::leg_time)
      .def_readonly("leg_cost", &RouteStop::leg_cost)
      .def_readonly("cumulative_time", &RouteStop::cumulative_time)
      .def_readonly("cumulative_cost", &RouteStop::cumulative_cost);

  py::class_<Route>(m, "Route")
      .def_readonly("stops", &Route::stops)
      .def_readonly("total_time", &Route::total_time)
      .def_readonly("total_cost", &Route::total_cost)
      .def("visited", &Route::visited);

  py::class_<PlanResult>(m, "PlanResult")
      .def_readonly("direct", &PlanResult::direct)
      .def_readonly("routes", &PlanResult::routes)
      .def_readonly("direct_cost", &PlanResult::direct_cost)
      .def_readonly("route_cost", &PlanResult::route_cost)
      .def_readonly("total_cost", &PlanResult::total_cost)
      .def_readonly("objective_value", &PlanResult::objective_value)
      .def_readonly("status", &PlanResult::status);

  py::class_<MipSolver, std::shared_ptr<MipSolver>>(m, "MipSolver")
      .def("name", &MipSolver::name)
      .def("interrupt", &MipSolver::interrupt);
  m.def("make_ortools_solver", &make_ortools_solver);

  py::class_<Planner>(m, "Planner")
      .def(py::init<SolverPtr>(), py::arg("solver"))
      .def("plan", [](const Planner& p, const LocationGraph& g, const PlanOptions& opts){
        py::gil_scoped_release release;
        return p.plan(g, opts);
      }, py::arg("graph"), py::arg("options"))
      .def("cancel", &Planner::cancel);

  m.def("plan_routes", [](const LocationGraph& g, const PlanOptions& opts){
    py::gil_scoped_release release;
    return plan_routes(g, opts);
  }, py::arg("graph"), py::arg("options"));
}
