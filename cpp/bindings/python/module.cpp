#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "dickson/dickson.hpp"
#include "dickson/driver.hpp"
#include "dickson/exact.hpp"
#include "dickson/hash.hpp"
#include "dickson/recurrence.hpp"
#include "dickson/table.hpp"

namespace py = pybind11;

static dickson::Variant variant_from(const std::string& name) {
  if (name == "reversed") return dickson::Variant::Reversed;
  if (name == "classical") return dickson::Variant::Classical;
  throw std::invalid_argument("variant must be 'reversed' or 'classical'");
}

static py::dict record_to_dict(const dickson::ClassificationRecord& r) {
  py::dict out;
  out["p"] = r.p;
  out["n"] = py::int_(r.n);
  out["a"] = r.a;
  out["value_count"] = r.cardinality;
  out["is_permutation"] = r.is_permutation;
  out["value_set"] = r.values;
  return out;
}

static py::list records_to_list(const std::vector<dickson::ClassificationRecord>& rs) {
  py::list out;
  for (const auto& r : rs) out.append(record_to_dict(r));
  return out;
}

static py::dict classify_py(std::uint32_t p, std::uint32_t a, std::int64_t n,
                            const std::string& variant) {
  dickson::ClassificationRecord r;
  {
    py::gil_scoped_release nogil;
    r = dickson::classify(p, a, n, variant_from(variant));
  }
  return record_to_dict(r);
}

static py::dict run_py(std::vector<std::uint32_t> primes,
                       std::optional<std::uint32_t> a,
                       const std::string& variant,
                       std::optional<std::string> csv_path,
                       std::optional<py::function> callback) {
  dickson::SweepConfig cfg;
  cfg.primes = std::move(primes);
  cfg.all_parameters = !a.has_value();
  cfg.a = a.value_or(1);
  cfg.variant = variant_from(variant);
  cfg.enable_progress = callback.has_value();

  // Prepare C++ progress callback that reacquires the GIL when invoked.
  dickson::ProgressCb cb_cpp;
  if (callback.has_value()) {
    py::function fn = *callback;
    cb_cpp = [fn = std::move(fn)](std::uint32_t p, std::uint32_t aa,
                                  std::uint64_t n,
                                  const dickson::ClassificationRecord&) {
      py::gil_scoped_acquire gil;
      fn(p, aa, n);
    };
  }

  // Release the GIL for the heavy computation.
  dickson::RunResult res;
  {
    py::gil_scoped_release nogil;
    res = dickson::run(cfg, cb_cpp);
    if (csv_path.has_value()) dickson::write_csv(res.table, *csv_path);
  }

  py::dict out;
  out["primes"] = res.primes;
  out["records"] = records_to_list(res.table.records());
  out["digest"] = dickson::to_hex(dickson::make_table_digest(res.table.records()));
  out["ns_elapsed"] = py::int_(res.ns_elapsed);
  out["engine_info"] = res.engine_info;
  return out;
}

static py::int_ evaluate_exact_py(std::int64_t n, std::int64_t a, std::int64_t x,
                                  const std::string& variant) {
  const std::string digits = dickson::evaluate_exact(n, a, x, variant_from(variant));
  return py::int_(py::reinterpret_steal<py::object>(
      PyLong_FromString(digits.c_str(), nullptr, 10)));
}

PYBIND11_MODULE(dicksoncore, m) {
  m.doc() = "Dickson polynomial value-set classification core (pybind11)";
  m.attr("__version__") = dickson::DICKSON_VERSION;

  m.def("evaluate",
        [](std::int64_t n, std::uint32_t a, std::uint32_t x, std::uint32_t p,
           const std::string& variant) {
          return dickson::evaluate(n, a, x, p, variant_from(variant));
        },
        py::arg("n"), py::arg("a"), py::arg("x"), py::arg("p"),
        py::arg("variant") = "reversed",
        R"pbdoc(D_n(a, x) mod p. Raises ValueError if n < 0 or p < 2.)pbdoc");

  m.def("evaluate_exact", &evaluate_exact_py,
        py::arg("n"), py::arg("a"), py::arg("x"),
        py::arg("variant") = "reversed",
        R"pbdoc(D_n(a, x) over the integers (no modulus).)pbdoc");

  m.def("classify", &classify_py,
        py::arg("p"), py::arg("a"), py::arg("n"),
        py::arg("variant") = "reversed",
        R"pbdoc(
Value set of x -> D_n(a, x) over F_p.

Returns:
  dict { p, n, a, value_count, is_permutation, value_set }.
)pbdoc");

  m.def("run", &run_py,
        py::arg("primes"),
        py::arg("a") = py::none(),               // None => every a in [0, p)
        py::arg("variant") = "reversed",
        py::arg("csv_path") = py::none(),
        py::arg("callback") = py::none(),
      R"pbdoc(
Sweep n over [0, p^2 - 1) for each prime.

Args:
  primes (list[int]): primes to sweep.
  a (int | None): fixed parameter, or None for every a in [0, p).
  variant (str): 'reversed' or 'classical'.
  csv_path (str | None): also write the table as CSV.
  callback (callable): optional function (p:int, a:int, n:int) -> None.

Returns:
  dict { primes, records, digest, ns_elapsed, engine_info }.
)pbdoc");
}
