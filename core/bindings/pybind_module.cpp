// PyBind11 bindings for the workmem C++ core.
// Exposes the weighted maps, FlagStore and SlotStore to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DWORKMEM_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <pybind11/operators.h>

#include "numdict/errors.hpp"
#include "numdict/keys.hpp"
#include "numdict/weighted_map.hpp"
#include "wm/flag_store.hpp"
#include "wm/slot_store.hpp"
#include "util/logger.hpp"

namespace py = pybind11;
using namespace workmem;

namespace {

// ── Untyped key conversion ──
// Python callers may pass plain dicts. Keys of the wrong kind are a
// DomainError rather than a silent coercion.

Feature toFeature(const py::handle& key) {
    if (py::isinstance<Feature>(key)) {
        return key.cast<Feature>();
    }
    if (py::isinstance<py::str>(key)) {
        return Feature(key.cast<std::string>());
    }
    if (py::isinstance<py::tuple>(key)) {
        auto t = key.cast<py::tuple>();
        if (t.size() == 2 && py::isinstance<py::str>(t[0])) {
            std::string dim = t[0].cast<std::string>();
            if (t[1].is_none()) return Feature(dim);
            if (py::isinstance<py::bool_>(t[1])) {
                throw DomainError("Feature value must be int, str or None");
            }
            if (py::isinstance<py::int_>(t[1])) return Feature(dim, t[1].cast<int>());
            if (py::isinstance<py::str>(t[1])) return Feature(dim, t[1].cast<std::string>());
        }
    }
    throw DomainError("Expected a feature key, got " +
                      py::str(py::type::handle_of(key)).cast<std::string>());
}

Chunk toChunk(const py::handle& key) {
    if (py::isinstance<Chunk>(key)) {
        return key.cast<Chunk>();
    }
    if (py::isinstance<py::str>(key)) {
        return Chunk(key.cast<std::string>());
    }
    throw DomainError("Expected a chunk key, got " +
                      py::str(py::type::handle_of(key)).cast<std::string>());
}

SlotKey toSlotKey(const py::handle& key) {
    if (py::isinstance<py::tuple>(key)) {
        auto t = key.cast<py::tuple>();
        if (t.size() == 2 && py::isinstance<py::int_>(t[0]) && !py::isinstance<py::bool_>(t[0])) {
            return SlotKey(t[0].cast<int>(), toChunk(t[1]));
        }
    }
    throw DomainError("Expected a (slot, chunk) key, got " +
                      py::str(py::type::handle_of(key)).cast<std::string>());
}

template <typename K, typename Convert>
WeightedMap<K> fromDict(const py::dict& d, double c, Convert convert) {
    typename WeightedMap<K>::Entries entries;
    for (auto item : d) {
        entries[convert(item.first)] += py::cast<double>(item.second);
    }
    return WeightedMap<K>(std::move(entries), c);
}

template <typename K, typename Convert>
void bindWeightedMap(py::module_& m, const char* name, Convert convert) {
    using Map = WeightedMap<K>;

    py::class_<Map>(m, name)
        .def(py::init<>())
        .def(py::init<double>(), py::arg("c"))
        .def(py::init([convert](const py::dict& d, double c) { return fromDict<K>(d, c, convert); }),
             py::arg("entries"), py::arg("c") = 0.0)
        .def_property_readonly("c", &Map::c)
        .def("get", [convert](const Map& self, const py::handle& key) { return self.get(convert(key)); })
        .def("__getitem__", [convert](const Map& self, const py::handle& key) { return self.get(convert(key)); })
        .def("__contains__", [convert](const Map& self, const py::handle& key) { return self.contains(convert(key)); })
        .def("__len__", &Map::size)
        .def("items", [](const Map& self) {
            std::vector<std::pair<K, double>> out(self.begin(), self.end());
            return out;
        })
        .def("keep", [](const Map& self, const std::function<bool(const K&)>& pred) { return self.keep(pred); })
        .def("mask", &Map::mask)
        .def("squeeze", &Map::squeeze)
        .def("mul", py::overload_cast<const Map&>(&Map::mul, py::const_))
        .def("scale", py::overload_cast<double>(&Map::mul, py::const_))
        .def("add", &Map::add)
        .def("merge", &Map::merge)
        .def("sub", &Map::sub)
        .def("rsub", &Map::rsub)
        .def("abs", &Map::abs)
        .def("greater", &Map::greater)
        .def("with_default", &Map::withDefault)
        .def("with_keys", [convert](const Map& self, const py::iterable& ks) {
            std::vector<K> keys;
            for (auto k : ks) keys.push_back(convert(k));
            return self.withKeys(keys);
        })
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def(py::self + py::self)
        .def(py::self * py::self);
}

} // namespace

PYBIND11_MODULE(workmem_bindings, m) {
    m.doc() = "workmem C++ Core Bindings";

    // ── Errors ──
    auto base = py::register_exception<Error>(m, "Error", PyExc_RuntimeError);
    py::register_exception<ConfigurationError>(m, "ConfigurationError", base.ptr());
    py::register_exception<CommandError>(m, "CommandError", base.ptr());
    py::register_exception<KeyMappingError>(m, "KeyMappingError", base.ptr());
    py::register_exception<DomainError>(m, "DomainError", base.ptr());

    // ── Keys ──
    py::class_<Feature>(m, "Feature")
        .def(py::init<>())
        .def(py::init<std::string>(), py::arg("dim"))
        .def(py::init<std::string, std::optional<FeatureValue>>(), py::arg("dim"), py::arg("value"))
        .def_readwrite("dim", &Feature::dim)
        .def_readwrite("value", &Feature::value)
        .def("is_wildcard", &Feature::isWildcard)
        .def(py::self == py::self)
        .def(py::self < py::self)
        .def("__hash__", [](const Feature& f) { return py::hash(py::str(toString(f))); })
        .def("__repr__", [](const Feature& f) { return "Feature(" + toString(f) + ")"; });

    py::class_<Chunk>(m, "Chunk")
        .def(py::init<std::string>(), py::arg("id"))
        .def_readwrite("id", &Chunk::id)
        .def(py::self == py::self)
        .def(py::self < py::self)
        .def("__hash__", [](const Chunk& c) { return py::hash(py::str(c.id)); })
        .def("__repr__", [](const Chunk& c) { return "Chunk(" + c.id + ")"; });

    // ── Weighted maps ──
    bindWeightedMap<Feature>(m, "FeatureMap", [](const py::handle& k) { return toFeature(k); });
    bindWeightedMap<Chunk>(m, "ChunkMap", [](const py::handle& k) { return toChunk(k); });
    bindWeightedMap<SlotKey>(m, "SlotMap", [](const py::handle& k) { return toSlotKey(k); });

    // ── FlagStore ──
    py::class_<FlagStore>(m, "FlagStore")
        .def(py::init<std::vector<std::string>, std::vector<int>, std::string>(),
             py::arg("flags"), py::arg("values") = std::vector<int>{-1, 0, 1},
             py::arg("prefix") = "")
        .def("step", &FlagStore::step, py::arg("commands"))
        .def("update", &FlagStore::update, py::arg("commands"))
        .def("get", &FlagStore::get, py::arg("flag"))
        .def("reset", &FlagStore::reset)
        .def_property_readonly("state", &FlagStore::state)
        .def_property_readonly("initial", &FlagStore::initial)
        .def_property_readonly("flags", &FlagStore::flags)
        .def_property_readonly("cmds", &FlagStore::cmds)
        .def_property_readonly("nops", &FlagStore::nops)
        .def_property_readonly("prefix", &FlagStore::prefix);

    // ── SlotStore ──
    py::class_<SlotOutput>(m, "SlotOutput")
        .def(py::init<>())
        .def_readwrite("chunks", &SlotOutput::chunks)
        .def_readwrite("flags", &SlotOutput::flags);

    py::class_<SlotStore>(m, "SlotStore")
        .def(py::init<int, std::string>(), py::arg("slots"), py::arg("prefix") = "")
        .def("step", &SlotStore::step,
             py::arg("commands"), py::arg("selected"), py::arg("match"))
        .def("update", &SlotStore::update, py::arg("commands"), py::arg("selected"))
        .def("select", &SlotStore::select, py::arg("commands"))
        .def("status", &SlotStore::status, py::arg("match"))
        .def("chunk_at", &SlotStore::chunkAt, py::arg("slot"))
        .def("is_full", &SlotStore::isFull, py::arg("slot"))
        .def("reset", &SlotStore::reset)
        .def_property_readonly("contents", &SlotStore::contents)
        .def_property_readonly("initial", &SlotStore::initial)
        .def_property_readonly("slots", &SlotStore::slots)
        .def_property_readonly("flags", &SlotStore::flags)
        .def_property_readonly("cmds", &SlotStore::cmds)
        .def_property_readonly("nops", &SlotStore::nops)
        .def_property_readonly("prefix", &SlotStore::prefix);

    // ── Logging ──
    py::enum_<Logger::Level>(m, "LogLevel")
        .value("DEBUG", Logger::Level::Debug)
        .value("INFO", Logger::Level::Info)
        .value("WARNING", Logger::Level::Warning)
        .value("ERROR", Logger::Level::Error)
        .value("OFF", Logger::Level::Off);

    m.def("set_log_level", &Logger::setLevel, py::arg("level"));
}
