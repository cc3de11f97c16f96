// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "cortex_grading/python_bridge.hpp"
#include "cortex_grading/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace cortex::grading::python_bridge {

namespace {

struct PyDecRef {
    void operator()(PyObject* object) const noexcept { Py_XDECREF(object); }
};

using PyRef = std::unique_ptr<PyObject, PyDecRef>;

PyRef steal(PyObject* object) noexcept { return PyRef{object}; }

PyRef borrow(PyObject* object) noexcept {
    Py_XINCREF(object);
    return PyRef{object};
}

// Deep enough for any sane result, shallow enough to stop self-referencing containers.
constexpr int kMaxNestingDepth = 256;

std::string to_utf8(PyObject* text) {
    Py_ssize_t size = 0;
    if (const char* data = PyUnicode_AsUTF8AndSize(text, &size)) {
        return std::string(data, static_cast<std::size_t>(size));
    }
    PyErr_Clear();
    // Lone surrogates cannot be encoded strictly.
    PyRef encoded = steal(PyUnicode_AsEncodedString(text, "utf-8", "backslashreplace"));
    if (!encoded) {
        PyErr_Clear();
        return "<unencodable string>";
    }
    return std::string(PyBytes_AS_STRING(encoded.get()),
                       static_cast<std::size_t>(PyBytes_GET_SIZE(encoded.get())));
}

std::string str_of(PyObject* object) {
    PyRef text = steal(PyObject_Str(object));
    if (!text) {
        PyErr_Clear();
        return "<unprintable " + std::string(Py_TYPE(object)->tp_name) + " object>";
    }
    return to_utf8(text.get());
}

struct PythonError {
    std::string kind;
    std::string message;
    std::string traceback;
    bool syntax_error{false};
};

std::string format_traceback(PyObject* type, PyObject* value, PyObject* traceback) {
    PyRef module = steal(PyImport_ImportModule("traceback"));
    if (!module) {
        PyErr_Clear();
        return {};
    }
    PyRef lines = steal(PyObject_CallMethod(module.get(), "format_exception", "OOO", type,
                                            value != nullptr ? value : Py_None,
                                            traceback != nullptr ? traceback : Py_None));
    if (!lines) {
        PyErr_Clear();
        return {};
    }
    PyRef separator = steal(PyUnicode_FromString(""));
    PyRef joined = steal(PyUnicode_Join(separator.get(), lines.get()));
    if (!joined) {
        PyErr_Clear();
        return {};
    }
    return to_utf8(joined.get());
}

// Takes ownership of the pending Python exception and clears it.
PythonError fetch_error() {
    PyObject* raw_type = nullptr;
    PyObject* raw_value = nullptr;
    PyObject* raw_traceback = nullptr;
    PyErr_Fetch(&raw_type, &raw_value, &raw_traceback);
    PyErr_NormalizeException(&raw_type, &raw_value, &raw_traceback);
    PyRef type = steal(raw_type);
    PyRef value = steal(raw_value);
    PyRef traceback = steal(raw_traceback);

    PythonError error;
    if (!type) {
        error.kind = "SystemError";
        error.message = "error return without exception set";
        return error;
    }
    if (value && traceback) {
        PyException_SetTraceback(value.get(), traceback.get());
    }

    error.syntax_error = PyErr_GivenExceptionMatches(type.get(), PyExc_SyntaxError) != 0;
    if (PyRef name = steal(PyObject_GetAttrString(type.get(), "__name__"));
        name && PyUnicode_Check(name.get())) {
        error.kind = to_utf8(name.get());
    } else {
        PyErr_Clear();
        error.kind = reinterpret_cast<PyTypeObject*>(type.get())->tp_name;
    }
    error.message = value ? str_of(value.get()) : std::string{};
    error.traceback = format_traceback(type.get(), value.get(), traceback.get());
    return error;
}

[[noreturn]] void raise_pending_as_fault() {
    auto error = fetch_error();
    throw CandidateFault(std::move(error.kind), error.message, std::move(error.traceback));
}

void flush_std_streams() {
    for (const char* name : {"stdout", "stderr"}) {
        PyObject* stream = PySys_GetObject(name);  // borrowed
        if (stream == nullptr || stream == Py_None) {
            continue;
        }
        PyRef result = steal(PyObject_CallMethod(stream, "flush", nullptr));
        if (!result) {
            PyErr_Clear();
        }
    }
}

PyRef to_python(const Value& value) {
    switch (value.type()) {
        case Value::value_t::null:
        case Value::value_t::discarded:
            return borrow(Py_None);
        case Value::value_t::boolean:
            return steal(PyBool_FromLong(value.get<bool>() ? 1 : 0));
        case Value::value_t::number_integer:
            return steal(PyLong_FromLongLong(value.get<std::int64_t>()));
        case Value::value_t::number_unsigned:
            return steal(PyLong_FromUnsignedLongLong(value.get<std::uint64_t>()));
        case Value::value_t::number_float:
            return steal(PyFloat_FromDouble(value.get<double>()));
        case Value::value_t::string: {
            const auto& text = value.get_ref<const std::string&>();
            return steal(PyUnicode_DecodeUTF8(text.data(), static_cast<Py_ssize_t>(text.size()),
                                              "surrogateescape"));
        }
        case Value::value_t::binary: {
            const auto& bytes = value.get_binary();
            return steal(PyBytes_FromStringAndSize(reinterpret_cast<const char*>(bytes.data()),
                                                   static_cast<Py_ssize_t>(bytes.size())));
        }
        case Value::value_t::array: {
            PyRef list = steal(PyList_New(static_cast<Py_ssize_t>(value.size())));
            if (!list) {
                return nullptr;
            }
            Py_ssize_t index = 0;
            for (const auto& element : value) {
                PyRef item = to_python(element);
                if (!item) {
                    return nullptr;
                }
                PyList_SET_ITEM(list.get(), index++, item.release());
            }
            return list;
        }
        case Value::value_t::object: {
            if (is_big_integer(value)) {
                const auto& digits = value.at(kBigIntegerKey).get_ref<const std::string&>();
                return steal(PyLong_FromString(digits.c_str(), nullptr, 10));
            }
            PyRef dict = steal(PyDict_New());
            if (!dict) {
                return nullptr;
            }
            for (const auto& [key, element] : value.items()) {
                PyRef py_key = steal(PyUnicode_DecodeUTF8(
                    key.data(), static_cast<Py_ssize_t>(key.size()), "surrogateescape"));
                PyRef item = to_python(element);
                if (!py_key || !item || PyDict_SetItem(dict.get(), py_key.get(), item.get()) != 0) {
                    return nullptr;
                }
            }
            return dict;
        }
    }
    return borrow(Py_None);
}

Value from_python(PyObject* object, int depth);

Value sequence_from_python(PyObject* object, int depth) {
    PyRef iterator = steal(PyObject_GetIter(object));
    if (!iterator) {
        raise_pending_as_fault();
    }
    Value array = Value::array();
    while (PyRef item = steal(PyIter_Next(iterator.get()))) {
        array.push_back(from_python(item.get(), depth + 1));
    }
    if (PyErr_Occurred() != nullptr) {
        raise_pending_as_fault();
    }
    return array;
}

Value integer_from_python(PyObject* object) {
    int overflow = 0;
    const long long as_signed = PyLong_AsLongLongAndOverflow(object, &overflow);
    if (overflow == 0) {
        if (as_signed == -1 && PyErr_Occurred() != nullptr) {
            raise_pending_as_fault();
        }
        return Value(static_cast<std::int64_t>(as_signed));
    }
    if (overflow > 0) {
        const unsigned long long as_unsigned = PyLong_AsUnsignedLongLong(object);
        if (PyErr_Occurred() == nullptr) {
            return Value(static_cast<std::uint64_t>(as_unsigned));
        }
        PyErr_Clear();
    }
    PyRef digits = steal(PyObject_Str(object));
    if (!digits) {
        raise_pending_as_fault();
    }
    return make_big_integer(to_utf8(digits.get()));
}

Value from_python(PyObject* object, int depth) {
    if (depth > kMaxNestingDepth) {
        throw CandidateFault("ValueError", "result is nested too deeply (circular reference?)");
    }

    if (object == Py_None) {
        return Value(nullptr);
    }
    if (PyBool_Check(object)) {
        return Value(object == Py_True);
    }
    if (PyLong_Check(object)) {
        return integer_from_python(object);
    }
    if (PyFloat_Check(object)) {
        return Value(PyFloat_AS_DOUBLE(object));
    }
    if (PyUnicode_Check(object)) {
        return Value(to_utf8(object));
    }
    if (PyList_Check(object) || PyTuple_Check(object)) {
        Value array = Value::array();
        PyRef fast = steal(PySequence_Fast(object, "expected a sequence"));
        if (!fast) {
            raise_pending_as_fault();
        }
        const Py_ssize_t size = PySequence_Fast_GET_SIZE(fast.get());
        for (Py_ssize_t index = 0; index < size; ++index) {
            array.push_back(from_python(PySequence_Fast_GET_ITEM(fast.get(), index), depth + 1));
        }
        return array;
    }
    if (PyDict_Check(object)) {
        Value mapping = Value::object();
        PyObject* key = nullptr;
        PyObject* item = nullptr;
        Py_ssize_t position = 0;
        while (PyDict_Next(object, &position, &key, &item)) {
            const auto name = PyUnicode_Check(key) ? to_utf8(key) : str_of(key);
            mapping[name] = from_python(item, depth + 1);
        }
        return mapping;
    }
    if (PyAnySet_Check(object)) {
        return sequence_from_python(object, depth);
    }
    if (PyBytes_Check(object)) {
        return Value(std::string(PyBytes_AS_STRING(object),
                                 static_cast<std::size_t>(PyBytes_GET_SIZE(object))));
    }

    // numpy arrays and scalars
    if (PyObject_HasAttrString(object, "tolist") != 0) {
        PyRef plain = steal(PyObject_CallMethod(object, "tolist", nullptr));
        if (plain && plain.get() != object) {
            return from_python(plain.get(), depth + 1);
        }
        PyErr_Clear();
    }

    return Value(str_of(object));
}

std::set<std::string> builtin_names() {
    std::set<std::string> names;
    PyObject* builtins = PyEval_GetBuiltins();  // borrowed
    if (builtins == nullptr) {
        PyErr_Clear();
        return names;
    }
    PyObject* key = nullptr;
    PyObject* value = nullptr;
    Py_ssize_t position = 0;
    while (PyDict_Next(builtins, &position, &key, &value)) {
        if (PyUnicode_Check(key)) {
            names.insert(to_utf8(key));
        }
    }
    return names;
}

/**
 * A callable found in the candidate's globals. invoke() runs in the executor worker and
 * passes the test input as keyword arguments.
 */
class PythonCallable final : public Invocable {
public:
    explicit PythonCallable(PyRef callable) : callable_{std::move(callable)} {}

    PythonCallable(const PythonCallable&) = delete;
    PythonCallable& operator=(const PythonCallable&) = delete;

    [[nodiscard]] Value invoke(const Value& arguments) const override {
        if (!arguments.is_object()) {
            throw CandidateFault("TypeError",
                                 std::string{"argument after ** must be a mapping, not "} +
                                     arguments.type_name());
        }

        PyRef kwargs = to_python(arguments);
        if (!kwargs) {
            raise_pending_as_fault();
        }
        PyRef no_args = steal(PyTuple_New(0));
        PyRef result = steal(PyObject_Call(callable_.get(), no_args.get(), kwargs.get()));
        if (!result) {
            raise_pending_as_fault();
        }
        return from_python(result.get(), 0);
    }

    void before_fork() const override { PyOS_BeforeFork(); }
    void after_fork_parent() const override { PyOS_AfterFork_Parent(); }
    void after_fork_child() const override { PyOS_AfterFork_Child(); }
    void flush_output() const override { flush_std_streams(); }

private:
    PyRef callable_;
};

}  // namespace

Session::Session(Config cfg) : cfg_(std::move(cfg)) {}

bool Session::init(std::string& diag_out) {
    if (ready_) return true;

    if (Py_IsInitialized() == 0) {
        PyConfig config;
        if (cfg_.isolated) {
            PyConfig_InitIsolatedConfig(&config);
        } else {
            PyConfig_InitPythonConfig(&config);
        }
        // Leave SIGINT & co. to the host process.
        config.install_signal_handlers = 0;

        PyStatus status = PyConfig_SetBytesString(&config, &config.program_name,
                                                  cfg_.program_name.c_str());
        if (!PyStatus_Exception(status)) {
            status = Py_InitializeFromConfig(&config);
        }
        PyConfig_Clear(&config);
        if (PyStatus_Exception(status)) {
            diag_out += "Python interpreter failed to start";
            if (status.func != nullptr) {
                diag_out += std::string{" in "} + status.func;
            }
            if (status.err_msg != nullptr) {
                diag_out += std::string{": "} + status.err_msg;
            }
            diag_out += "\n";
            return false;
        }
        spdlog::debug("embedded Python {} started", Py_GetVersion());
    }

    PyObject* sys_path = PySys_GetObject("path");  // borrowed
    if (sys_path == nullptr || !PyList_Check(sys_path)) {
        diag_out += "sys.path is not available\n";
        return false;
    }
    for (auto it = cfg_.module_paths.rbegin(); it != cfg_.module_paths.rend(); ++it) {
        const auto entry = fs::absolute(*it).string();
        PyRef text = steal(PyUnicode_DecodeFSDefault(entry.c_str()));
        if (!text || PyList_Insert(sys_path, 0, text.get()) != 0) {
            diag_out += "Failed to add " + entry + " to sys.path: " + fetch_error().message + "\n";
            return false;
        }
    }

    ready_ = true;
    return true;
}

SolutionLoader::SolutionLoader(const Session& session) : session_(session) {}

CandidateNamespace SolutionLoader::load(const std::filesystem::path& source) const {
    if (!session_.initialized()) {
        throw std::logic_error("Python session is not initialized");
    }
    if (!fs::exists(source)) {
        throw NotFoundError("Solution file not found: " + source.string());
    }
    if (!fs::is_regular_file(source)) {
        throw NotFoundError("Solution path is not a regular file: " + source.string());
    }

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        throw NotFoundError("Unable to open solution file: " + source.string());
    }
    std::ostringstream text;
    text << input.rdbuf();
    const std::string code_text = text.str();

    PyRef code = steal(Py_CompileStringExFlags(code_text.c_str(), source.string().c_str(),
                                               Py_file_input, nullptr, -1));
    if (!code) {
        auto error = fetch_error();
        if (error.syntax_error) {
            throw CandidateSyntaxError(error.message);
        }
        throw CandidateLoadError("Error loading solution: " + error.kind + ": " + error.message);
    }

    PyRef globals = steal(PyDict_New());
    if (!globals || PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins()) != 0) {
        throw std::runtime_error("Unable to create candidate namespace: " + fetch_error().message);
    }

    PyRef result = steal(PyEval_EvalCode(code.get(), globals.get(), globals.get()));
    flush_std_streams();
    if (!result) {
        auto error = fetch_error();
        spdlog::debug("candidate top-level code raised:\n{}", error.traceback);
        if (error.syntax_error) {
            throw CandidateSyntaxError(error.message);
        }
        throw CandidateLoadError("Error loading solution: " + error.kind + ": " + error.message);
    }

    const auto builtins = builtin_names();
    std::vector<Symbol> symbols;
    PyObject* key = nullptr;
    PyObject* value = nullptr;
    Py_ssize_t position = 0;
    while (PyDict_Next(globals.get(), &position, &key, &value)) {
        if (!PyUnicode_Check(key)) {
            continue;
        }
        Symbol symbol;
        symbol.name = to_utf8(key);
        symbol.callable = PyCallable_Check(value) != 0;
        symbol.builtin = builtins.count(symbol.name) != 0;
        if (symbol.callable) {
            symbol.handle = std::make_shared<PythonCallable>(borrow(value));
        }
        symbols.push_back(std::move(symbol));
    }
    spdlog::debug("candidate {} defines {} top-level symbol(s)", source.string(), symbols.size());

    std::shared_ptr<const void> keep_alive{globals.release(), PyDecRef{}};
    return CandidateNamespace{std::move(symbols), std::move(keep_alive)};
}

}  // namespace cortex::grading::python_bridge
