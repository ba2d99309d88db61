#include "chunkwise.hpp"

#include "semantic_chunker.hpp"

#include <any>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace {

std::any py_to_any(const py::handle& value) {
    if (py::isinstance<py::bool_>(value)) return value.cast<bool>();
    if (py::isinstance<py::int_>(value)) return value.cast<int>();
    if (py::isinstance<py::str>(value)) return value.cast<std::string>();
    throw std::invalid_argument("Unsupported default parameter type.");
}

py::object any_to_py(const std::any& value) {
    if (value.type() == typeid(bool)) return py::bool_(std::any_cast<bool>(value));
    if (value.type() == typeid(int)) return py::int_(std::any_cast<int>(value));
    if (value.type() == typeid(std::string)) return py::str(std::any_cast<std::string>(value));
    return py::none();
}

// Wraps a Python tokenizer object exposing encode(text) and decode(ids).
// HuggingFace tokenizers are asked not to add or emit special tokens, so counts match the chunk text.
class PyTokenizer final : public chunkwise::Tokenizer {
public:
    explicit PyTokenizer(py::object obj, bool huggingface = false)
        : _obj(std::move(obj)), _huggingface(huggingface) {
        for (const char* name : {"encode", "decode"}) {
            if (!py::hasattr(_obj, name))
                throw std::invalid_argument(std::string("Tokenizer missing method: ") + name);
        }
    }

    ~PyTokenizer() override {
        py::gil_scoped_acquire gil;
        _obj = py::object();
    }

    std::vector<int> encode(const std::string_view& text) const override {
        py::gil_scoped_acquire gil;
        return encode_locked(text).cast<std::vector<int>>();
    }

    std::string decode(const std::vector<int>& token_ids) const override {
        py::gil_scoped_acquire gil;
        py::object method = _obj.attr("decode");
        py::object text = _huggingface ? method(token_ids, py::arg("skip_special_tokens") = true)
                                       : method(token_ids);
        return text.cast<std::string>();
    }

    // Counts on the Python side without copying the ids into a std::vector.
    size_t count_tokens(std::string_view text) const override {
        if (text.empty()) return 0;
        py::gil_scoped_acquire gil;
        return py::len(encode_locked(text));
    }

private:
    py::object encode_locked(std::string_view text) const {
        py::str arg(text.data(), text.size());
        py::object method = _obj.attr("encode");
        return _huggingface ? method(arg, py::arg("add_special_tokens") = false) : method(arg);
    }

    py::object _obj;
    bool _huggingface;
};

// Any Python callable str -> int.
class PyTokenOracle final : public chunkwise::TokenOracle {
public:
    explicit PyTokenOracle(py::object counter) : _counter(std::move(counter)) {
        if (!PyCallable_Check(_counter.ptr())) throw std::invalid_argument("token_counter must be callable.");
    }

    ~PyTokenOracle() override {
        py::gil_scoped_acquire gil;
        _counter = py::object();
    }

    int count(std::string_view text) const override {
        py::gil_scoped_acquire gil;
        return _counter(py::str(text.data(), text.size())).cast<int>();
    }

private:
    py::object _counter;
};

} // namespace

void exportSemanticChunker(py::module& m) {
    m.def("chunk",
        [](const std::string& text, int max_tokens, py::object token_counter) {
            PyTokenOracle oracle(std::move(token_counter));
            py::gil_scoped_release release;
            return chunkwise::chunk(text, max_tokens, oracle);
        },
        py::arg("text"), py::arg("max_tokens"), py::arg("token_counter"));

    py::class_<chunkwise::SemanticChunker>(m, "SemanticChunker")
        .def(py::init([](
                 std::optional<int> max_tokens,
                 std::optional<int> num_workers,
                 std::optional<std::string> encoding_name) {
                return std::make_unique<chunkwise::SemanticChunker>(max_tokens, num_workers, encoding_name);
            }),
            py::arg("max_tokens") = py::none(),
            py::arg("num_workers") = py::none(),
            py::arg("encoding_name") = py::none()
        )
        .def_property_readonly("max_tokens", &chunkwise::SemanticChunker::max_tokens)
        .def_property_readonly("num_workers", &chunkwise::SemanticChunker::num_workers)
        .def("split_text", &chunkwise::SemanticChunker::split_text,
            py::arg("text"), py::arg("reserved_tokens") = 0,
            py::call_guard<py::gil_scoped_release>()
        )
        .def("chunk", &chunkwise::SemanticChunker::chunk,
            py::arg("text"),
            py::call_guard<py::gil_scoped_release>()
        )
        .def("chunk_batch", &chunkwise::SemanticChunker::chunk_batch,
            py::arg("texts"), py::arg("reserved_tokens") = 0,
            py::call_guard<py::gil_scoped_release>()
        )
        .def("reserved_tokens", &chunkwise::SemanticChunker::reserved_tokens,
            py::arg("prefix"),
            py::call_guard<py::gil_scoped_release>()
        )
        .def("from_tiktoken_encoding",
            &chunkwise::SemanticChunker::from_tiktoken_encoding,
            py::arg("encoding_name") = "gpt2",
            py::return_value_policy::reference
        )
        .def("from_sentencepiece_model",
            &chunkwise::SemanticChunker::from_sentencepiece_model,
            py::arg("model_path"),
            py::return_value_policy::reference
        )
        .def("from_tokenizer",
            [](chunkwise::SemanticChunker& self, py::object tokenizer) -> chunkwise::SemanticChunker& {
                return self.set_tokenizer(std::make_shared<PyTokenizer>(std::move(tokenizer)));
            },
            py::arg("tokenizer"),
            py::return_value_policy::reference
        )
        .def("from_huggingface_tokenizer",
            [](chunkwise::SemanticChunker& self, py::object tokenizer) -> chunkwise::SemanticChunker& {
                return self.set_tokenizer(std::make_shared<PyTokenizer>(std::move(tokenizer), true));
            },
            py::arg("tokenizer"),
            py::return_value_policy::reference
        )
        .def("from_token_counter",
            [](chunkwise::SemanticChunker& self, py::object token_counter) -> chunkwise::SemanticChunker& {
                return self.set_oracle(std::make_shared<PyTokenOracle>(std::move(token_counter)));
            },
            py::arg("token_counter"),
            py::return_value_policy::reference
        )
        .def_static("set_default",
            [](py::kwargs kwargs) {
                chunkwise::MapParams::MapType updates;
                for (auto item : kwargs) {
                    const auto key = py::cast<std::string>(item.first);
                    updates[key] = py_to_any(item.second);
                }
                chunkwise::SemanticChunker::_default_params.set_default(updates);
            }
        )
        .def_static("get_default",
            [](py::object param_name) -> py::object {
                const auto defaults = chunkwise::SemanticChunker::_default_params.get_default();
                if (param_name.is_none()) {
                    py::dict out;
                    for (const auto& [key, value] : defaults) {
                        out[py::str(key)] = any_to_py(value);
                    }
                    return py::object(std::move(out));
                }

                auto it = defaults.find(param_name.cast<std::string>());
                if (it == defaults.end()) return py::none();
                return any_to_py(it->second);
            },
            py::arg("param_name") = py::none()
        )
        .def_static("reset_default", []() { chunkwise::SemanticChunker::_default_params.reset_default(); });
}
