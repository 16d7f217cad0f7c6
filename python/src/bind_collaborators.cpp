#include "bind_forward.hpp"
#include <quotaguard/quotaguard.hpp>
#include <pybind11/stl.h>

using namespace quotaguard;

// ---------------------------------------------------------------------------
// Trampolines: the controller calls these from whatever thread runs
// handle(), with the GIL released, so each override reacquires it.
// ---------------------------------------------------------------------------

class PyTokenizer : public Tokenizer {
public:
    using Tokenizer::Tokenizer;

    TokenCount count_tokens(const std::string& text, const std::string& model) const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(TokenCount, Tokenizer, count_tokens, text, model);
    }

    std::string name() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, Tokenizer, name);
    }
};

class PyUpstreamClient : public UpstreamClient {
public:
    using UpstreamClient::UpstreamClient;

    ChatResponse complete(const ChatRequest& request, const std::string& api_key) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(ChatResponse, UpstreamClient, complete, request, api_key);
    }
};

class PyRequestDecoder : public RequestDecoder {
public:
    using RequestDecoder::RequestDecoder;

    ChatRequest decode(const std::string& body) const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(ChatRequest, RequestDecoder, decode, body);
    }
};

void bind_collaborators(py::module_& m) {
    // --- Tokenizer ---
    py::class_<Tokenizer, PyTokenizer, std::shared_ptr<Tokenizer>>(m, "Tokenizer")
        .def(py::init<>())
        .def("count_tokens", &Tokenizer::count_tokens, py::arg("text"), py::arg("model"))
        .def("name", &Tokenizer::name);

    py::class_<ApproximateTokenizer, Tokenizer, std::shared_ptr<ApproximateTokenizer>>(
            m, "ApproximateTokenizer")
        .def(py::init<std::size_t>(), py::arg("chars_per_token") = 4)
        .def("chars_per_token", &ApproximateTokenizer::chars_per_token);

    m.def("count_message_tokens", &count_message_tokens,
          py::arg("tokenizer"), py::arg("messages"), py::arg("model"),
          py::arg("tokens_per_message") = 3, py::arg("reply_priming_tokens") = 3);
    m.def("count_completion_tokens", &count_completion_tokens,
          py::arg("tokenizer"), py::arg("choices"), py::arg("model"));

    // --- UpstreamClient ---
    py::class_<UpstreamClient, PyUpstreamClient, std::shared_ptr<UpstreamClient>>(
            m, "UpstreamClient")
        .def(py::init<>())
        .def("complete", &UpstreamClient::complete, py::arg("request"), py::arg("api_key"));

    // --- RequestDecoder ---
    py::class_<RequestDecoder, PyRequestDecoder, std::shared_ptr<RequestDecoder>>(
            m, "RequestDecoder")
        .def(py::init<>())
        .def("decode", &RequestDecoder::decode, py::arg("body"));
}
