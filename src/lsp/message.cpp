#include "coedit/lsp/message.hpp"
#include "coedit/error.hpp"

#include <cctype>
#include <unordered_map>

namespace coedit::lsp {

namespace {

const std::unordered_map<std::string_view, Method>& method_table() {
    static const std::unordered_map<std::string_view, Method> table = {
        {"initialize", Method::Initialize},
        {"textDocument/didOpen", Method::DidOpen},
        {"textDocument/didChange", Method::DidChange},
        {"textDocument/didClose", Method::DidClose},
        {"textDocument/hover", Method::Hover},
        {"textDocument/completion", Method::Completion},
        {"$/lean/plainGoal", Method::PlainGoal},
    };
    return table;
}

const boost::json::object* object_field(const boost::json::object& parent, boost::json::string_view key) {
    const auto it = parent.find(key);
    if (it == parent.end() || !it->value().is_object()) {
        return nullptr;
    }
    return &it->value().get_object();
}

const boost::json::string* string_field(const boost::json::object& parent, boost::json::string_view key) {
    const auto it = parent.find(key);
    if (it == parent.end() || !it->value().is_string()) {
        return nullptr;
    }
    return &it->value().get_string();
}

void require_file_uri(const boost::json::object& parent, boost::json::string_view key,
                      const std::string& field_path, const std::string& method) {
    const boost::json::string* uri = string_field(parent, key);
    if (!uri) {
        throw ValidationError("Missing " + field_path, method);
    }
    const std::string_view value(uri->data(), uri->size());
    if (!is_valid_file_uri(value)) {
        throw ValidationError("Invalid " + field_path + ": '" + std::string(value) + "'", method);
    }
}

} // namespace

Method classify_method(std::string_view name) {
    const auto& table = method_table();
    const auto it = table.find(name);
    return it == table.end() ? Method::Other : it->second;
}

const char* to_string(Method method) {
    switch (method) {
        case Method::None: return "<none>";
        case Method::Initialize: return "initialize";
        case Method::DidOpen: return "textDocument/didOpen";
        case Method::DidChange: return "textDocument/didChange";
        case Method::DidClose: return "textDocument/didClose";
        case Method::Hover: return "textDocument/hover";
        case Method::Completion: return "textDocument/completion";
        case Method::PlainGoal: return "$/lean/plainGoal";
        case Method::Other: return "<other>";
    }
    return "<unknown>";
}

bool is_valid_file_uri(std::string_view uri) {
    constexpr std::string_view prefix = "file://";
    if (uri.substr(0, prefix.size()) != prefix) {
        return false;
    }
    for (char c : uri) {
        if (std::iscntrl(static_cast<unsigned char>(c)) || c == ' ') {
            return false;
        }
    }

    // Authority runs up to the first '/', the path is everything after it.
    const std::string_view rest = uri.substr(prefix.size());
    const auto slash = rest.find('/');
    if (slash == std::string_view::npos) {
        return false;
    }
    const std::string_view path = rest.substr(slash);
    return path.size() > 1;
}

// =============================================================================
// ProtocolMessage
// =============================================================================

ProtocolMessage::ProtocolMessage(boost::json::object raw)
    : raw_(std::move(raw)), method_(Method::None) {
    if (const boost::json::string* name = string_field(raw_, "method")) {
        method_name_.assign(name->data(), name->size());
        method_ = classify_method(method_name_);
    }
}

ProtocolMessage ProtocolMessage::parse(std::string_view text) {
    boost::system::error_code ec;
    boost::json::value value = boost::json::parse(boost::json::string_view(text.data(), text.size()), ec);
    if (ec) {
        throw ValidationError("Message is not valid JSON: " + ec.message());
    }
    if (!value.is_object()) {
        throw ValidationError("Message is not a JSON object");
    }
    return ProtocolMessage(std::move(value.get_object()));
}

const boost::json::object* ProtocolMessage::params() const {
    return object_field(raw_, "params");
}

void ProtocolMessage::validate() const {
    const boost::json::object* p = params();
    if (!p) {
        return;
    }

    if (method_ == Method::Initialize) {
        require_file_uri(*p, "rootUri", "params.rootUri", method_name_);
    }

    // Document-addressing methods and everything else get the same check:
    // a present textDocument must carry a well-formed file URI.
    if (const boost::json::object* document = object_field(*p, "textDocument")) {
        require_file_uri(*document, "uri", "params.textDocument.uri", method_name_);
    }
}

std::optional<std::string> ProtocolMessage::document_text() const {
    const boost::json::object* p = params();
    if (!p) {
        return std::nullopt;
    }

    if (method_ == Method::DidOpen) {
        const boost::json::object* document = object_field(*p, "textDocument");
        if (!document) {
            return std::nullopt;
        }
        if (const boost::json::string* text = string_field(*document, "text")) {
            return std::string(text->data(), text->size());
        }
        return std::nullopt;
    }

    if (method_ == Method::DidChange) {
        const auto it = p->find("contentChanges");
        if (it == p->end() || !it->value().is_array()) {
            return std::nullopt;
        }
        const boost::json::array& changes = it->value().get_array();
        if (changes.empty() || !changes.back().is_object()) {
            return std::nullopt;
        }
        const boost::json::object& last = changes.back().get_object();
        if (last.contains("range")) {
            return std::nullopt;
        }
        if (const boost::json::string* text = string_field(last, "text")) {
            return std::string(text->data(), text->size());
        }
    }

    return std::nullopt;
}

} // namespace coedit::lsp
