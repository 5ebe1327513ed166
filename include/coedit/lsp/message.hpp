#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <boost/json.hpp>

namespace coedit::lsp {

// Methods the bridge treats specially. Everything else is Other; a message
// without a method (a response) is None.
enum class Method {
    None,
    Initialize,
    DidOpen,
    DidChange,
    DidClose,
    Hover,
    Completion,
    PlainGoal,
    Other
};

Method classify_method(std::string_view name);
const char* to_string(Method method);

// "file://" + optional authority + non-empty absolute path.
// The scheme must be exactly "file" (case-sensitive).
bool is_valid_file_uri(std::string_view uri);

/**
 * One client message: the untouched JSON object plus its classified method.
 * The raw object is what gets forwarded, so validation never rewrites it.
 */
class ProtocolMessage {
public:
    explicit ProtocolMessage(boost::json::object raw);

    // Parse one WebSocket text frame. Throws ValidationError when the text is
    // not a JSON object.
    static ProtocolMessage parse(std::string_view text);

    Method method() const { return method_; }
    const std::string& method_name() const { return method_name_; }
    const boost::json::object& raw() const { return raw_; }

    // params when present and an object, nullptr otherwise.
    const boost::json::object* params() const;

    // Throws ValidationError when a required URI is missing or malformed.
    void validate() const;

    // Full document text carried by didOpen/didChange, if any.
    // For didChange only the last content change counts, and only when it
    // is a full-text entry (a string "text" and no "range").
    std::optional<std::string> document_text() const;

private:
    boost::json::object raw_;
    Method method_;
    std::string method_name_;
};

} // namespace coedit::lsp
