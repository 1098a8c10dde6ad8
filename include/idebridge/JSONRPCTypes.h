//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 envelope types shared by both transports
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>
#include <utility>
#include <initializer_list>

namespace idebridge {

//==========================================================================================================
// JSONValue
// Purpose: Parsed JSON document node. Containers hold shared_ptr children so subtrees can be shared
//          between an envelope, its params and the reply built from them without deep copies.
// Notes:
//   - Integers that fit int64_t are kept as int64_t; everything else numeric is a double.
//   - Constructors are explicit so a literal never silently becomes the wrong alternative.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;
    using Storage = std::variant<std::nullptr_t, bool, int64_t, double, std::string, Array, Object>;

    Storage value;

    // Out-of-line: Storage holds JSONValue through shared_ptr, so the type is incomplete here.
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document.
// Args:
//   text: JSON text. Trailing non-whitespace is rejected.
// Returns:
//   The parsed JSONValue.
// Throws:
//   std::runtime_error on malformed input.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON serialization (object key order is unspecified).
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// Object helpers
// Purpose: Small conveniences for building and inspecting JSON objects.
// Notes:
//   FindMember returns nullptr when value is not an object or the key is absent.
//   Typed getters return std::nullopt when the member is absent or of a different type.
//==========================================================================================================
JSONValue MakeObject(std::initializer_list<std::pair<const std::string, JSONValue>> members);
JSONValue MakeArray(const std::vector<JSONValue>& items);
const JSONValue* FindMember(const JSONValue& value, const std::string& key);
std::optional<std::string> GetStringMember(const JSONValue& value, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& value, const std::string& key);
std::optional<bool> GetBoolMember(const JSONValue& value, const std::string& key);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Renders an id for log output ("42", "\"abc\"", "null").
std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Base of the outbound JSON-RPC 2.0 messages. Inbound traffic is classified by DecodeEnvelope.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;

    // Compact wire form; members absent from the message are omitted.
    virtual std::string Serialize() const = 0;
};

// Outbound request; used by client-side helpers and tests that talk to a running server.
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: Reply to a request. Build with Success() or Failure(); exactly one of result/error is set.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id{nullptr};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    static JSONRPCResponse Success(JSONRPCId id, JSONValue result) {
        JSONRPCResponse r;
        r.id = std::move(id);
        r.result = std::move(result);
        return r;
    }

    static JSONRPCResponse Failure(JSONRPCId id, JSONValue error) {
        JSONRPCResponse r;
        r.id = std::move(id);
        r.error = std::move(error);
        return r;
    }

    std::string Serialize() const override;
};

// Server push with no id; never answered.
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
};

//==========================================================================================================
// EnvelopeKind / Envelope
// Purpose: Classification of one decoded JSON object received from a client.
// Rules:
//   Request:      "method" is a string and a top-level "id" (string | integer | null) is present.
//   Notification: "method" is a string and there is no "id".
//   Response:     "result" or "error" is present (no "method").
//   Invalid:      anything else. When an echoable id was present it is kept so the transport can
//                 answer with Invalid Request.
//==========================================================================================================
enum class EnvelopeKind {
    Request,
    Notification,
    Response,
    Invalid
};

struct Envelope {
    EnvelopeKind kind{EnvelopeKind::Invalid};
    std::optional<JSONRPCId> id;
    std::string method;
    std::optional<JSONValue> params;

    bool IsRequest() const { return kind == EnvelopeKind::Request; }
    bool IsNotification() const { return kind == EnvelopeKind::Notification; }
};

//==========================================================================================================
// DecodeEnvelope
// Purpose: Classifies a parsed JSON value.
// Returns:
//   std::nullopt when value is not a JSON object; otherwise an Envelope (possibly Invalid).
//==========================================================================================================
std::optional<Envelope> DecodeEnvelope(const JSONValue& value);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

// { code, message, data? }
JSONValue CreateErrorObject(int code, const std::string& message, const std::optional<JSONValue>& data = std::nullopt);

// Error response for id; used where no Reply exists (parse failures before an id is known).
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                     const std::optional<JSONValue>& data = std::nullopt);

} // namespace idebridge
