//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, JSON-RPC 2.0 envelopes and wire error codes
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace mcplease {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
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

    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }
};

//==========================================================================================================
// JSONParseError
// Purpose: Raised by ParseJSON when the text is not a single well-formed JSON document.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ParseJSON / SerializeJSON
// Purpose: Full-document JSON codec. ParseJSON rejects trailing garbage.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);
std::string SerializeJSON(const JSONValue& value);

/////////////////////////////////////////// Object helpers ///////////////////////////////////////////
// Returns the member value or nullptr when `obj` is not an object or the key is absent.
const JSONValue* FindMember(const JSONValue& obj, const std::string& key);
std::optional<std::string> GetStringMember(const JSONValue& obj, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& obj, const std::string& key);
// Inserts or replaces a member; `obj` must hold an Object.
void SetMember(JSONValue& obj, const std::string& key, JSONValue member);
JSONValue MakeStringArray(const std::vector<std::string>& items);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Renders an id for logs and correlation ("null" for null ids).
std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// DecodeStatus
// Purpose: Outcome of decoding a request body; maps to ParseError / InvalidRequest on the wire.
//==========================================================================================================
enum class DecodeStatus {
    Ok,
    ParseError,
    InvalidRequest
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
// Methods:
//   Serialize(): JSON string.
//   Deserialize(json): Returns true when the text decodes to a valid request.
//   Decode(json): Like Deserialize but distinguishes malformed JSON from malformed envelopes.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id{nullptr};
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
    DecodeStatus Decode(const std::string& json);
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Methods:
//   Serialize(): emits exactly one of result/error (an empty result object when neither is set).
//   IsError(): True when error is present.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id{nullptr};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus the server-specific codes clients match on.
// Notes:
//   Values are part of the wire contract and must not change.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Server specific error codes
    constexpr int ToolExecutionError = -32000;
    constexpr int AuthenticationRequired = -32001;
    constexpr int PermissionDenied = -32002;
    constexpr int NetworkAccessDenied = -32003;
    constexpr int RateLimitExceeded = -32004;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcplease
