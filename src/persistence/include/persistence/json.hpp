#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace nle::persistence::json {

/**
 * @brief Minimal JSON document value used by the project serializer
 *
 * Object members keep insertion order so written files stay stable and diffable.
 */
class Value {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };
    struct Member;

    Value() = default;
    static Value null();
    static Value boolean(bool b);
    static Value number(double d);
    static Value string(std::string s);
    static Value array();
    static Value object();

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    bool as_bool() const { return bool_; }
    double as_number() const { return number_; }
    const std::string& as_string() const { return string_; }
    const std::vector<Value>& items() const { return items_; }
    const std::vector<Member>& members() const { return members_; }

    // Object lookup; nullptr when absent or not an object
    const Value* find(const std::string& key) const;

    // Object: replaces an existing key or appends
    Value& set(const std::string& key, Value v);
    // Array append
    Value& push(Value v);

private:
    Type type_ = Type::Null;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    std::vector<Value> items_;
    std::vector<Member> members_;
};

struct Value::Member {
    std::string key;
    Value value;
};

struct ParseError {
    std::string message;
    size_t offset = 0;
};

// False on malformed input; err describes the first problem
bool parse(const std::string& text, Value& out, ParseError& err) noexcept;

// Pretty-printed with the given indent; indent 0 writes a single line
std::string write(const Value& value, int indent = 2);

} // namespace nle::persistence::json
