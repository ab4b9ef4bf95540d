#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Redis serialization protocol (RESP2).
namespace resp {

struct Value {
    enum class Type { SimpleString, Error, Integer, BulkString, Array, Null };

    Type type = Type::Null;
    std::string str;          // SimpleString, Error, BulkString
    int64_t integer = 0;
    std::vector<Value> elements;

    bool is_null() const { return type == Type::Null; }
};

// Command as an array of bulk strings, e.g. {"PUBLISH", "events", "{...}"}.
std::string encode_command(const std::vector<std::string>& args);

// Incremental decoder: feed() raw bytes, then call next() until it yields
// an empty optional (incomplete input).
class Parser {
public:
    void feed(std::string_view data) { buf_.append(data); }

    std::expected<std::optional<Value>, std::string> next();

    size_t buffered() const { return buf_.size(); }

private:
    // Parses one value at `pos`; advances pos only on success.
    std::expected<std::optional<Value>, std::string> parse(size_t& pos, int depth);
    std::optional<std::string_view> line_at(size_t pos) const;
    std::nullopt_t incomplete(size_t need);

    std::string buf_;
    // Buffer size below which the pending value cannot be complete.
    size_t need_ = 0;
};

} // namespace resp
