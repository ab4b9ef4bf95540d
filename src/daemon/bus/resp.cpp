#include "bus/resp.hpp"

#include <charconv>
#include <format>

namespace resp {

namespace {

// Longest bulk string accepted from the server.
constexpr int64_t MAX_BULK = 64 * 1024 * 1024;
constexpr int MAX_DEPTH = 16;

std::optional<int64_t> to_int(std::string_view s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

} // namespace

std::string encode_command(const std::vector<std::string>& args) {
    std::string out = std::format("*{}\r\n", args.size());
    for (auto& a : args) {
        out += std::format("${}\r\n", a.size());
        out += a;
        out += "\r\n";
    }
    return out;
}

std::optional<std::string_view> Parser::line_at(size_t pos) const {
    auto end = buf_.find("\r\n", pos);
    if (end == std::string::npos) return std::nullopt;
    return std::string_view(buf_).substr(pos, end - pos);
}

std::nullopt_t Parser::incomplete(size_t need) {
    need_ = need;
    return std::nullopt;
}

std::expected<std::optional<Value>, std::string> Parser::next() {
    if (buf_.size() < need_) return std::nullopt;
    need_ = 0;

    size_t pos = 0;
    auto v = parse(pos, 0);
    if (v && *v) buf_.erase(0, pos);
    return v;
}

std::expected<std::optional<Value>, std::string> Parser::parse(size_t& pos, int depth) {
    if (pos >= buf_.size()) return incomplete(pos + 1);

    auto line = line_at(pos + 1);
    if (!line) return incomplete(buf_.size() + 1);

    char tag = buf_[pos];
    size_t after_line = pos + 1 + line->size() + 2;
    Value v;

    switch (tag) {
        case '+':
        case '-':
            v.type = tag == '+' ? Value::Type::SimpleString : Value::Type::Error;
            v.str = std::string(*line);
            pos = after_line;
            return v;

        case ':': {
            auto n = to_int(*line);
            if (!n) return std::unexpected(std::format("bad integer '{}'", *line));
            v.type = Value::Type::Integer;
            v.integer = *n;
            pos = after_line;
            return v;
        }

        case '$': {
            auto n = to_int(*line);
            if (!n || *n < -1 || *n > MAX_BULK) {
                return std::unexpected(std::format("bad bulk length '{}'", *line));
            }
            if (*n == -1) {
                pos = after_line;
                return v;
            }
            auto len = static_cast<size_t>(*n);
            if (buf_.size() < after_line + len + 2) return incomplete(after_line + len + 2);
            if (buf_.compare(after_line + len, 2, "\r\n") != 0) {
                return std::unexpected("bulk string not terminated by CRLF");
            }
            v.type = Value::Type::BulkString;
            v.str = buf_.substr(after_line, len);
            pos = after_line + len + 2;
            return v;
        }

        case '*': {
            auto n = to_int(*line);
            if (!n || *n < -1) return std::unexpected(std::format("bad array length '{}'", *line));
            if (*n == -1) {
                pos = after_line;
                return v;
            }
            if (depth >= MAX_DEPTH) return std::unexpected("array nesting too deep");
            v.type = Value::Type::Array;
            size_t cursor = after_line;
            for (int64_t i = 0; i < *n; ++i) {
                auto elem = parse(cursor, depth + 1);
                if (!elem) return std::unexpected(elem.error());
                if (!*elem) return std::nullopt;
                v.elements.push_back(std::move(**elem));
            }
            pos = cursor;
            return v;
        }

        default:
            return std::unexpected(std::format("unknown type byte 0x{:02x}",
                                               static_cast<unsigned char>(tag)));
    }
}

} // namespace resp
