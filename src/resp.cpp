#include "resp.hpp"
#include "cache_error.hpp"

namespace embcache {

static constexpr size_t MAX_BULK_LEN = 512ULL * 1024 * 1024; // server-side cap

std::string resp_command(const std::vector<std::string>& args) {
    size_t total = 16;
    for (const auto& a : args) total += a.size() + 16;

    std::string out;
    out.reserve(total);
    out += "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& a : args) {
        out += "$" + std::to_string(a.size()) + "\r\n";
        out += a;
        out += "\r\n";
    }
    return out;
}

static int64_t parse_int(const std::string& s) {
    if (s.empty()) throw BackendUnavailable("redis: empty integer in reply");

    size_t i = 0;
    bool negative = false;
    if (s[0] == '-') {
        negative = true;
        i = 1;
    }
    if (i == s.size()) throw BackendUnavailable("redis: bad integer in reply: " + s);

    int64_t value = 0;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (c < '0' || c > '9') throw BackendUnavailable("redis: bad integer in reply: " + s);
        if (value > (INT64_MAX - (c - '0')) / 10)
            throw BackendUnavailable("redis: integer overflow in reply");
        value = value * 10 + (c - '0');
    }
    return negative ? -value : value;
}

std::optional<RespReply> parse_resp_reply(const std::string& buf, size_t& consumed) {
    size_t eol = buf.find("\r\n");
    if (eol == std::string::npos) return std::nullopt;
    if (eol == 0) throw BackendUnavailable("redis: empty reply line");

    char prefix = buf[0];
    std::string line = buf.substr(1, eol - 1);
    size_t header_len = eol + 2;

    RespReply reply;
    switch (prefix) {
        case '+':
            reply.type = RespReply::Type::SimpleString;
            reply.str = std::move(line);
            consumed = header_len;
            return reply;

        case '-':
            reply.type = RespReply::Type::Error;
            reply.str = std::move(line);
            consumed = header_len;
            return reply;

        case ':':
            reply.type = RespReply::Type::Integer;
            reply.integer = parse_int(line);
            consumed = header_len;
            return reply;

        case '$': {
            int64_t len = parse_int(line);
            if (len == -1) {
                reply.type = RespReply::Type::Null;
                consumed = header_len;
                return reply;
            }
            if (len < 0 || static_cast<uint64_t>(len) > MAX_BULK_LEN)
                throw BackendUnavailable("redis: bad bulk length " + line);

            size_t n = static_cast<size_t>(len);
            if (buf.size() < header_len + n + 2) return std::nullopt;
            if (buf.compare(header_len + n, 2, "\r\n") != 0)
                throw BackendUnavailable("redis: bulk string not CRLF-terminated");

            reply.type = RespReply::Type::BulkString;
            reply.str = buf.substr(header_len, n);
            consumed = header_len + n + 2;
            return reply;
        }

        case '*':
            throw BackendUnavailable("redis: unexpected array reply");

        default:
            throw BackendUnavailable(std::string("redis: unknown reply type '") + prefix + "'");
    }
}

} // namespace embcache
