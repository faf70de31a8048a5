#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace embcache {

// Minimal RESP2 framing for single-key GET/SET exchanges.

struct RespReply {
    enum class Type { SimpleString, Error, Integer, BulkString, Null };

    Type type = Type::Null;
    std::string str;      // SimpleString / Error / BulkString payload
    int64_t integer = 0;
};

// Encode a command as a RESP array of bulk strings. Arguments are
// binary-safe.
std::string resp_command(const std::vector<std::string>& args);

// Try to parse one reply from the front of buf.
// Returns nullopt when buf holds only a partial reply; on success sets
// consumed to the number of bytes used. Throws BackendUnavailable on a
// malformed or unsupported (array) reply.
std::optional<RespReply> parse_resp_reply(const std::string& buf, size_t& consumed);

} // namespace embcache
