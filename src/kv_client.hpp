#pragma once
#include "config.hpp"
#include "resp.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <chrono>

namespace embcache {

// Abstract single-key transport to a network key-value service
// (injectable for testing). Both calls throw BackendUnavailable or Timeout.
class KvClient {
public:
    virtual ~KvClient() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
};

// Redis-protocol client over POSIX sockets, with optional TLS (OpenSSL).
// Holds one lazily opened connection; any failure drops it so the next
// call reconnects. A pooled connection the server has closed while idle is
// replaced within the same call. Calls are serialized on that connection.
class RedisClient : public KvClient {
public:
    explicit RedisClient(RemoteConfig config);
    ~RedisClient() override;

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;

    bool connected() const;

private:
    struct Connection;
    using Deadline = std::chrono::steady_clock::time_point;

    RespReply execute(const std::vector<std::string>& args);
    RespReply round_trip(const std::vector<std::string>& args, Deadline deadline);
    void open(Deadline deadline);
    void drop_connection();

    RemoteConfig config_;
    std::unique_ptr<Connection> conn_;
    mutable std::mutex mutex_;
};

} // namespace embcache
