// Redis-protocol client using POSIX sockets + OpenSSL.
// Every step (connect, TLS handshake, send, receive) is bounded by the
// per-call deadline derived from RemoteConfig::timeout_ms.
#include "kv_client.hpp"
#include "cache_error.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509_vfy.h>

#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <poll.h>
#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; elsewhere SigpipeGuard covers it.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace embcache {

using Clock = std::chrono::steady_clock;

namespace {

// The peer closed or reset the connection before any byte of the reply
// arrived. On a reused connection the request is safe to send again.
class ConnectionLost : public BackendUnavailable {
public:
    using BackendUnavailable::BackendUnavailable;
};

// Blocks SIGPIPE on the calling thread while in scope. OpenSSL writes through
// its socket BIO with plain write(2), so a write to a reset peer would raise
// SIGPIPE in the host process. A SIGPIPE generated inside the scope is
// consumed before the old mask is restored.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_);
        was_blocked_ = sigismember(&old_mask_, SIGPIPE) == 1;
    }

    ~SigpipeGuard() {
        if (was_blocked_) return;
        int saved_errno = errno;
        if (!was_pending_) {
            sigset_t pending;
            sigemptyset(&pending);
            if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
                struct timespec zero{0, 0};
                while (sigtimedwait(&pipe_set_, nullptr, &zero) < 0 && errno == EINTR) {}
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
        errno = saved_errno;
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t pipe_set_;
    sigset_t old_mask_;
    bool was_pending_ = false;
    bool was_blocked_ = false;
};

} // namespace

static long remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return static_cast<long>(left.count());
}

static std::string endpoint(const RemoteConfig& cfg) {
    return cfg.host + ":" + std::to_string(cfg.port);
}

static std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

static bool is_ip_literal(const std::string& host) {
    unsigned char addr[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, host.c_str(), addr) == 1 ||
           inet_pton(AF_INET6, host.c_str(), addr) == 1;
}

static bool is_reset(int err) {
    return err == ECONNRESET || err == EPIPE || err == ECONNABORTED;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct RedisClient::Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    bool     broken = false; // set after any I/O failure; skips close_notify
    std::string leftover;    // bytes received but not yet parsed

    Connection() = default;
    ~Connection() {
        if (ssl) {
            if (!broken) {
                SigpipeGuard no_sigpipe;
                SSL_shutdown(ssl);
            }
            SSL_free(ssl);
        }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    void connect(const RemoteConfig& cfg, Clock::time_point deadline) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        std::string port = std::to_string(cfg.port);
        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(cfg.host.c_str(), port.c_str(), &hints, &res);
        if (gai != 0) {
            throw BackendUnavailable("redis: cannot resolve " + endpoint(cfg) + ": " +
                                     gai_strerror(gai));
        }

        bool connected = false;
        bool timed_out = false;
        int last_errno = 0;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_errno = errno; continue; }

            // Non-blocking connect so the deadline is honoured.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                connected = true;
            } else if (errno == EINPROGRESS) {
                // poll() rather than select(): fd may be above FD_SETSIZE
                // in a process with many open descriptors.
                for (;;) {
                    long ms = remaining_ms(deadline);
                    if (ms <= 0) { timed_out = true; break; }
                    pollfd pfd{fd, POLLOUT, 0};
                    int wait = static_cast<int>(
                        std::min<long>(ms, std::numeric_limits<int>::max()));
                    rc = poll(&pfd, 1, wait);
                    if (rc > 0) {
                        int err = 0;
                        socklen_t elen = sizeof(err);
                        getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                        if (err == 0) connected = true;
                        else last_errno = err;
                        break;
                    }
                    if (rc == 0) { timed_out = true; break; }
                    if (errno != EINTR) { last_errno = errno; break; }
                }
            } else {
                last_errno = errno;
            }

            if (connected) {
                fcntl(fd, F_SETFL, flags);
            } else {
                ::close(fd);
                fd = -1;
                if (timed_out) break;
            }
        }
        freeaddrinfo(res);

        if (!connected) {
            if (timed_out)
                throw Timeout("redis: connect to " + endpoint(cfg) + " timed out");
            throw BackendUnavailable("redis: connect to " + endpoint(cfg) + " failed: " +
                                     std::strerror(last_errno));
        }

        if (cfg.tls) start_tls(cfg, deadline);
    }

    void write_all(const std::string& data, Clock::time_point deadline) {
        const char* buf = data.data();
        size_t len = data.size();
        while (len > 0) {
            set_socket_timeout(deadline);
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int saved_errno = errno;
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    if (err == SSL_ERROR_SYSCALL) {
                        if (saved_errno == EAGAIN || saved_errno == EWOULDBLOCK)
                            throw Timeout("redis: send timed out");
                        if (is_reset(saved_errno))
                            throw ConnectionLost(std::string("redis: send failed: ") +
                                                 std::strerror(saved_errno));
                    }
                    throw BackendUnavailable("redis: TLS write failed: " + ssl_error_string());
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    if (errno == EAGAIN || errno == EWOULDBLOCK)
                        throw Timeout("redis: send timed out");
                    if (is_reset(errno))
                        throw ConnectionLost(std::string("redis: send failed: ") +
                                             std::strerror(errno));
                    throw BackendUnavailable(std::string("redis: send failed: ") +
                                             std::strerror(errno));
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
    }

    // Block until one complete reply is buffered, then parse it. A close
    // or reset before the first reply byte is ConnectionLost; one in the
    // middle of a reply is a plain BackendUnavailable.
    RespReply read_reply(Clock::time_point deadline) {
        for (;;) {
            if (!leftover.empty()) {
                size_t consumed = 0;
                auto reply = parse_resp_reply(leftover, consumed);
                if (reply) {
                    leftover.erase(0, consumed);
                    return *reply;
                }
            }
            char buf[4096];
            ssize_t n;
            try {
                n = read_some(buf, sizeof(buf), deadline);
            } catch (const ConnectionLost& e) {
                if (!leftover.empty())
                    throw BackendUnavailable(std::string(e.what()) + " mid-reply");
                throw;
            }
            if (n == 0) {
                if (!leftover.empty())
                    throw BackendUnavailable("redis: connection closed by server mid-reply");
                throw ConnectionLost("redis: connection closed by server");
            }
            leftover.append(buf, static_cast<size_t>(n));
        }
    }

private:
    void start_tls(const RemoteConfig& cfg, Clock::time_point deadline) {
        set_socket_timeout(deadline);

        ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) throw BackendUnavailable("redis: " + ssl_error_string());
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
        if (cfg.tls_ca_file.empty()) {
            SSL_CTX_set_default_verify_paths(ctx);
        } else if (SSL_CTX_load_verify_locations(ctx, cfg.tls_ca_file.c_str(), nullptr) != 1) {
            throw BackendUnavailable("redis: cannot load CA file " + cfg.tls_ca_file + ": " +
                                     ssl_error_string());
        }

        ssl = SSL_new(ctx);
        if (!ssl) throw BackendUnavailable("redis: " + ssl_error_string());
        SSL_set_fd(ssl, fd);

        // The certificate must be issued for the configured host, not just
        // chain to a trusted root.
        bool bound;
        if (is_ip_literal(cfg.host)) {
            bound = X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), cfg.host.c_str()) == 1;
        } else {
            SSL_set_tlsext_host_name(ssl, cfg.host.c_str()); // SNI
            bound = SSL_set1_host(ssl, cfg.host.c_str()) == 1;
        }
        if (!bound) throw BackendUnavailable("redis: cannot bind TLS peer name " + cfg.host);

        int rc = SSL_connect(ssl);
        if (rc != 1) {
            int saved_errno = errno;
            int err = SSL_get_error(ssl, rc);
            if (err == SSL_ERROR_SYSCALL &&
                (saved_errno == EAGAIN || saved_errno == EWOULDBLOCK))
                throw Timeout("redis: TLS handshake with " + endpoint(cfg) + " timed out");
            long verify = SSL_get_verify_result(ssl);
            if (verify != X509_V_OK) {
                throw BackendUnavailable("redis: TLS certificate of " + endpoint(cfg) +
                                         " rejected: " +
                                         X509_verify_cert_error_string(verify));
            }
            throw BackendUnavailable("redis: TLS handshake with " + endpoint(cfg) +
                                     " failed: " + ssl_error_string());
        }
    }

    // Returns >0 on data, 0 on orderly EOF. Throws on error or deadline.
    ssize_t read_some(char* buf, size_t len, Clock::time_point deadline) {
        while (true) {
            set_socket_timeout(deadline);

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int saved_errno = errno;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL) {
                    if (saved_errno == EAGAIN || saved_errno == EWOULDBLOCK)
                        throw Timeout("redis: receive timed out");
                    if (n == 0) return 0;
                    if (is_reset(saved_errno))
                        throw ConnectionLost(std::string("redis: receive failed: ") +
                                             std::strerror(saved_errno));
                }
                throw BackendUnavailable("redis: TLS read failed: " + ssl_error_string());
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n >= 0) return n;
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                    throw Timeout("redis: receive timed out");
                if (is_reset(errno))
                    throw ConnectionLost(std::string("redis: receive failed: ") +
                                         std::strerror(errno));
                throw BackendUnavailable(std::string("redis: receive failed: ") +
                                         std::strerror(errno));
            }
        }
    }

    // A zero timeval means "wait forever" to the kernel, so an expired
    // deadline is reported here instead of being passed down.
    void set_socket_timeout(Clock::time_point deadline) {
        long ms = remaining_ms(deadline);
        if (ms <= 0) throw Timeout("redis: operation deadline exceeded");
        struct timeval tv{ms / 1000, static_cast<suseconds_t>((ms % 1000) * 1000)};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── RedisClient ───────────────────────────────────────────────

RedisClient::RedisClient(RemoteConfig config) : config_(std::move(config)) {}

RedisClient::~RedisClient() = default;

bool RedisClient::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conn_ != nullptr;
}

std::optional<std::string> RedisClient::get(const std::string& key) {
    RespReply reply = execute({"GET", key});
    switch (reply.type) {
        case RespReply::Type::BulkString:
            return std::move(reply.str);
        case RespReply::Type::Null:
            return std::nullopt;
        case RespReply::Type::Error:
            throw BackendUnavailable("redis: GET rejected: " + reply.str);
        default:
            throw BackendUnavailable("redis: unexpected reply to GET");
    }
}

void RedisClient::set(const std::string& key, const std::string& value) {
    RespReply reply = execute({"SET", key, value});
    if (reply.type == RespReply::Type::SimpleString && reply.str == "OK") return;
    if (reply.type == RespReply::Type::Error)
        throw BackendUnavailable("redis: SET rejected: " + reply.str);
    throw BackendUnavailable("redis: unexpected reply to SET");
}

RespReply RedisClient::execute(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(mutex_);
    SigpipeGuard no_sigpipe;
    auto deadline = Clock::now() + std::chrono::milliseconds(config_.timeout_ms);

    // GET and SET are idempotent, so a request that found a pooled
    // connection already closed by the server is sent once more on a
    // fresh one.
    bool reused = conn_ != nullptr;
    try {
        if (!conn_) open(deadline);
        return round_trip(args, deadline);
    } catch (const ConnectionLost& e) {
        drop_connection();
        if (!reused) throw;
        std::cerr << "[redis] Idle connection to " << endpoint(config_)
                  << " was closed (" << e.what() << "), reconnecting\n";
    } catch (const CacheError&) {
        drop_connection();
        throw;
    }

    try {
        open(deadline);
        return round_trip(args, deadline);
    } catch (const CacheError&) {
        drop_connection();
        throw;
    }
}

// Stream state is unknown after a transport failure.
void RedisClient::drop_connection() {
    if (conn_) conn_->broken = true;
    conn_.reset();
}

RespReply RedisClient::round_trip(const std::vector<std::string>& args, Deadline deadline) {
    conn_->write_all(resp_command(args), deadline);
    return conn_->read_reply(deadline);
}

void RedisClient::open(Deadline deadline) {
    conn_ = std::make_unique<Connection>();
    conn_->connect(config_, deadline);

    if (!config_.password.empty()) {
        std::vector<std::string> auth = {"AUTH"};
        if (!config_.username.empty()) auth.push_back(config_.username);
        auth.push_back(config_.password);

        RespReply reply = round_trip(auth, deadline);
        if (reply.type == RespReply::Type::Error)
            throw BackendUnavailable("redis: AUTH rejected: " + reply.str);
    }

    if (config_.database != 0) {
        RespReply reply = round_trip({"SELECT", std::to_string(config_.database)}, deadline);
        if (reply.type == RespReply::Type::Error)
            throw BackendUnavailable("redis: SELECT rejected: " + reply.str);
    }

    std::cerr << "[redis] Connected to " << endpoint(config_)
              << (config_.tls ? " (tls)" : "") << "\n";
}

} // namespace embcache
