#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <thread>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace plaidrpc {

using json = nlohmann::json;
using header_map = std::map<std::string, std::string>;

/// Production host used when no endpoint is given.
constexpr std::string_view kDefaultHost = "plaidcloud.com";

/// Path segment every websocket endpoint ends with.
constexpr std::string_view kSocketPath = "/socket";

/// Proxy port assumed when the proxy URL names none.
constexpr int kDefaultProxyPort = 80;

// --- logging ---

namespace detail {

inline std::mutex &logger_mu() {
  static std::mutex mu;
  return mu;
}

inline std::shared_ptr<spdlog::logger> &logger_slot() {
  static std::shared_ptr<spdlog::logger> slot = []() {
    auto existing = spdlog::get("plaidrpc");
    return existing ? existing : spdlog::stdout_color_mt("plaidrpc");
  }();
  return slot;
}

} // namespace detail

/// Logger used for every diagnostic the library emits.
inline std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(detail::logger_mu());
  return detail::logger_slot();
}

/// Route library diagnostics through an application-owned logger.
inline void set_logger(std::shared_ptr<spdlog::logger> replacement) {
  if (!replacement) {
    throw std::invalid_argument("logger is required");
  }
  std::lock_guard<std::mutex> lock(detail::logger_mu());
  detail::logger_slot() = std::move(replacement);
}

// --- errors ---

class plaidrpc_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The auth context cannot identify the caller.
class auth_error : public plaidrpc_error {
public:
  using plaidrpc_error::plaidrpc_error;
};

/// Transport failure: resolve, connect, proxy tunnel, TLS, websocket I/O.
class connection_error : public plaidrpc_error {
public:
  explicit connection_error(const std::string &message,
                            boost::system::error_code ec = {})
      : plaidrpc_error(ec ? message + ": " + ec.message() : message),
        code_(ec) {}

  const boost::system::error_code &code() const { return code_; }

private:
  boost::system::error_code code_;
};

/// A frame could not be decoded into what the caller asked for.
class protocol_error : public plaidrpc_error {
public:
  using plaidrpc_error::plaidrpc_error;
};

class task_execution_error : public plaidrpc_error {
public:
  task_execution_error(std::string url, std::string method,
                       const std::string &reason)
      : plaidrpc_error("task " + method + " " + url + " failed: " + reason),
        url_(std::move(url)), method_(std::move(method)) {}

  const std::string &url() const { return url_; }
  const std::string &method() const { return method_; }

private:
  std::string url_;
  std::string method_;
};

class config_error : public plaidrpc_error {
public:
  using plaidrpc_error::plaidrpc_error;
};

// --- URIs ---

/// Extract the scheme from a URI, or an empty string when there is none.
inline std::string scheme(std::string_view uri) {
  auto pos = uri.find("://");
  return pos != std::string_view::npos ? std::string(uri.substr(0, pos))
                                       : std::string();
}

/// Parsed websocket or proxy URI.
struct parsed_uri {
  std::string raw;
  std::string scheme;
  std::string user;
  std::string password;
  std::string host;
  int port = 0;
  bool has_port = false;
  std::string path;
  bool secure = false;
};

inline int default_port(const std::string &scheme_name) {
  return scheme_name == "wss" || scheme_name == "https" ? 443 : 80;
}

inline std::tuple<std::string, int> split_host_port(const std::string &addr,
                                                     int default_port) {
  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    return {addr, default_port};

  std::string port_text = addr.substr(pos + 1);
  int port = port_text.empty() ? default_port : std::stoi(port_text);
  return {addr.substr(0, pos), port};
}

inline parsed_uri parse_uri(const std::string &uri) {
  std::string s = scheme(uri);
  if (s != "ws" && s != "wss" && s != "http" && s != "https")
    throw std::invalid_argument("unsupported URI: " + uri);

  parsed_uri parsed;
  parsed.raw = uri;
  parsed.scheme = s;
  parsed.secure = s == "wss" || s == "https";

  std::string rest = uri.substr(s.size() + 3);
  auto slash = rest.find('/');
  std::string authority =
      slash == std::string::npos ? rest : rest.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : rest.substr(slash);

  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    std::string userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
    auto colon = userinfo.find(':');
    parsed.user = userinfo.substr(0, colon);
    if (colon != std::string::npos)
      parsed.password = userinfo.substr(colon + 1);
  }

  if (authority.empty())
    throw std::invalid_argument("missing host in URI: " + uri);

  parsed.has_port = authority.find(':') != std::string::npos;
  auto [host, port] = split_host_port(authority, default_port(s));
  if (host.empty())
    throw std::invalid_argument("missing host in URI: " + uri);
  parsed.host = host;
  parsed.port = port;
  return parsed;
}

/// Canonical websocket endpoint for a bare host, host/path or full URI.
/// No scheme means wss; https and http map to wss and ws.
inline std::string normalize_uri(const std::optional<std::string> &uri) {
  std::string raw = uri ? *uri : std::string(kDefaultHost);

  std::string s = scheme(raw);
  std::string rest = s.empty() ? raw : raw.substr(s.size() + 3);
  if (s.empty() || s == "https")
    s = "wss";
  else if (s == "http")
    s = "ws";

  while (!rest.empty() && rest.back() == '/')
    rest.pop_back();

  if (rest.size() < kSocketPath.size() ||
      rest.compare(rest.size() - kSocketPath.size(), kSocketPath.size(),
                   kSocketPath.data(), kSocketPath.size()) != 0) {
    rest += kSocketPath;
  }
  return s + "://" + rest;
}

// --- auth ---

enum class auth_method { none, user, agent, transform, oauth2 };

inline std::string_view to_string(auth_method method) {
  switch (method) {
  case auth_method::user:
    return "user";
  case auth_method::agent:
    return "agent";
  case auth_method::transform:
    return "transform";
  case auth_method::oauth2:
    return "oauth2";
  case auth_method::none:
    break;
  }
  return "none";
}

inline auth_method parse_auth_method(std::string_view name) {
  if (name == "user")
    return auth_method::user;
  if (name == "agent")
    return auth_method::agent;
  if (name == "transform")
    return auth_method::transform;
  if (name == "oauth2")
    return auth_method::oauth2;
  throw auth_error("invalid authentication method: " + std::string(name));
}

struct proxy_config {
  std::string url;
  std::string user;
  std::string password;
};

/// Caller identity and optional proxy route. A default-constructed context
/// carries no package identifier and is rejected by every session.
class auth_context {
public:
  auth_context() = default;

  static auth_context user(std::string user_name, std::string password,
                           std::string multi_factor = {}) {
    return auth_context(auth_method::user, std::move(user_name),
                        std::move(password), std::move(multi_factor));
  }

  static auth_context agent(std::string public_key, std::string private_key) {
    return auth_context(auth_method::agent, std::move(public_key),
                        std::move(private_key), {});
  }

  static auth_context transform(std::string task_id, std::string session_id) {
    return auth_context(auth_method::transform, std::move(task_id),
                        std::move(session_id), {});
  }

  static auth_context oauth2(std::string token) {
    return auth_context(auth_method::oauth2, std::move(token), {}, {});
  }

  auth_context &with_proxy(proxy_config proxy) {
    proxy_ = std::move(proxy);
    return *this;
  }

  auth_method method() const { return method_; }
  const std::string &public_key() const { return public_key_; }
  const std::optional<proxy_config> &proxy() const { return proxy_; }

  bool has_package() const {
    return method_ != auth_method::none && !public_key_.empty();
  }

  /// Identification headers sent with every websocket upgrade.
  header_map package() const {
    if (!has_package()) {
      throw auth_error("auth context does not carry a package identifier");
    }
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    return {
        {"PlaidCloud-Auth-Method", std::string(to_string(method_))},
        {"PlaidCloud-Key", public_key_},
        {"PlaidCloud-Pass", private_key_},
        {"PlaidCloud-MFA", multi_factor_},
        {"PlaidCloud-Timestamp", std::to_string(now)},
    };
  }

private:
  auth_context(auth_method method, std::string public_key,
               std::string private_key, std::string multi_factor)
      : method_(method), public_key_(std::move(public_key)),
        private_key_(std::move(private_key)),
        multi_factor_(std::move(multi_factor)) {
    if (public_key_.empty()) {
      throw auth_error(std::string(to_string(method_)) +
                       " auth requires a non-empty key");
    }
  }

  auth_method method_ = auth_method::none;
  std::string public_key_;
  std::string private_key_;
  std::string multi_factor_;
  std::optional<proxy_config> proxy_;
};

// --- targets and proxies ---

struct connection_target {
  std::string scheme;
  std::string host;
  int port = 443;
  std::string path;
  std::string callback_type;
  bool verify_tls = true;

  bool secure() const { return scheme == "wss"; }

  std::string host_header() const {
    if (port == default_port(scheme))
      return host;
    return host + ":" + std::to_string(port);
  }

  std::string uri() const { return scheme + "://" + host_header() + path; }
};

inline connection_target resolve_target(const std::optional<std::string> &uri,
                                        std::string callback_type,
                                        std::optional<bool> verify_ssl) {
  std::string normalized = normalize_uri(uri);
  parsed_uri parsed;
  try {
    parsed = parse_uri(normalized);
  } catch (const std::exception &e) {
    throw connection_error("cannot resolve endpoint " + normalized + ": " +
                           e.what());
  }

  connection_target target;
  target.scheme = parsed.scheme;
  target.host = parsed.host;
  target.port = parsed.port;
  target.path = parsed.path;
  target.callback_type = std::move(callback_type);

  if (verify_ssl) {
    target.verify_tls = *verify_ssl;
  } else if (parsed.host.find(kDefaultHost) != std::string::npos) {
    target.verify_tls = true;
  } else {
    target.verify_tls = false;
    if (target.secure()) {
      logger()->warn("TLS certificate verification is off for {}; set "
                     "verify_ssl to choose explicitly",
                     parsed.host);
    }
  }
  return target;
}

using proxy_settings = std::map<std::string, std::string>;

/// Scheme-keyed proxy URLs with credentials in the authority. Empty when the
/// auth context names no proxy.
inline proxy_settings build_proxy_settings(const auth_context &auth) {
  const auto &proxy = auth.proxy();
  if (!proxy || proxy->url.empty())
    return {};

  std::string host = proxy->url;
  std::string s = scheme(host);
  if (!s.empty())
    host = host.substr(s.size() + 3);
  while (!host.empty() && host.back() == '/')
    host.pop_back();

  std::string credentials;
  if (!proxy->user.empty() || !proxy->password.empty())
    credentials = proxy->user + ":" + proxy->password + "@";

  proxy_settings settings{{"http", "http://" + credentials + host},
                          {"https", "https://" + credentials + host}};
  (void)parse_uri(settings["http"]);
  return settings;
}

inline std::optional<parsed_uri> select_proxy(const proxy_settings &settings,
                                              const connection_target &target) {
  auto it = settings.find(target.secure() ? "https" : "http");
  if (it == settings.end())
    return std::nullopt;

  auto parsed = parse_uri(it->second);
  if (!parsed.has_port)
    parsed.port = kDefaultProxyPort;
  return parsed;
}

// --- options ---

struct connect_options {
  std::optional<std::string> uri;
  /// Unset: verify for the production host only, with a logged advisory
  /// elsewhere.
  std::optional<bool> verify_ssl;
  std::string ca_file;
  int connect_poll_interval_ms = 1000;
  int connect_poll_attempts = 5;
  int ping_interval_ms = 10000;
  int close_timeout_ms = 5000;
  std::string user_agent = "plaidrpc/0.1";
  bool deprecation_warning = true;
};

namespace detail {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

inline void throw_if(const beast::error_code &ec, const std::string &what) {
  if (ec)
    throw connection_error(what, ec);
}

inline std::string base64_encode(const std::string &in) {
  std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
  int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                            reinterpret_cast<const unsigned char *>(in.data()),
                            static_cast<int>(in.size()));
  out.resize(static_cast<size_t>(n));
  return out;
}

inline void warn_deprecated(const connect_options &opts) {
  if (opts.deprecation_warning) {
    logger()->warn("websocket sessions are a legacy transport; prefer the "
                   "JSON-RPC client for new code");
  }
}

/// Websocket over plain TCP or TLS, optionally tunnelled through an HTTP
/// proxy. Blocking open/read/write for the calling thread, plus access to the
/// underlying stream for asynchronous use on its io_context.
class ws_stream {
public:
  using plain_stream = websocket::stream<beast::tcp_stream>;
  using tls_stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
  using socket_fn = std::function<bool(int)>;

  explicit ws_stream(net::io_context &ioc) : ioc_(ioc) {}

  template <class F> decltype(auto) visit(F &&f) {
    if (auto *s = std::get_if<plain_stream>(&stream_))
      return f(*s);
    if (auto *s = std::get_if<tls_stream>(&stream_))
      return f(*s);
    throw connection_error("websocket stream is not open");
  }

  /// on_socket sees each descriptor before connect is attempted on it, and -1
  /// before a failed one is closed. Returning false abandons the attempt.
  void open(const connection_target &target, const header_map &headers,
            const std::optional<parsed_uri> &proxy,
            const connect_options &opts, const socket_fn &on_socket = nullptr) {
    const std::string &host = proxy ? proxy->host : target.host;
    int port = proxy ? proxy->port : target.port;

    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(host, std::to_string(port), ec);
    throw_if(ec, "resolve " + host);

    if (target.secure()) {
      tls_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
      configure_tls(*tls_ctx_, target, opts);
      stream_.emplace<tls_stream>(ioc_, *tls_ctx_);
    } else {
      stream_.emplace<plain_stream>(ioc_);
    }

    visit([&](auto &ws) {
      auto &layer = beast::get_lowest_layer(ws);
      connect_socket(layer.socket(), results, on_socket,
                     host + ":" + std::to_string(port));
      if (proxy)
        open_tunnel(layer, target, *proxy);
      start_tls(ws, target);
      upgrade(ws, target, headers, opts);
    });
  }

  bool is_open() const {
    if (auto *s = std::get_if<plain_stream>(&stream_))
      return s->is_open();
    if (auto *s = std::get_if<tls_stream>(&stream_))
      return s->is_open();
    return false;
  }

  void write(const std::string &text) {
    beast::error_code ec;
    visit([&](auto &ws) { ws.write(net::buffer(text), ec); });
    throw_if(ec, "websocket write");
  }

  std::string read() {
    beast::error_code ec;
    beast::flat_buffer buffer;
    visit([&](auto &ws) { ws.read(buffer, ec); });
    throw_if(ec, "websocket read");
    return beast::buffers_to_string(buffer.data());
  }

  /// Drop the TCP connection without a close handshake.
  void shutdown() {
    if (std::holds_alternative<std::monostate>(stream_))
      return;
    visit([](auto &ws) {
      beast::error_code ec;
      auto &layer = beast::get_lowest_layer(ws);
      layer.socket().shutdown(tcp::socket::shutdown_both, ec);
      layer.close();
    });
  }

private:
  static void configure_tls(ssl::context &ctx, const connection_target &target,
                            const connect_options &opts) {
    beast::error_code ec;
    if (!target.verify_tls) {
      ctx.set_verify_mode(ssl::verify_none, ec);
      throw_if(ec, "configure TLS");
      return;
    }
    ctx.set_default_verify_paths(ec);
    throw_if(ec, "load default certificate paths");
    if (!opts.ca_file.empty()) {
      ctx.load_verify_file(opts.ca_file, ec);
      throw_if(ec, "load CA file " + opts.ca_file);
    }
    ctx.set_verify_mode(ssl::verify_peer, ec);
    throw_if(ec, "configure TLS");
    ctx.set_verify_callback(ssl::host_name_verification(target.host), ec);
    throw_if(ec, "configure TLS host verification");
  }

  // The socket is opened and reported before connect so that ::shutdown on
  // the reported descriptor aborts a connect still in SYN_SENT.
  static void connect_socket(tcp::socket &socket,
                             const tcp::resolver::results_type &results,
                             const socket_fn &on_socket,
                             const std::string &where) {
    beast::error_code ec = net::error::host_not_found;
    for (const auto &entry : results) {
      tcp::endpoint endpoint = entry.endpoint();
      socket.open(endpoint.protocol(), ec);
      throw_if(ec, "open socket for " + where);

      if (on_socket && !on_socket(socket.native_handle()))
        throw connection_error("connection closed while connecting");
      socket.connect(endpoint, ec);
      if (!ec)
        return;

      beast::error_code ignored;
      if (on_socket && !on_socket(-1)) {
        socket.close(ignored);
        throw connection_error("connection closed while connecting");
      }
      socket.close(ignored);
    }
    throw_if(ec, "connect " + where);
  }

  static void open_tunnel(beast::tcp_stream &layer,
                          const connection_target &target,
                          const parsed_uri &proxy) {
    std::string authority = target.host + ":" + std::to_string(target.port);
    http::request<http::empty_body> req{http::verb::connect, authority, 11};
    req.set(http::field::host, authority);
    if (!proxy.user.empty() || !proxy.password.empty()) {
      req.set(http::field::proxy_authorization,
              "Basic " + base64_encode(proxy.user + ":" + proxy.password));
    }

    beast::error_code ec;
    http::write(layer, req, ec);
    throw_if(ec, "proxy CONNECT to " + proxy.host);

    beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    http::read(layer, buffer, parser, ec);
    throw_if(ec, "proxy CONNECT reply from " + proxy.host);

    if (parser.get().result() != http::status::ok) {
      throw connection_error("proxy " + proxy.host + " refused tunnel to " +
                             authority + ": " +
                             std::to_string(parser.get().result_int()));
    }
  }

  static void start_tls(plain_stream &, const connection_target &) {}

  static void start_tls(tls_stream &ws, const connection_target &target) {
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(),
                                  target.host.c_str())) {
      beast::error_code ec{static_cast<int>(::ERR_get_error()),
                           net::error::get_ssl_category()};
      throw connection_error("set TLS server name " + target.host, ec);
    }
    beast::error_code ec;
    ws.next_layer().handshake(ssl::stream_base::client, ec);
    throw_if(ec, "TLS handshake with " + target.host);
  }

  template <class Stream>
  static void upgrade(Stream &ws, const connection_target &target,
                      const header_map &headers, const connect_options &opts) {
    beast::get_lowest_layer(ws).expires_never();

    auto timeout =
        websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeout.handshake_timeout = std::chrono::milliseconds(opts.close_timeout_ms);
    if (opts.ping_interval_ms > 0) {
      timeout.idle_timeout = std::chrono::milliseconds(2 * opts.ping_interval_ms);
      timeout.keep_alive_pings = true;
    }
    ws.set_option(timeout);

    std::string agent = opts.user_agent;
    ws.set_option(websocket::stream_base::decorator(
        [headers, agent](websocket::request_type &req) {
          req.set(http::field::user_agent, agent);
          for (const auto &header : headers)
            req.set(header.first, header.second);
        }));
    ws.text(true);

    beast::error_code ec;
    ws.handshake(target.host_header(), target.path, ec);
    throw_if(ec, "websocket handshake with " + target.uri());
  }

  net::io_context &ioc_;
  std::unique_ptr<ssl::context> tls_ctx_;
  std::variant<std::monostate, plain_stream, tls_stream> stream_;
};

} // namespace detail

// --- synchronous session ---

/// Blocking websocket handed to quick_connect callbacks. Closed on
/// destruction.
class session {
public:
  session(const connection_target &target, const header_map &headers,
          const std::optional<parsed_uri> &proxy, const connect_options &opts)
      : close_timeout_(opts.close_timeout_ms), stream_(ioc_) {
    stream_.open(target, headers, proxy, opts);
  }

  ~session() { close(); }

  session(const session &) = delete;
  session &operator=(const session &) = delete;

  void send(const std::string &text) { stream_.write(text); }
  void send_json(const json &message) { stream_.write(message.dump()); }
  std::string recv() { return stream_.read(); }
  bool is_open() const { return stream_.is_open(); }

  /// Close handshake bounded by close_timeout_ms, after which the TCP
  /// connection is dropped.
  void close() {
    if (!stream_.is_open())
      return;

    bool done = false;
    detail::beast::error_code result;
    stream_.visit([&](auto &ws) {
      ws.async_close(detail::websocket::close_code::normal,
                     [&](detail::beast::error_code ec) {
                       done = true;
                       result = ec;
                     });
    });
    ioc_.restart();
    ioc_.run_for(close_timeout_);

    if (!done) {
      logger()->debug("session close handshake timed out after {} ms",
                      close_timeout_.count());
      stream_.shutdown();
      ioc_.restart();
      ioc_.run();
    } else if (result) {
      logger()->debug("session close handshake failed: {}", result.message());
    }
  }

private:
  std::chrono::milliseconds close_timeout_;
  detail::net::io_context ioc_;
  detail::ws_stream stream_;
};

/// Connect, discard the server's opening message, run one exchange and close.
template <class Run>
auto quick_connect(const auth_context &auth, const std::string &callback_type,
                   Run &&run, const connect_options &opts = {})
    -> decltype(run(std::declval<session &>())) {
  header_map headers = auth.package();
  headers["callback-type"] = callback_type;
  detail::warn_deprecated(opts);

  auto target = resolve_target(opts.uri, callback_type, opts.verify_ssl);
  auto proxy = select_proxy(build_proxy_settings(auth), target);

  logger()->debug("opening {} session to {}", callback_type, target.uri());
  session socket(target, headers, proxy, opts);

  logger()->debug("{} session open, discarding opening message", callback_type);
  (void)socket.recv();

  return run(socket);
}

/// Send one JSON message and return the reply, decoded unless as_json is
/// false (then the raw text as a JSON string).
inline json request(session &socket, const json &message, bool as_json = true) {
  socket.send(message.dump());
  std::string reply = socket.recv();
  if (!as_json)
    return reply;
  try {
    return json::parse(reply);
  } catch (const json::parse_error &e) {
    throw protocol_error(std::string("reply is not valid JSON: ") + e.what());
  }
}

/// request() for every value, one at a time in key order, keyed like the
/// input.
template <class Key>
std::map<Key, json> requests(session &socket,
                             const std::map<Key, json> &messages,
                             bool as_json = true) {
  std::map<Key, json> replies;
  for (const auto &entry : messages)
    replies.emplace(entry.first, request(socket, entry.second, as_json));
  return replies;
}

/// Same, issued in the order given.
template <class Key>
std::vector<std::pair<Key, json>>
requests(session &socket, const std::vector<std::pair<Key, json>> &messages,
         bool as_json = true) {
  std::vector<std::pair<Key, json>> replies;
  replies.reserve(messages.size());
  for (const auto &entry : messages)
    replies.emplace_back(entry.first, request(socket, entry.second, as_json));
  return replies;
}

inline std::function<json(session &)> request_cb(json message,
                                                 bool as_json = true) {
  return [message = std::move(message), as_json](session &socket) {
    return request(socket, message, as_json);
  };
}

template <class Key>
std::function<std::map<Key, json>(session &)>
requests_cb(std::map<Key, json> messages, bool as_json = true) {
  return [messages = std::move(messages), as_json](session &socket) {
    return requests(socket, messages, as_json);
  };
}

template <class Key>
std::function<std::vector<std::pair<Key, json>>(session &)>
requests_cb(std::vector<std::pair<Key, json>> messages, bool as_json = true) {
  return [messages = std::move(messages), as_json](session &socket) {
    return requests(socket, messages, as_json);
  };
}

// --- persistent connection ---

enum class connection_state { connecting, open, closing, closed, error };

inline std::string_view to_string(connection_state state) {
  switch (state) {
  case connection_state::connecting:
    return "connecting";
  case connection_state::open:
    return "open";
  case connection_state::closing:
    return "closing";
  case connection_state::closed:
    return "closed";
  case connection_state::error:
    return "error";
  }
  return "unknown";
}

/// Long-lived websocket. A background thread owns the socket and runs every
/// callback; send() and close() hand work to it through its io_context.
/// Must not be destroyed from inside its own callbacks.
class connection {
public:
  using open_fn = std::function<void(connection &)>;
  using message_fn = std::function<void(connection &, const std::string &)>;
  using error_fn = std::function<void(connection &, std::exception_ptr)>;
  using close_fn = std::function<void(connection &)>;

  struct callbacks {
    open_fn on_open;
    message_fn on_message;
    error_fn on_error;
    close_fn on_close;
  };

  /// Tag for a connection whose io thread is started later by start().
  struct deferred_t {};
  static constexpr deferred_t deferred{};

  /// Returns once the connection leaves `connecting` or the poll limit
  /// (connect_poll_attempts x connect_poll_interval_ms) runs out, whichever
  /// comes first. Running out is not an error.
  connection(const auth_context &auth, std::string callback_type,
             callbacks cb, connect_options opts = {})
      : connection(auth, std::move(callback_type), std::move(cb),
                   std::move(opts), deferred) {
    start();
  }

  connection(const auth_context &auth, std::string callback_type,
             callbacks cb, connect_options opts, deferred_t)
      : headers_(auth.package()), options_(std::move(opts)),
        callbacks_(std::move(cb)), stream_(ioc_) {
    headers_["callback-type"] = callback_type;
    detail::warn_deprecated(options_);
    target_ = resolve_target(options_.uri, std::move(callback_type),
                             options_.verify_ssl);
    proxy_ = select_proxy(build_proxy_settings(auth), target_);
  }

  /// Start the io thread, then wait as the connecting constructor does.
  void start() {
    {
      std::lock_guard<std::mutex> lock(join_mu_);
      if (started_)
        throw std::logic_error("connection already started");
      started_ = true;
      io_thread_ = std::thread([this]() { io_loop(); });
    }
    wait_for_open();
  }

  ~connection() { close(); }

  connection(const connection &) = delete;
  connection &operator=(const connection &) = delete;

  void send(const json &message) { send_text(message.dump()); }

  /// Queue a raw text frame. Writes leave in call order.
  void send_text(std::string text) {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (close_requested_ || state_ == connection_state::closed ||
          state_ == connection_state::error) {
        throw connection_error("cannot send on " + target_.callback_type +
                               " connection: " +
                               std::string(to_string(state_)));
      }
    }
    detail::net::post(ioc_, [this, text = std::move(text)]() mutable {
      enqueue(std::move(text));
    });
  }

  /// Idempotent. Blocks until the background thread has exited unless called
  /// from that thread.
  void close() {
    bool on_io_thread = false;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      on_io_thread = std::this_thread::get_id() == io_thread_id_;
      if (!close_requested_ && state_ != connection_state::closed) {
        close_requested_ = true;
        if (state_ == connection_state::open) {
          state_ = connection_state::closing;
        } else if (state_ == connection_state::connecting && sockfd_ >= 0) {
          ::shutdown(sockfd_, SHUT_RDWR);
        }
        detail::net::post(ioc_, [this]() { start_close(); });
      }
    }
    state_cv_.notify_all();

    if (!on_io_thread) {
      std::lock_guard<std::mutex> lock(join_mu_);
      if (io_thread_.joinable())
        io_thread_.join();
    }
  }

  connection_state state() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return state_;
  }

  bool is_open() const { return state() == connection_state::open; }
  const connection_target &target() const { return target_; }

private:
  void wait_for_open() {
    std::unique_lock<std::mutex> lock(state_mu_);
    for (int attempt = 0; attempt < options_.connect_poll_attempts; ++attempt) {
      if (state_cv_.wait_for(
              lock, std::chrono::milliseconds(options_.connect_poll_interval_ms),
              [this]() { return state_ != connection_state::connecting; })) {
        return;
      }
    }
    lock.unlock();
    logger()->warn("{} connection to {} still connecting after {} polls",
                   target_.callback_type, target_.uri(),
                   options_.connect_poll_attempts);
  }

  bool close_requested() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return close_requested_;
  }

  void io_loop() {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      io_thread_id_ = std::this_thread::get_id();
    }

    try {
      stream_.open(target_, headers_, proxy_, options_, [this](int fd) {
        std::lock_guard<std::mutex> lock(state_mu_);
        if (close_requested_)
          return false;
        sockfd_ = fd;
        return true;
      });
    } catch (const std::exception &e) {
      if (close_requested()) {
        logger()->debug("{} connection cancelled while connecting: {}",
                        target_.callback_type, e.what());
      } else {
        logger()->error("{} connection to {} failed: {}",
                        target_.callback_type, target_.uri(), e.what());
        fail(std::current_exception());
      }
      finish();
      return;
    }

    bool opened = false;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (!close_requested_) {
        state_ = connection_state::open;
        opened = true;
      }
    }
    state_cv_.notify_all();

    if (opened) {
      logger()->info("{} connection open to {}", target_.callback_type,
                     target_.uri());
      if (invoke("on_open", [this]() {
            if (callbacks_.on_open)
              callbacks_.on_open(*this);
          })) {
        do_read();
      }
    }

    ioc_.run();
    finish();
  }

  template <class F> bool invoke(const char *name, F &&callback) {
    try {
      callback();
      return true;
    } catch (const std::exception &e) {
      logger()->error("{} callback on {} connection threw: {}", name,
                      target_.callback_type, e.what());
      fail(std::current_exception());
      return false;
    }
  }

  void fail(std::exception_ptr error) {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (state_ == connection_state::error ||
          state_ == connection_state::closed)
        return;
      state_ = connection_state::error;
    }
    state_cv_.notify_all();

    if (callbacks_.on_error) {
      try {
        callbacks_.on_error(*this, error);
      } catch (const std::exception &e) {
        logger()->error("unhandled error on {} connection: {}",
                        target_.callback_type, e.what());
      }
    }
    write_queue_.clear();
    stream_.shutdown();
  }

  void finish() {
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      state_ = connection_state::closed;
      sockfd_ = -1;
    }
    state_cv_.notify_all();
    logger()->info("{} connection to {} closed", target_.callback_type,
                   target_.uri());

    if (callbacks_.on_close) {
      try {
        callbacks_.on_close(*this);
      } catch (const std::exception &e) {
        logger()->error("on_close callback on {} connection threw: {}",
                        target_.callback_type, e.what());
      }
    }
  }

  void do_read() {
    stream_.visit([this](auto &ws) {
      ws.async_read(buffer_, [this](detail::beast::error_code ec, std::size_t) {
        on_read(ec);
      });
    });
  }

  void on_read(detail::beast::error_code ec) {
    if (ec) {
      if (ec == detail::websocket::error::closed) {
        logger()->debug("{} connection closed by peer", target_.callback_type);
        std::lock_guard<std::mutex> lock(state_mu_);
        if (state_ == connection_state::open)
          state_ = connection_state::closing;
        return;
      }
      if (close_requested())
        return;
      fail(std::make_exception_ptr(
          connection_error("read from " + target_.uri() + " failed", ec)));
      return;
    }

    std::string message = detail::beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    if (!invoke("on_message", [&]() {
          if (callbacks_.on_message)
            callbacks_.on_message(*this, message);
        })) {
      return;
    }
    if (stream_.is_open())
      do_read();
  }

  void enqueue(std::string text) {
    if (close_started_ || !stream_.is_open()) {
      logger()->warn("dropping frame on {} connection: socket is closing",
                     target_.callback_type);
      return;
    }
    write_queue_.push_back(std::move(text));
    if (write_queue_.size() == 1)
      do_write();
  }

  void do_write() {
    stream_.visit([this](auto &ws) {
      ws.async_write(detail::net::buffer(write_queue_.front()),
                     [this](detail::beast::error_code ec, std::size_t) {
                       on_write(ec);
                     });
    });
  }

  void on_write(detail::beast::error_code ec) {
    if (ec) {
      write_queue_.clear();
      if (!close_requested()) {
        fail(std::make_exception_ptr(
            connection_error("write to " + target_.uri() + " failed", ec)));
      }
      return;
    }
    write_queue_.pop_front();
    if (!write_queue_.empty())
      do_write();
    else if (close_pending_)
      start_close();
  }

  void start_close() {
    if (close_started_ || !stream_.is_open())
      return;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (state_ == connection_state::error)
        return;
    }
    if (!write_queue_.empty()) {
      close_pending_ = true;
      return;
    }
    close_started_ = true;
    logger()->debug("closing {} connection", target_.callback_type);
    stream_.visit([this](auto &ws) {
      ws.async_close(detail::websocket::close_code::normal,
                     [this](detail::beast::error_code ec) {
                       if (ec) {
                         logger()->debug("close handshake on {} connection: {}",
                                         target_.callback_type, ec.message());
                         stream_.shutdown();
                       }
                     });
    });
  }

  header_map headers_;
  connect_options options_;
  callbacks callbacks_;
  connection_target target_;
  std::optional<parsed_uri> proxy_;

  // Owned by the io thread.
  detail::net::io_context ioc_;
  detail::ws_stream stream_;
  detail::beast::flat_buffer buffer_;
  std::deque<std::string> write_queue_;
  bool close_pending_ = false;
  bool close_started_ = false;

  mutable std::mutex state_mu_;
  std::condition_variable state_cv_;
  connection_state state_ = connection_state::connecting;
  bool close_requested_ = false;
  int sockfd_ = -1;
  std::thread::id io_thread_id_;

  std::mutex join_mu_;
  bool started_ = false;
  std::thread io_thread_;
};

// --- tasks ---

/// Unit of remote work carried by one queue message.
struct task_descriptor {
  std::string url;
  std::string method;
  json config = json::object();

  static task_descriptor from_json(const json &message) {
    if (!message.is_object())
      throw protocol_error("task descriptor must be a JSON object");

    auto url = message.find("url");
    auto method = message.find("method");
    if (url == message.end() || !url->is_string() || method == message.end() ||
        !method->is_string()) {
      throw protocol_error("task descriptor requires string url and method");
    }

    task_descriptor task;
    task.url = url->get<std::string>();
    task.method = method->get<std::string>();
    auto config = message.find("config");
    if (config != message.end() && !config->is_null())
      task.config = *config;
    return task;
  }
};

enum class task_directive { none, exit, restart };

struct task_result {
  task_directive directive = task_directive::none;
  /// Replacement config, or null to keep the current one.
  json config;
  bool ok = true;
  std::string error;

  static task_result failure(std::string reason) {
    task_result result;
    result.ok = false;
    result.error = std::move(reason);
    return result;
  }
};

class task_executor {
public:
  virtual ~task_executor() = default;
  virtual task_result execute(const task_descriptor &task) = 0;
};

/// Executor that dispatches on (url, method) to registered handlers.
class resource_registry : public task_executor {
public:
  using handler_fn = std::function<task_result(const json &config)>;

  void register_resource(const std::string &url, const std::string &method,
                         handler_fn handler) {
    if (url.empty() || method.empty()) {
      throw std::invalid_argument("url and method are required");
    }
    std::lock_guard<std::mutex> lock(mu_);
    handlers_[{url, method}] = std::move(handler);
  }

  bool contains(const std::string &url, const std::string &method) const {
    std::lock_guard<std::mutex> lock(mu_);
    return handlers_.count({url, method}) > 0;
  }

  task_result execute(const task_descriptor &task) override {
    handler_fn handler;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = handlers_.find({task.url, task.method});
      if (it == handlers_.end()) {
        throw task_execution_error(task.url, task.method,
                                   "no resource registered");
      }
      handler = it->second;
    }
    return handler(task.config);
  }

private:
  mutable std::mutex mu_;
  std::map<std::pair<std::string, std::string>, handler_fn> handlers_;
};

// --- listeners ---

/// Receiver of a persistent connection's lifecycle callbacks.
class listener {
public:
  virtual ~listener() = default;
  virtual void on_open(connection &ws) = 0;
  virtual void on_message(connection &ws, const std::string &message) = 0;
  virtual void on_error(connection &ws, std::exception_ptr error) = 0;
  virtual void on_close(connection &ws) = 0;
};

/// Listener defaults plus ownership of the connection. Subclasses open the
/// socket from their constructor and close it from their destructor.
class basic_listener : public listener {
public:
  ~basic_listener() override { close(); }

  void on_open(connection &) override {}
  void on_message(connection &, const std::string &) override {}

  void on_error(connection &ws, std::exception_ptr error) override {
    ws.close();
    std::rethrow_exception(error);
  }

  void on_close(connection &) override { running_.store(false); }

  bool running() const { return running_.load(); }

  connection_state state() const {
    return ws_ ? ws_->state() : connection_state::closed;
  }

  void send(const json &message) { socket().send(message); }

  void close() {
    if (ws_)
      ws_->close();
  }

protected:
  void open_web_socket(const auth_context &auth, std::string callback_type,
                       connect_options opts) {
    connection::callbacks cb;
    cb.on_open = [this](connection &ws) { on_open(ws); };
    cb.on_message = [this](connection &ws, const std::string &message) {
      on_message(ws, message);
    };
    cb.on_error = [this](connection &ws, std::exception_ptr error) {
      on_error(ws, std::move(error));
    };
    cb.on_close = [this](connection &ws) { on_close(ws); };
    ws_ = std::make_unique<connection>(auth, std::move(callback_type),
                                       std::move(cb), std::move(opts),
                                       connection::deferred);
    running_.store(true);
    ws_->start();
  }

  connection &socket() {
    if (!ws_)
      throw connection_error("listener has no connection");
    return *ws_;
  }

private:
  std::atomic<bool> running_{false};
  std::unique_ptr<connection> ws_;
};

/// Executes each queue message as a task and acknowledges it.
class queue_listener final : public basic_listener {
public:
  queue_listener(const auth_context &auth, task_executor &executor,
                 connect_options opts = {})
      : executor_(executor) {
    open_web_socket(auth, "queue_listen", std::move(opts));
    logger()->info("queue listener created");
  }

  ~queue_listener() override { close(); }

  void on_open(connection &ws) override { ws.send_text("ping"); }

  void on_message(connection &ws, const std::string &message) override {
    logger()->debug("received queue message: {}", message);
    if (message == "ping" || message == "ack")
      return;

    task_directive directive = task_directive::none;
    try {
      directive = execute_task(message);
    } catch (const std::exception &e) {
      // Acked anyway, otherwise the server redelivers it forever.
      logger()->error("queue task failed: {}", e.what());
    }
    ws.send_text("ack");

    if (directive == task_directive::exit) {
      logger()->info("queue listener is shutting down on request");
      ws.close();
    } else if (directive == task_directive::restart) {
      // TODO: reload settings and reopen once the server-side restart
      // contract is documented.
      logger()->warn("restart directive received; reload is not supported");
    }
  }

  void on_error(connection &, std::exception_ptr error) override {
    try {
      std::rethrow_exception(error);
    } catch (const std::exception &e) {
      logger()->error("queue connection error: {}", e.what());
    }
  }

  void on_close(connection &ws) override {
    logger()->debug("closing queue connection");
    basic_listener::on_close(ws);
  }

  /// Last config handed back by a task, null until one is.
  json config() const {
    std::lock_guard<std::mutex> lock(config_mu_);
    return config_;
  }

private:
  task_directive execute_task(const std::string &message) {
    if (message == "exit")
      return task_directive::exit;
    if (message == "restart")
      return task_directive::restart;

    json payload;
    try {
      payload = json::parse(message);
    } catch (const json::parse_error &e) {
      throw protocol_error(std::string("task message is not valid JSON: ") +
                           e.what());
    }
    auto task = task_descriptor::from_json(payload);

    task_result result;
    try {
      result = executor_.execute(task);
    } catch (const task_execution_error &) {
      throw;
    } catch (const std::exception &e) {
      throw task_execution_error(task.url, task.method, e.what());
    }
    if (!result.ok) {
      throw task_execution_error(task.url, task.method,
                                 result.error.empty() ? "executor reported failure"
                                                      : result.error);
    }

    if (!result.config.is_null()) {
      std::lock_guard<std::mutex> lock(config_mu_);
      config_ = std::move(result.config);
    }
    if (task.method == "exit" || task.method == "restart") {
      return task.method == "exit" ? task_directive::exit
                                   : task_directive::restart;
    }
    return result.directive;
  }

  task_executor &executor_;
  mutable std::mutex config_mu_;
  json config_;
};

/// Producer side of an agent queue.
class queue_agent final : public basic_listener {
public:
  using open_fn = std::function<void(queue_agent &, connection &)>;

  explicit queue_agent(const auth_context &auth, open_fn on_open = nullptr,
                       connect_options opts = {})
      : open_(std::move(on_open)) {
    open_web_socket(auth, "queue_agent", std::move(opts));
  }

  ~queue_agent() override { close(); }

  void on_open(connection &ws) override {
    if (open_)
      open_(*this, ws);
  }

  static json message(const std::string &cloud, const std::string &agent_id,
                      const std::string &resource, const std::string &method,
                      const json &data = nullptr,
                      const json &action = nullptr) {
    return {{"method", "post"},
            {"resource", "message"},
            {"params",
             {{"cloud", cloud},
              {"agent_id", agent_id},
              {"resource", resource},
              {"method", method},
              {"data", data},
              {"action", action}}}};
  }

  void add(const std::string &cloud, const std::string &agent_id,
           const std::string &resource, const std::string &method,
           const json &data = nullptr, const json &action = nullptr) {
    send(message(cloud, agent_id, resource, method, data, action));
  }

private:
  open_fn open_;
};

// --- one-shot feeds ---

inline std::string quick_request(const auth_context &auth,
                                 const std::string &cloud,
                                 const std::string &method,
                                 const std::string &resource,
                                 const json &data = nullptr,
                                 const json &action = nullptr,
                                 const connect_options &opts = {}) {
  json message = {{"method", method}, {"resource", resource},
                  {"cloud", cloud},   {"data", data},
                  {"action", action}};
  return quick_connect(
      auth, "handle",
      [&message](session &socket) {
        socket.send_json(message);
        return socket.recv();
      },
      opts);
}

inline json connection_params_request(const std::string &cloud,
                                      const std::string &connection_id) {
  return {{"method", "get"},
          {"resource", "connection"},
          {"cloud", cloud},
          {"connection", connection_id}};
}

inline json get_connection_params(const auth_context &auth,
                                  const std::string &cloud,
                                  const std::string &connection_id,
                                  const connect_options &opts = {}) {
  return quick_connect(auth, "connection",
                       request_cb(connection_params_request(cloud, connection_id)),
                       opts);
}

template <class Key>
std::map<Key, json>
get_connection_params_map(const auth_context &auth, const std::string &cloud,
                          const std::map<Key, std::string> &connection_map,
                          const connect_options &opts = {}) {
  std::map<Key, json> messages;
  for (const auto &entry : connection_map)
    messages.emplace(entry.first,
                     connection_params_request(cloud, entry.second));
  return quick_connect(auth, "connection", requests_cb(std::move(messages)),
                       opts);
}

inline void quick_add(const auth_context &auth, const std::string &cloud,
                      const std::string &agent_id, const std::string &resource,
                      const std::string &method, const json &data = nullptr,
                      const json &action = nullptr,
                      const connect_options &opts = {}) {
  json message =
      queue_agent::message(cloud, agent_id, resource, method, data, action);
  quick_connect(
      auth, "queue_agent",
      [&message](session &socket) { socket.send_json(message); }, opts);
}

// --- settings ---

struct settings {
  auth_context auth;
  connect_options options;
};

/// Extract a YAML value from a simple key: "value" line.
/// Handles both quoted and unquoted values.
inline std::string yaml_value(const std::string &line) {
  auto colon = line.find(':');
  if (colon == std::string::npos)
    return "";
  auto val = line.substr(colon + 1);
  auto start = val.find_first_not_of(" \t");
  if (start == std::string::npos)
    return "";
  val = val.substr(start);
  auto end = val.find_last_not_of(" \t\r");
  val = val.substr(0, end + 1);
  if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') &&
      val.back() == val.front())
    val = val.substr(1, val.size() - 2);
  return val;
}

/// Load auth and connection settings from a flat key: value YAML file
/// (no YAML library dependency).
inline settings load_settings(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open())
    throw config_error("cannot open: " + path);

  std::map<std::string, std::string> values;
  std::string line;
  while (std::getline(file, line)) {
    auto start = line.find_first_not_of(" \t");
    if (start == std::string::npos || line[start] == '#')
      continue;
    auto colon = line.find(':', start);
    if (colon == std::string::npos)
      continue;
    std::string key = line.substr(start, colon - start);
    key.erase(key.find_last_not_of(" \t") + 1);
    values[key] = yaml_value(line);
  }

  auto value = [&values](const char *key) {
    auto it = values.find(key);
    return it == values.end() ? std::string() : it->second;
  };

  settings result;
  std::string method = value("auth_method");
  if (!method.empty()) {
    try {
      switch (parse_auth_method(method)) {
      case auth_method::user:
        result.auth = auth_context::user(value("public_key"),
                                         value("private_key"), value("mfa"));
        break;
      case auth_method::agent:
        result.auth =
            auth_context::agent(value("public_key"), value("private_key"));
        break;
      case auth_method::transform:
        result.auth =
            auth_context::transform(value("public_key"), value("private_key"));
        break;
      case auth_method::oauth2:
        result.auth = auth_context::oauth2(value("public_key"));
        break;
      case auth_method::none:
        break;
      }
    } catch (const auth_error &e) {
      throw config_error(path + ": " + e.what());
    }
  }

  if (!value("proxy_url").empty()) {
    result.auth.with_proxy(
        {value("proxy_url"), value("proxy_user"), value("proxy_password")});
  }
  if (!value("uri").empty())
    result.options.uri = value("uri");
  if (!value("ca_file").empty())
    result.options.ca_file = value("ca_file");

  std::string verify = value("verify_ssl");
  std::transform(verify.begin(), verify.end(), verify.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  if (verify == "true" || verify == "yes" || verify == "1") {
    result.options.verify_ssl = true;
  } else if (verify == "false" || verify == "no" || verify == "0") {
    result.options.verify_ssl = false;
  } else if (!verify.empty()) {
    throw config_error(path + ": verify_ssl must be true or false, got " +
                       verify);
  }
  return result;
}

} // namespace plaidrpc
