#pragma once

#include <earscope/app/api_handler.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

namespace earscope::app {

struct HttpServerOptions {
  std::string host{"0.0.0.0"};
  std::uint16_t port{5000};
  std::size_t threads{2};
  std::size_t max_body_bytes{64u * 1024u * 1024u};
};

/// Plain HTTP front end (websocketpp on Boost.Asio) for ApiHandler. Every
/// response carries permissive CORS headers.
class HttpServer {
 public:
  using server_type = websocketpp::server<websocketpp::config::asio>;

  HttpServer(const ApiHandler& handler, HttpServerOptions options);

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /// Bind, listen and serve on options.threads threads; blocks until stop().
  /// Throws websocketpp::exception when the address cannot be bound.
  void run();

  /// Stop accepting and end run(). Safe to call from another thread.
  void stop();

 private:
  void on_http(websocketpp::connection_hdl hdl);

  const ApiHandler& handler_;
  HttpServerOptions options_;
  server_type server_;
};

}  // namespace earscope::app
