#include <earscope/app/http_server.hpp>
#include <earscope/core/log.hpp>
#include <algorithm>
#include <exception>
#include <thread>
#include <vector>

namespace earscope::app {

namespace {

void add_cors_headers(HttpServer::server_type::connection_ptr& con) {
  con->append_header("Access-Control-Allow-Origin", "*");
  con->append_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  con->append_header("Access-Control-Allow-Headers", "Content-Type");
}

}  // namespace

HttpServer::HttpServer(const ApiHandler& handler, HttpServerOptions options)
    : handler_(handler), options_(std::move(options)) {
  server_.clear_access_channels(websocketpp::log::alevel::all);
  server_.clear_error_channels(websocketpp::log::elevel::all);
  server_.set_error_channels(websocketpp::log::elevel::warn | websocketpp::log::elevel::rerror |
                             websocketpp::log::elevel::fatal);
  server_.init_asio();
  server_.set_reuse_addr(true);
  server_.set_max_http_body_size(options_.max_body_bytes);
  server_.set_http_handler([this](websocketpp::connection_hdl hdl) { on_http(hdl); });
}

void HttpServer::on_http(websocketpp::connection_hdl hdl) {
  auto con = server_.get_con_from_hdl(hdl);
  const std::string& method = con->get_request().get_method();

  HttpResponse response;
  try {
    response = handler_.handle(method, con->get_resource(), con->get_request_body());
  } catch (const std::exception& e) {
    EARSCOPE_LOG_ERROR << method << " " << con->get_resource() << " failed: " << e.what();
    response = HttpResponse{500, R"({"error":"internal error","type":"InternalError"})",
                            "application/json"};
  }

  EARSCOPE_LOG_DEBUG << method << " " << con->get_resource() << " -> " << response.status;
  add_cors_headers(con);
  if (!response.body.empty()) {
    con->append_header("Content-Type", response.content_type);
  }
  con->set_body(response.body);
  con->set_status(static_cast<websocketpp::http::status_code::value>(response.status));
}

void HttpServer::run() {
  server_.listen(options_.host, std::to_string(options_.port));
  server_.start_accept();
  EARSCOPE_LOG_INFO << "listening on " << options_.host << ":" << options_.port << " ("
                    << options_.threads << " thread(s))";

  const std::size_t workers = std::max<std::size_t>(options_.threads, 1);
  std::vector<std::thread> threads;
  threads.reserve(workers - 1);
  for (std::size_t i = 1; i < workers; ++i) {
    threads.emplace_back([this]() { server_.run(); });
  }
  server_.run();
  for (auto& t : threads) {
    t.join();
  }
}

void HttpServer::stop() {
  websocketpp::lib::error_code ec;
  server_.stop_listening(ec);
  if (ec) {
    EARSCOPE_LOG_WARN << "stop_listening: " << ec.message();
  }
  server_.stop();
}

}  // namespace earscope::app
