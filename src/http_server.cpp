/**
 * @file http_server.cpp
 * @brief HTTP routes implementation
 */

#include "ffmpeg_mcp/http_server.hpp"

#include <algorithm>
#include <exception>

#include <fmt/core.h>

#include "ffmpeg_mcp/config.hpp"
#include "ffmpeg_mcp/logging.hpp"
#include "ffmpeg_mcp/media_info.hpp"
#include "ffmpeg_mcp/system.hpp"

namespace ffmpeg_mcp {

using json = nlohmann::json;

namespace {

constexpr const char *JSON_TYPE = "application/json";

void send_json(httplib::Response &res, int status, const json &body) {
  res.status = status;
  res.set_content(dump_json(body), JSON_TYPE);
}

void send_detail(httplib::Response &res, int status,
                 const std::string &detail) {
  send_json(res, status, {{"detail", detail}});
}

json build_metadata() {
  LibraryVersions libs = linked_library_versions();
  std::string binary = find_executable("ffmpeg");

  return {{"name", SERVER_NAME},
          {"version", SERVER_VERSION},
          {"description", "MCP server for executing FFmpeg commands safely"},
          {"protocol", "mcp/http"},
          {"capabilities",
           {{"tools", true}, {"resources", false}, {"prompts", false}}},
          {"vendor", {{"name", "FFmpeg MCP"}}},
          {"ffmpeg",
           {{"binary", binary.empty() ? json(nullptr) : json(binary)},
            {"version", libs.ffmpeg},
            {"libavutil", libs.avutil},
            {"libavcodec", libs.avcodec},
            {"libavformat", libs.avformat}}}};
}

} // anonymous namespace

std::string dump_json(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// **----- Construction -----**

HttpServer::HttpServer(ToolService &tools, JsonRpcDispatcher &rpc)
    : tools_(tools), rpc_(rpc), metadata_(build_metadata()),
      worker_threads_(worker_thread_count(tools.limiter().capacity(),
                                          Config::http_worker_threads())) {
  size_t workers = worker_threads_;
  server_.new_task_queue = [workers] {
    return new httplib::ThreadPool(workers);
  };
  LOG_INFO("HTTP worker threads: {}", workers);

  server_.set_payload_max_length(Config::max_request_bytes());
  server_.set_read_timeout(Config::http_read_timeout_sec(), 0);
  server_.set_write_timeout(Config::http_write_timeout_sec(), 0);

  server_.set_logger([](const httplib::Request &req,
                        const httplib::Response &res) {
    LOG_INFO("{} {} -> {}", req.method, req.path, res.status);
  });

  register_routes();
}

bool HttpServer::listen(const std::string &host, int port) {
  return server_.listen(host, port);
}

int HttpServer::bind_to_any_port(const std::string &host) {
  return server_.bind_to_any_port(host);
}

bool HttpServer::listen_after_bind() { return server_.listen_after_bind(); }

void HttpServer::stop() { server_.stop(); }

size_t HttpServer::worker_thread_count(int execution_slots, int configured) {
  if (configured > 0)
    return static_cast<size_t>(configured);

  size_t base = static_cast<size_t>(CPPHTTPLIB_THREAD_POOL_COUNT);
  if (execution_slots <= 0)
    return base + RESERVED_HTTP_WORKERS;
  return std::max(base, static_cast<size_t>(execution_slots) +
                            RESERVED_HTTP_WORKERS);
}

// **----- Bodies -----**

json HttpServer::rest_tools() {
  json tool = {{"name", REST_TOOL_NAME},
               {"description", TOOL_DESCRIPTION},
               {"inputSchema", ToolService::input_schema()}};
  return {{"tools", json::array({tool})}};
}

json HttpServer::health() {
  return {{"status", "healthy"}, {"service", SERVER_NAME}};
}

json HttpServer::rest_result(const ExecutionResult &r) {
  json out = {{"success", r.succeeded},
              {"exitCode", r.exit_code},
              {"logs", {{"stdout", r.stdout_text}, {"stderr", r.stderr_text}}}};
  if (r.error_message)
    out["error"] = *r.error_message;
  return out;
}

// **----- Routes -----**

void HttpServer::register_routes() {
  /// JSON-RPC 2.0
  server_.Post("/", [this](const httplib::Request &req,
                           httplib::Response &res) {
    try {
      auto response = rpc_.handle(req.body);
      if (!response) {
        res.status = 202;
        return;
      }
      send_json(res, 200, *response);
    } catch (const std::exception &e) {
      LOG_ERROR("Error handling MCP message: {}", e.what());
      send_json(res, 200,
                JsonRpcDispatcher::make_error(
                    nullptr, rpc_error::INTERNAL_ERROR,
                    fmt::format("Internal error: {}", e.what())));
    }
  });

  /// Server metadata
  server_.Get("/mcp", [this](const httplib::Request &, httplib::Response &res) {
    send_json(res, 200, metadata_);
  });

  /// Tool discovery
  server_.Get("/mcp/tools", [](const httplib::Request &,
                               httplib::Response &res) {
    send_json(res, 200, rest_tools());
  });

  /// Tool invocation
  server_.Post(R"(/mcp/tools/([^/]+)/invoke)",
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_invoke(req, res);
               });

  /// Liveness
  server_.Get("/health", [](const httplib::Request &, httplib::Response &res) {
    send_json(res, 200, health());
  });
}

void HttpServer::handle_invoke(const httplib::Request &req,
                               httplib::Response &res) {
  std::string tool_name = req.matches[1];
  LOG_INFO("Tool invocation request: {}", tool_name);

  if (tool_name != REST_TOOL_NAME) {
    send_detail(res, 404, fmt::format("Tool not found: {}", tool_name));
    return;
  }

  try {
    json body;
    try {
      body = json::parse(req.body);
    } catch (const json::parse_error &e) {
      send_detail(res, 400, fmt::format("Invalid JSON body: {}", e.what()));
      return;
    }

    if (!body.is_object() || !body.contains("arguments")) {
      send_detail(res, 400, "Request body must contain 'arguments'");
      return;
    }

    ToolOutcome outcome = tools_.invoke(body.at("arguments"));
    if (outcome.error) {
      send_detail(res, 400, outcome.error->message);
      return;
    }

    const ExecutionResult &r = outcome.result;
    json text = {{"type", "text"},
                 {"text", fmt::format("FFmpeg execution {}",
                                      r.succeeded ? "succeeded" : "failed")}};
    send_json(res, 200,
              {{"content", json::array({text})}, {"result", rest_result(r)}});
  } catch (const std::exception &e) {
    LOG_ERROR("Unexpected error: {}", e.what());
    send_detail(res, 500, fmt::format("Internal server error: {}", e.what()));
  }
}

} // namespace ffmpeg_mcp
