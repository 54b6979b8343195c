/**
 * @file json_rpc.cpp
 * @brief JSON-RPC 2.0 dispatcher implementation
 */

#include "ffmpeg_mcp/json_rpc.hpp"

#include <exception>
#include <utility>

#include <fmt/core.h>

#include "ffmpeg_mcp/logging.hpp"

namespace ffmpeg_mcp {

using json = nlohmann::json;

namespace {

bool is_valid_id(const json &id) {
  return id.is_null() || id.is_string() || id.is_number();
}

} // anonymous namespace

// **----- Envelopes -----**

json JsonRpcDispatcher::make_result(const json &id, json result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json JsonRpcDispatcher::make_error(const json &id, int code,
                                   const std::string &message) {
  return {{"jsonrpc", "2.0"},
          {"id", id},
          {"error", {{"code", code}, {"message", message}}}};
}

std::string JsonRpcDispatcher::format_execution_text(const ExecutionResult &r) {
  return fmt::format("FFmpeg execution {}\n\nExit Code: {}\n\nStdout:\n{}\n\n"
                     "Stderr:\n{}",
                     r.succeeded ? "succeeded" : "failed", r.exit_code,
                     r.stdout_text, r.stderr_text);
}

// **----- Entry points -----**

std::optional<json> JsonRpcDispatcher::handle(const std::string &body) {
  json message;
  try {
    message = json::parse(body);
  } catch (const json::parse_error &e) {
    LOG_WARN("Unparseable JSON-RPC body: {}", e.what());
    return make_error(nullptr, rpc_error::PARSE_ERROR, "Parse error");
  }
  return handle(message);
}

std::optional<json> JsonRpcDispatcher::handle(const json &message) {
  if (!message.is_object()) {
    return make_error(nullptr, rpc_error::INVALID_REQUEST, "Invalid Request");
  }

  bool has_id = message.contains("id");
  json id = has_id ? message.at("id") : json(nullptr);
  if (!is_valid_id(id)) {
    return make_error(nullptr, rpc_error::INVALID_REQUEST, "Invalid Request");
  }

  auto version = message.find("jsonrpc");
  if (version != message.end() && *version != "2.0") {
    return make_error(id, rpc_error::INVALID_REQUEST, "Invalid Request");
  }

  auto method_it = message.find("method");
  if (method_it == message.end() || !method_it->is_string()) {
    return make_error(id, rpc_error::INVALID_REQUEST, "Invalid Request");
  }
  std::string method = method_it->get<std::string>();

  LOG_INFO("Received MCP message: method={}, id={}", method,
           id.dump(-1, ' ', false, json::error_handler_t::replace));

  /// Notifications never get a response and never run the tool
  if (!has_id) {
    LOG_INFO("Notification acknowledged: {}", method);
    return std::nullopt;
  }

  json params = message.value("params", json::object());
  if (params.is_null())
    params = json::object();
  if (!params.is_object()) {
    return make_error(id, rpc_error::INVALID_PARAMS,
                      "Invalid parameters: params must be an object");
  }

  try {
    return dispatch(id, method, params);
  } catch (const std::exception &e) {
    LOG_ERROR("Error handling MCP message: {}", e.what());
    return make_error(id, rpc_error::INTERNAL_ERROR,
                      fmt::format("Internal error: {}", e.what()));
  }
}

// **----- Methods -----**

json JsonRpcDispatcher::dispatch(const json &id, const std::string &method,
                                 const json &params) {
  if (method == "initialize")
    return handle_initialize(id);
  if (method == "ping")
    return make_result(id, json::object());
  if (method == "tools/list")
    return handle_tools_list(id);
  if (method == "tools/call")
    return handle_tools_call(id, params);

  return make_error(id, rpc_error::METHOD_NOT_FOUND,
                    fmt::format("Method not found: {}", method));
}

json JsonRpcDispatcher::handle_initialize(const json &id) {
  return make_result(id, {{"protocolVersion", MCP_PROTOCOL_VERSION},
                          {"capabilities", {{"tools", json::object()}}},
                          {"serverInfo",
                           {{"name", SERVER_NAME},
                            {"version", SERVER_VERSION}}}});
}

json JsonRpcDispatcher::handle_tools_list(const json &id) {
  json tool = {{"name", RPC_TOOL_NAME},
               {"description", TOOL_DESCRIPTION},
               {"inputSchema", ToolService::input_schema()}};
  return make_result(id, {{"tools", json::array({tool})}});
}

json JsonRpcDispatcher::handle_tools_call(const json &id, const json &params) {
  std::string name;
  auto name_it = params.find("name");
  if (name_it != params.end() && name_it->is_string())
    name = name_it->get<std::string>();

  LOG_INFO("Tool call: {}", name);

  if (name != RPC_TOOL_NAME) {
    return make_error(id, rpc_error::METHOD_NOT_FOUND,
                      fmt::format("Tool not found: {}", name));
  }

  json arguments = params.value("arguments", json::object());
  if (arguments.is_null())
    arguments = json::object();

  ToolOutcome outcome = tools_.invoke(arguments);
  if (outcome.error) {
    return make_error(id, rpc_error::INVALID_PARAMS, outcome.error->message);
  }

  const ExecutionResult &r = outcome.result;
  json block = {{"type", "text"}, {"text", format_execution_text(r)}};
  return make_result(id, {{"content", json::array({block})},
                          {"isError", !r.succeeded}});
}

} // namespace ffmpeg_mcp
