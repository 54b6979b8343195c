/**
 * @file main.cpp
 * @brief Entry point for the FFmpeg MCP server
 *
 * @details Main entry point that handles:
 *
 *          - Command-line overrides of the bind address and port
 *
 *          - Wiring of limiter, tool service, dispatcher and HTTP server
 *
 *          - Clean shutdown on SIGINT/SIGTERM
 *
 * @note SIGINT and SIGTERM are blocked in every thread and consumed by a
 *       dedicated sigwait() thread, which stops the listener. Child
 *       processes get an empty signal mask back before exec.
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <exception>
#include <string>
#include <thread>

#include <pthread.h>

#include "ffmpeg_mcp/config.hpp"
#include "ffmpeg_mcp/execution_limiter.hpp"
#include "ffmpeg_mcp/http_server.hpp"
#include "ffmpeg_mcp/json_rpc.hpp"
#include "ffmpeg_mcp/logging.hpp"
#include "ffmpeg_mcp/media_info.hpp"
#include "ffmpeg_mcp/system.hpp"
#include "ffmpeg_mcp/tool_service.hpp"

using namespace ffmpeg_mcp;

namespace {

void log_banner(const std::string &host, int port, int slots) {
  LibraryVersions libs = linked_library_versions();
  std::string binary = find_executable("ffmpeg");

  LOG_PHASE("================== FFMPEG MCP SERVER ==================");
  LOG_INFO("Starting FFmpeg MCP Server on {}:{}", host, port);
  LOG_INFO("FFmpeg libraries: {} (avutil {}, avcodec {}, avformat {})",
           libs.ffmpeg, libs.avutil, libs.avcodec, libs.avformat);
  if (binary.empty()) {
    LOG_WARN("ffmpeg not found on PATH; every invocation will fail");
  } else {
    LOG_INFO("ffmpeg binary: {}", binary);
  }
  if (slots == 0) {
    LOG_INFO("Concurrent executions: unlimited");
  } else {
    LOG_INFO("Concurrent executions: {}", slots);
  }
  LOG_INFO("MCP Endpoints:");
  LOG_INFO("  - POST http://localhost:{}/ (JSON-RPC 2.0 - Main MCP Protocol)",
           port);
  LOG_INFO("  - GET  http://localhost:{}/mcp (REST - Server metadata)", port);
  LOG_INFO("  - GET  http://localhost:{}/mcp/tools (REST - Tool discovery)",
           port);
  LOG_INFO("  - POST http://localhost:{}/mcp/tools/{{toolName}}/invoke "
           "(REST - Tool invocation)",
           port);
  LOG_INFO("  - GET  http://localhost:{}/health (Health check)", port);
  LOG_PHASE("=======================================================");
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc > 3) {
    LOG_WARN("Usage: ./ffmpeg_mcp_server [host] [port]");
    return 1;
  }

  std::string host;
  int port = 0;
  int slots = 0;
  try {
    host = (argc >= 2) ? argv[1] : Config::host();
    port = (argc >= 3) ? std::stoi(argv[2]) : Config::port();
    slots = calculate_execution_slots();
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid configuration: {}", e.what());
    return 1;
  }
  if (port <= 0 || port > 65535) {
    LOG_ERROR("Invalid port: {}", port);
    return 1;
  }

  /// Block before any thread exists so every thread inherits the mask
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
  std::signal(SIGPIPE, SIG_IGN);

  ExecutionLimiter limiter(slots);
  ToolService tools(limiter);
  JsonRpcDispatcher rpc(tools);
  HttpServer server(tools, rpc);

  log_banner(host, port, slots);

  std::atomic<bool> stopping{false};
  std::thread signal_thread([&server, &stop_signals, &stopping]() {
    int sig = 0;
    if (sigwait(&stop_signals, &sig) == 0 && !stopping.load()) {
      LOG_WARN("Received signal {}, shutting down", sig);
    }
    stopping.store(true);
    server.stop();
  });

  bool ok = server.listen(host, port);
  if (!ok) {
    LOG_ERROR("Failed to listen on {}:{}", host, port);
  }

  /// Wake the signal thread if the listener ended on its own
  if (!stopping.exchange(true)) {
    pthread_kill(signal_thread.native_handle(), SIGTERM);
  }
  signal_thread.join();

  LOG_INFO("Server stopped");
  return ok ? 0 : 1;
}
