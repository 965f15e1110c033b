/**
 * @file mock_stdio_server.cc
 * @brief Scriptable JSON-RPC child used by the process and bridge tests
 *
 * Speaks Content-Length framing on stdin/stdout. Methods:
 *   ping        result "pong"
 *   initialize  result with protocolVersion and serverInfo
 *   echo        result is the request params
 *   emit        sends notifications/message with the params, then answers
 *   ask         sends a server request (method + id) to the client, then answers
 *   slow        answers after params.ms milliseconds (default 200)
 *   log         writes params.text to stderr, then answers
 *   crash       exits with status 3 without answering
 *   anything else: -32601
 *
 * Environment:
 *   MOCK_EMIT_ON_START=1   send one notification before reading anything
 *   MOCK_IGNORE_INIT=1     never answer initialize
 *   MOCK_EXIT_AFTER=<n>    exit cleanly after answering n requests
 *   MOCK_IGNORE_SIGTERM=1  ignore SIGTERM and keep running after stdin closes,
 *                          so only SIGKILL ends the process
 */

#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "relay/codec/byte_stream.h"
#include "relay/codec/framing.h"

using namespace relay;

namespace {

bool envFlag(const char* name) {
  const char* value = std::getenv(name);
  return value && std::string(value) == "1";
}

void send(codec::ByteSink& out, const json::JsonValue& message) {
  auto written = codec::writeFrame(out, message);
  if (isError(written)) {
    std::cerr << "mock: write failed: " << errorOf(written).message
              << std::endl;
    std::exit(4);
  }
}

json::JsonValue result(const json::JsonValue& id, const json::JsonValue& value) {
  return json::JsonObjectBuilder()
      .add("jsonrpc", "2.0")
      .add("id", id)
      .add("result", value)
      .build();
}

json::JsonValue notification(const json::JsonValue& params) {
  return json::JsonObjectBuilder()
      .add("jsonrpc", "2.0")
      .add("method", "notifications/message")
      .add("params", params)
      .build();
}

}  // namespace

int main() {
  codec::FdByteSource in(STDIN_FILENO);
  codec::FdByteSink out(STDOUT_FILENO);

  const bool ignore_init = envFlag("MOCK_IGNORE_INIT");
  const bool ignore_sigterm = envFlag("MOCK_IGNORE_SIGTERM");
  if (ignore_sigterm) {
    std::signal(SIGTERM, SIG_IGN);
  }
  int exit_after = -1;
  if (const char* value = std::getenv("MOCK_EXIT_AFTER")) {
    exit_after = std::atoi(value);
  }

  if (envFlag("MOCK_EMIT_ON_START")) {
    send(out, notification(json::JsonObjectBuilder()
                               .add("level", "info")
                               .add("data", "starting")
                               .build()));
  }

  std::cerr << "mock: ready" << std::endl;

  int answered = 0;
  while (true) {
    json::JsonValue request;
    try {
      request = codec::readFrame(in);
    } catch (const codec::FramingError& e) {
      if (e.kind() == codec::FramingError::Kind::EndOfStream) {
        while (ignore_sigterm) {
          std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        return 0;
      }
      std::cerr << "mock: " << e.what() << std::endl;
      return 2;
    }

    std::string method;
    if (auto field = request.find("method")) {
      method = field->getString("");
    }
    json::JsonValue id = request.find("id").value_or(json::JsonValue::null());
    json::JsonValue params =
        request.find("params").value_or(json::JsonValue::object());

    if (method == "crash") {
      std::cerr << "mock: crashing on request" << std::endl;
      std::_Exit(3);
    }

    if (method == "ping") {
      send(out, result(id, "pong"));
    } else if (method == "initialize") {
      if (ignore_init) {
        continue;
      }
      send(out, result(id, json::JsonObjectBuilder()
                               .add("protocolVersion", "2024-11-05")
                               .add("capabilities", json::JsonValue::object())
                               .add("serverInfo",
                                    json::JsonObjectBuilder()
                                        .add("name", "mock-stdio-server")
                                        .add("version", "1.0.0")
                                        .build())
                               .build()));
    } else if (method == "echo") {
      send(out, result(id, params));
    } else if (method == "emit") {
      send(out, notification(params));
      if (!id.isNull()) {
        send(out, result(id, "emitted"));
      }
    } else if (method == "ask") {
      send(out, json::JsonObjectBuilder()
                    .add("jsonrpc", "2.0")
                    .add("id", "server-req-1")
                    .add("method", "sampling/createMessage")
                    .add("params", params)
                    .build());
      send(out, result(id, "asked"));
    } else if (method == "slow") {
      int ms = 200;
      if (params.isObject()) {
        if (auto delay = params.find("ms")) {
          ms = delay->getInt(200);
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(ms));
      send(out, result(id, "slow done"));
    } else if (method == "log") {
      auto text = params.isObject() ? params.find("text") : nullopt;
      std::cerr << (text ? text->getString("") : std::string()) << std::endl;
      send(out, result(id, "logged"));
    } else if (!id.isNull()) {
      send(out, json::JsonObjectBuilder()
                    .add("jsonrpc", "2.0")
                    .add("id", id)
                    .add("error", json::JsonObjectBuilder()
                                      .add("code", -32601)
                                      .add("message", "Method not found")
                                      .build())
                    .build());
    }

    if (!id.isNull() && exit_after > 0 && ++answered >= exit_after) {
      return 0;
    }
  }
}
