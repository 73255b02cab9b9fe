#include "HttpServer.h"

#include <stdio.h>
#include <string.h>
#include <algorithm>
#include <new>
#include <utility>

#include "Log.h"

static const char *TAG = "WEB";

// --- ROUTE TABLE ---
struct RouteEntry {
  const char *path;
  Route route;
};

static const RouteEntry ROUTES[] = {
    {"/", Route::Dashboard},
    {"/index.html", Route::Dashboard},
    {"/status", Route::Status},
    {"/info", Route::Info},
    {"/events", Route::Events},
};

Route matchRoute(const std::string &path) {
  for (size_t i = 0; i < sizeof(ROUTES) / sizeof(ROUTES[0]); i++) {
    if (path == ROUTES[i].path) {
      return ROUTES[i].route;
    }
  }
  return Route::NotFound;
}

// "GET /status?x=1 HTTP/1.1"
bool parseRequestLine(const std::string &line, HttpRequest &out) {
  size_t sp1 = line.find(' ');
  if (sp1 == std::string::npos || sp1 == 0) {
    return false;
  }
  size_t sp2 = line.find(' ', sp1 + 1);
  if (sp2 == std::string::npos || sp2 == sp1 + 1) {
    return false;
  }
  if (line.find(' ', sp2 + 1) != std::string::npos) {
    return false;
  }

  std::string method = line.substr(0, sp1);
  std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
  std::string version = line.substr(sp2 + 1);

  for (size_t i = 0; i < method.size(); i++) {
    if (method[i] < 'A' || method[i] > 'Z') {
      return false;
    }
  }
  if (target[0] != '/') {
    return false;
  }
  if (version.compare(0, 7, "HTTP/1.") != 0 || version.size() != 8) {
    return false;
  }

  size_t q = target.find('?');
  out.method = method;
  out.path = target.substr(0, q);
  out.query = q == std::string::npos ? std::string() : target.substr(q + 1);
  out.version = version;
  out.headOnly = (method == "HEAD");
  return true;
}

const char *statusText(uint16_t status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 431:
    return "Request Header Fields Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

std::string buildResponseHead(uint16_t status, const char *contentType,
                              size_t contentLength, bool streaming) {
  char line[96];
  snprintf(line, sizeof(line), "HTTP/1.1 %u %s\r\n", (unsigned)status,
           statusText(status));

  std::string head(line);
  head += "Content-Type: ";
  head += contentType;
  head += "\r\n";
  if (!streaming) {
    snprintf(line, sizeof(line), "Content-Length: %lu\r\n",
             (unsigned long)contentLength);
    head += line;
  }
  if (status == 405) {
    head += "Allow: GET, HEAD\r\n";
  }
  head += "Cache-Control: no-cache\r\n";
  head += streaming ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
  head += "\r\n";
  return head;
}

// Constructor
HttpServer::HttpServer(NetServer &listener, const ServerConfig &config)
    : listener(listener), config(config), nextConnectionId(1),
      rejectedCount(0), listening(false) {}

bool HttpServer::begin() {
  listening = listener.begin(config.port);
  if (listening) {
    logInfo(TAG, "Listening on port %u", (unsigned)config.port);
  } else {
    logError(TAG, "Could not listen on port %u", (unsigned)config.port);
  }
  return listening;
}

void HttpServer::poll(uint64_t nowMs, RequestDispatcher &dispatcher) {
  if (!listening) {
    return;
  }

  acceptPending(nowMs);

  for (size_t i = 0; i < connections.size(); i++) {
    advance(*connections[i], nowMs, dispatcher);
  }

  connections.erase(
      std::remove_if(connections.begin(), connections.end(),
                     [](const std::unique_ptr<ConnectionState> &c) {
                       return c->phase == ConnPhase::Closed;
                     }),
      connections.end());
}

void HttpServer::acceptPending(uint64_t nowMs) {
  std::unique_ptr<NetClient> client;
  try {
    client = listener.accept();
  } catch (const std::bad_alloc &) {
    logError(TAG, "Out of memory accepting a client");
    return;
  }
  if (!client) {
    return;
  }

  if (connections.size() >= config.maxConnections) {
    // Best effort: one write attempt, then drop the socket
    rejectedCount++;
    try {
      const char *body = statusText(503);
      std::string msg =
          buildResponseHead(503, "text/plain", strlen(body), false);
      msg += body;
      if (client->write(static_cast<const uint8_t *>(
                            static_cast<const void *>(msg.data())),
                        msg.size()) < 0) {
        logDebug(TAG, "503 not delivered");
      }
    } catch (const std::bad_alloc &) {
      logDebug(TAG, "503 not sent, out of memory");
    }
    client->stop();
    logWarn(TAG, "Connection limit (%u) reached, rejected client",
            (unsigned)config.maxConnections);
    return;
  }

  std::unique_ptr<ConnectionState> conn(new (std::nothrow) ConnectionState());
  if (!conn) {
    rejectedCount++;
    client->stop();
    logError(TAG, "Out of memory, rejected client");
    return;
  }

  conn->id = nextConnectionId++;
  conn->client = std::move(client);
  conn->lastActivityMs = nowMs;
  try {
    connections.push_back(std::move(conn));
  } catch (const std::bad_alloc &) {
    // push_back left conn untouched
    rejectedCount++;
    conn->client->stop();
    logError(TAG, "Out of memory, rejected client");
    return;
  }
  logDebug(TAG, "#%lu connected", (unsigned long)connections.back()->id);
}

void HttpServer::advance(ConnectionState &conn, uint64_t nowMs,
                         RequestDispatcher &dispatcher) {
  // 1. Inbound: read what is there and parse as far as possible
  if (conn.phase == ConnPhase::AwaitingRequestLine ||
      conn.phase == ConnPhase::AwaitingHeaders) {
    try {
      if (!readAvailable(conn, nowMs)) {
        return;
      }
      parse(conn);
    } catch (const std::bad_alloc &) {
      close(conn, "out of memory reading request");
      return;
    }
  }

  // 2. Build the response once the request is complete
  if (conn.phase == ConnPhase::Dispatch) {
    dispatchRequest(conn, dispatcher);
  }

  // 3. Outbound: one partial write
  if (conn.phase == ConnPhase::Streaming) {
    if (!conn.client->connected()) {
      close(conn, "stream closed by client");
      return;
    }
    feedStream(conn, dispatcher);
  }
  if (conn.phase == ConnPhase::WritingResponse ||
      conn.phase == ConnPhase::Streaming) {
    flush(conn, nowMs);
  }

  // 4. Stalled peers are dropped. An idle stream with nothing queued
  // is waiting on us, not on the peer.
  if (conn.phase == ConnPhase::Streaming &&
      conn.written == conn.outbound.size()) {
    conn.lastActivityMs = nowMs;
  }
  if (conn.phase != ConnPhase::Closed &&
      nowMs - conn.lastActivityMs > config.clientTimeoutMs) {
    close(conn, "timeout");
  }
}

bool HttpServer::readAvailable(ConnectionState &conn, uint64_t nowMs) {
  uint8_t buf[256];
  size_t want = std::min(config.readChunkBytes, sizeof(buf));

  int n = conn.client->read(buf, want);
  if (n < 0) {
    close(conn, "read error");
    return false;
  }
  if (n == 0) {
    if (!conn.client->connected()) {
      close(conn, "client disconnected");
      return false;
    }
    return true;
  }

  conn.inbound.append(static_cast<const char *>(static_cast<void *>(buf)), n);
  conn.lastActivityMs = nowMs;

  if (conn.inbound.size() > config.maxRequestBytes) {
    fail(conn, 431);
    return false;
  }
  return true;
}

void HttpServer::parse(ConnectionState &conn) {
  while (conn.phase == ConnPhase::AwaitingRequestLine ||
         conn.phase == ConnPhase::AwaitingHeaders) {
    size_t eol = conn.inbound.find('\n');
    if (eol == std::string::npos) {
      return; // wait for more bytes on a later tick
    }

    std::string line = conn.inbound.substr(0, eol);
    conn.inbound.erase(0, eol + 1);
    if (!line.empty() && line[line.size() - 1] == '\r') {
      line.erase(line.size() - 1);
    }

    if (conn.phase == ConnPhase::AwaitingRequestLine) {
      if (line.empty()) {
        continue; // stray CRLF before the request line
      }
      if (!parseRequestLine(line, conn.request)) {
        fail(conn, 400);
        return;
      }
      conn.phase = ConnPhase::AwaitingHeaders;
    } else {
      if (line.empty()) {
        conn.inbound.clear(); // no bodies on GET/HEAD
        conn.phase = ConnPhase::Dispatch;
        return;
      }
      if (line.find(':') == std::string::npos) {
        fail(conn, 400);
        return;
      }
    }
  }
}

void HttpServer::dispatchRequest(ConnectionState &conn,
                                 RequestDispatcher &dispatcher) {
  const HttpRequest &req = conn.request;
  if (req.method != "GET" && req.method != "HEAD") {
    fail(conn, 405);
    return;
  }

  try {
    HttpResponse resp;
    Route route = matchRoute(req.path);
    if (route == Route::NotFound) {
      resp.status = 404;
      resp.contentType = "text/plain";
      resp.body = statusText(404);
    } else {
      dispatcher.dispatch(route, req, resp);
    }

    bool stream = resp.streaming && !req.headOnly;
    conn.outbound = buildResponseHead(resp.status, resp.contentType,
                                      resp.body.size(), stream);
    if (!req.headOnly) {
      conn.outbound += resp.body;
    }
    conn.written = 0;
    conn.phase = stream ? ConnPhase::Streaming : ConnPhase::WritingResponse;

    logDebug(TAG, "#%lu %s %s -> %u", (unsigned long)conn.id,
             req.method.c_str(), req.path.c_str(), (unsigned)resp.status);
  } catch (const std::bad_alloc &) {
    logError(TAG, "#%lu out of memory rendering %s",
             (unsigned long)conn.id, req.path.c_str());
    conn.outbound.clear();
    fail(conn, 500);
  }
}

void HttpServer::feedStream(ConnectionState &conn,
                            RequestDispatcher &dispatcher) {
  if (conn.written == conn.outbound.size()) {
    conn.outbound.clear();
    conn.written = 0;
  } else if (conn.written > config.maxStreamBacklog / 2) {
    conn.outbound.erase(0, conn.written);
    conn.written = 0;
  }

  // A slow reader skips frames; the next event always carries the latest
  if (conn.outbound.size() - conn.written >= config.maxStreamBacklog) {
    return;
  }

  // On allocation failure the frame is skipped and streamGeneration stays
  // put, so the next tick retries with the latest snapshot
  try {
    std::string event;
    uint32_t generation = conn.streamGeneration;
    if (dispatcher.nextEvent(generation, event)) {
      conn.outbound += event;
      conn.streamGeneration = generation;
    }
  } catch (const std::bad_alloc &) {
    logWarn(TAG, "#%lu out of memory, event skipped",
            (unsigned long)conn.id);
  }
}

void HttpServer::flush(ConnectionState &conn, uint64_t nowMs) {
  size_t pending = conn.outbound.size() - conn.written;
  if (pending > 0) {
    size_t chunk = std::min(pending, config.writeChunkBytes);
    int n = conn.client->write(
        static_cast<const uint8_t *>(
            static_cast<const void *>(conn.outbound.data())) + conn.written,
        chunk);
    if (n < 0) {
      close(conn, "write error");
      return;
    }
    if (n > 0) {
      conn.written += static_cast<size_t>(n);
      conn.lastActivityMs = nowMs;
    }
  }

  if (conn.phase == ConnPhase::WritingResponse &&
      conn.written == conn.outbound.size()) {
    close(conn, "done");
  }
}

void HttpServer::fail(ConnectionState &conn, uint16_t status) {
  logWarn(TAG, "#%lu %u %s", (unsigned long)conn.id, (unsigned)status,
          statusText(status));
  const char *body = statusText(status);
  conn.inbound.clear();
  try {
    conn.outbound =
        buildResponseHead(status, "text/plain", strlen(body), false);
    conn.outbound += body;
  } catch (const std::bad_alloc &) {
    close(conn, "out of memory");
    return;
  }
  conn.written = 0;
  conn.phase = ConnPhase::WritingResponse;
}

void HttpServer::close(ConnectionState &conn, const char *reason) {
  if (conn.client) {
    conn.client->stop();
  }
  conn.phase = ConnPhase::Closed;
  logDebug(TAG, "#%lu closed (%s)", (unsigned long)conn.id, reason);
}

size_t HttpServer::activeConnections() const { return connections.size(); }

uint32_t HttpServer::getRejectedCount() const { return rejectedCount; }

uint16_t HttpServer::getPort() const { return config.port; }
