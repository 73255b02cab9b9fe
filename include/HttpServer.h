#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include <memory>
#include <string>
#include <vector>

#include "AppConfig.h"
#include "NetTransport.h"

enum class Route : uint8_t { Dashboard, Status, Info, Events, NotFound };

struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::string version;
    bool headOnly;

    HttpRequest() : headOnly(false) {}
};

struct HttpResponse {
    uint16_t status;
    const char *contentType;
    std::string body;
    bool streaming; // keep the socket open and feed it events

    HttpResponse() : status(200), contentType("text/plain"), streaming(false) {}
};

// Implemented by whoever owns the data the routes expose (EventLoop).
class RequestDispatcher {
    public:
        virtual ~RequestDispatcher() {}

        virtual void dispatch(Route route, const HttpRequest &request,
                              HttpResponse &response) = 0;

        // For streaming connections: fill event and bump lastGeneration if a
        // newer snapshot exists. Returns false when there is nothing new.
        virtual bool nextEvent(uint32_t &lastGeneration, std::string &event) = 0;
};

enum class ConnPhase : uint8_t {
    AwaitingRequestLine,
    AwaitingHeaders,
    Dispatch,
    WritingResponse,
    Streaming,
    Closed
};

// Everything needed to resume one exchange on the next tick.
struct ConnectionState {
    uint32_t id;
    std::unique_ptr<NetClient> client;
    ConnPhase phase;
    std::string inbound;  // received, not yet parsed
    HttpRequest request;
    std::string outbound; // response bytes
    size_t written;       // offset into outbound
    uint64_t lastActivityMs;
    uint32_t streamGeneration;

    ConnectionState()
        : id(0), phase(ConnPhase::AwaitingRequestLine), written(0),
          lastActivityMs(0), streamGeneration(0) {}
};

class HttpServer {
    private:
        NetServer &listener;
        ServerConfig config;
        std::vector<std::unique_ptr<ConnectionState> > connections;
        uint32_t nextConnectionId;
        uint32_t rejectedCount;
        bool listening;

        void acceptPending(uint64_t nowMs);
        void advance(ConnectionState &conn, uint64_t nowMs,
                     RequestDispatcher &dispatcher);
        bool readAvailable(ConnectionState &conn, uint64_t nowMs);
        void parse(ConnectionState &conn);
        void dispatchRequest(ConnectionState &conn, RequestDispatcher &dispatcher);
        void feedStream(ConnectionState &conn, RequestDispatcher &dispatcher);
        void flush(ConnectionState &conn, uint64_t nowMs);
        void fail(ConnectionState &conn, uint16_t status);
        void close(ConnectionState &conn, const char *reason);

    public:
        HttpServer(NetServer &listener, const ServerConfig &config);

        // Opens the listening socket on config.port
        bool begin();

        // One scheduler tick: accept at most one client, then move every
        // open connection forward by one bounded read and one bounded write.
        void poll(uint64_t nowMs, RequestDispatcher &dispatcher);

        size_t activeConnections() const;
        uint32_t getRejectedCount() const;
        uint16_t getPort() const;
};

// --- Protocol helpers ---
Route matchRoute(const std::string &path);
bool parseRequestLine(const std::string &line, HttpRequest &out);
const char *statusText(uint16_t status);
std::string buildResponseHead(uint16_t status, const char *contentType,
                              size_t contentLength, bool streaming);

#endif
