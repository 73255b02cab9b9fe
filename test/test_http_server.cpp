#include <unity.h>
#include <stdio.h>
#include <string.h>
#include <ArduinoJson.h>

#include "DeviceRig.h"

void setUp(){}
void tearDown(){}

void test_get_status_lists_every_configured_pin(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock =
      rig.net.connect("GET /status HTTP/1.1\r\nHost: gpio-live.local\r\n\r\n");

  std::string raw = rig.exchange(sock);
  TEST_ASSERT_TRUE(sock->stopped);
  TEST_ASSERT_TRUE(startsWith(raw, "HTTP/1.1 200 OK\r\n"));
  TEST_ASSERT_NOT_NULL(strstr(raw.c_str(), "Content-Type: application/json\r\n"));

  DynamicJsonDocument doc(2048);
  TEST_ASSERT_FALSE(deserializeJson(doc, httpBody(raw)));
  JsonObject pins = doc["pins"];
  TEST_ASSERT_EQUAL_UINT32(4, pins.size());
  TEST_ASSERT_EQUAL_STRING("LOW", pins["D1"]["state"].as<const char*>());
  TEST_ASSERT_EQUAL_INT(0, pins["D1"]["value"].as<int>());
  TEST_ASSERT_EQUAL_STRING("HIGH", pins["D6"]["state"].as<const char*>());
  TEST_ASSERT_EQUAL_STRING("ANALOG", pins["D0"]["state"].as<const char*>());
  // permanently failing pin is still listed
  TEST_ASSERT_EQUAL_STRING("ERROR", pins["D9"]["state"].as<const char*>());
  TEST_ASSERT_TRUE(pins["D9"]["value"].isNull());
  TEST_ASSERT_EQUAL_UINT32(0, rig.server.activeConnections());
}

void test_dashboard_and_alias(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> a = rig.net.connect("GET / HTTP/1.1\r\n\r\n");
  std::shared_ptr<FakeSocket> b = rig.net.connect("GET /index.html HTTP/1.0\r\n\r\n");
  std::string pageA = rig.exchange(a);
  std::string pageB = rig.exchange(b);

  TEST_ASSERT_TRUE(startsWith(pageA, "HTTP/1.1 200 OK\r\n"));
  TEST_ASSERT_TRUE(startsWith(pageB, "HTTP/1.1 200 OK\r\n"));
  TEST_ASSERT_NOT_NULL(strstr(pageA.c_str(), "text/html"));
  TEST_ASSERT_NOT_NULL(strstr(pageA.c_str(), "id=\"pin-D9\""));
  TEST_ASSERT_NOT_NULL(strstr(pageB.c_str(), "id=\"pin-D0\""));
}

void test_info_reports_sentinels_and_clients(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> idle = rig.net.connect();
  rig.run(1, 1);
  std::shared_ptr<FakeSocket> sock = rig.net.connect("GET /info HTTP/1.1\r\n\r\n");

  std::string raw = rig.exchange(sock);
  TEST_ASSERT_TRUE(startsWith(raw, "HTTP/1.1 200 OK\r\n"));
  DynamicJsonDocument doc(2048);
  TEST_ASSERT_FALSE(deserializeJson(doc, httpBody(raw)));
  TEST_ASSERT_EQUAL_STRING("0.0.0.0", doc["ip"].as<const char*>());
  TEST_ASSERT_FALSE(doc["network_up"].as<bool>());
  TEST_ASSERT_EQUAL_UINT32(500, doc["sample_interval_ms"].as<uint32_t>());
  TEST_ASSERT_EQUAL_UINT32(2, doc["clients"].as<uint32_t>());
  TEST_ASSERT_FALSE(idle->stopped);
}

void test_unknown_path_is_404(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("GET /nope HTTP/1.1\r\n\r\n");
  std::string raw = rig.exchange(sock);
  TEST_ASSERT_TRUE(startsWith(raw, "HTTP/1.1 404 Not Found\r\n"));
  TEST_ASSERT_EQUAL_STRING("Not Found", httpBody(raw).c_str());
  TEST_ASSERT_TRUE(sock->stopped);
}

void test_malformed_request_gets_400_and_close(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("GARBAGE\r\n\r\n");
  std::string raw = rig.exchange(sock);
  TEST_ASSERT_TRUE(startsWith(raw, "HTTP/1.1 400 Bad Request\r\n"));
  TEST_ASSERT_TRUE(sock->stopped);
  TEST_ASSERT_EQUAL_UINT32(0, rig.server.activeConnections());

  std::shared_ptr<FakeSocket> noColon =
      rig.net.connect("GET / HTTP/1.1\r\nthis is not a header\r\n\r\n");
  TEST_ASSERT_TRUE(startsWith(rig.exchange(noColon), "HTTP/1.1 400 "));
}

void test_unsupported_method_is_405(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("POST /status HTTP/1.1\r\n\r\n");
  std::string raw = rig.exchange(sock);
  TEST_ASSERT_TRUE(startsWith(raw, "HTTP/1.1 405 Method Not Allowed\r\n"));
  TEST_ASSERT_NOT_NULL(strstr(raw.c_str(), "Allow: GET, HEAD\r\n"));
}

void test_head_sends_headers_only(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("HEAD /status HTTP/1.1\r\n\r\n");
  std::string raw = rig.exchange(sock);
  TEST_ASSERT_TRUE(startsWith(raw, "HTTP/1.1 200 OK\r\n"));
  TEST_ASSERT_NOT_NULL(strstr(raw.c_str(), "Content-Length: "));
  TEST_ASSERT_NULL(strstr(raw.c_str(), "Content-Length: 0\r\n"));
  TEST_ASSERT_EQUAL_UINT32(0, httpBody(raw).size());
}

void test_request_split_across_ticks(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("GET /sta");
  rig.run(3, 1);
  TEST_ASSERT_EQUAL_UINT32(0, sock->fromServer.size());
  TEST_ASSERT_FALSE(sock->stopped);

  sock->toServer += "tus HTTP/1.1\r\nHo";
  rig.run(2, 1);
  TEST_ASSERT_EQUAL_UINT32(0, sock->fromServer.size());

  sock->toServer += "st: x\n\n"; // bare LF line endings
  std::string raw = rig.exchange(sock);
  TEST_ASSERT_TRUE(startsWith(raw, "HTTP/1.1 200 OK\r\n"));
}

void test_oversized_request_is_431(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::string req = "GET / HTTP/1.1\r\nX-Filler: ";
  req.append(1200, 'a');
  std::shared_ptr<FakeSocket> sock = rig.net.connect(req);
  std::string raw = rig.exchange(sock);
  TEST_ASSERT_TRUE(startsWith(raw, "HTTP/1.1 431 "));
  TEST_ASSERT_TRUE(sock->stopped);
}

void test_idle_client_times_out(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("GET /status HTTP/1.1\r\n");
  rig.run(1, 1);
  TEST_ASSERT_EQUAL_UINT32(1, rig.server.activeConnections());

  rig.run(1, 4999);
  TEST_ASSERT_FALSE(sock->stopped);
  rig.run(1, 2);
  TEST_ASSERT_TRUE(sock->stopped);
  TEST_ASSERT_EQUAL_UINT32(0, rig.server.activeConnections());
}

void test_connection_limit_rejects_with_503(){
  Rig rig(2);
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> a = rig.net.connect();
  std::shared_ptr<FakeSocket> b = rig.net.connect();
  std::shared_ptr<FakeSocket> c = rig.net.connect();
  rig.run(3, 1);

  TEST_ASSERT_FALSE(a->stopped);
  TEST_ASSERT_FALSE(b->stopped);
  TEST_ASSERT_TRUE(c->stopped);
  TEST_ASSERT_TRUE(startsWith(c->fromServer, "HTTP/1.1 503 Service Unavailable\r\n"));
  TEST_ASSERT_EQUAL_UINT32(1, rig.server.getRejectedCount());
  TEST_ASSERT_EQUAL_UINT32(2, rig.server.activeConnections());
}

void test_partial_writes_resume_where_they_stopped(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("GET / HTTP/1.1\r\n\r\n");
  sock->maxWritePerCall = 7;

  std::string raw = rig.exchange(sock, 5000);
  TEST_ASSERT_TRUE(sock->stopped);
  std::string body = httpBody(raw);
  char expected[48];
  snprintf(expected, sizeof(expected), "Content-Length: %lu\r\n",
           (unsigned long)body.size());
  TEST_ASSERT_NOT_NULL(strstr(raw.c_str(), expected));
  TEST_ASSERT_NOT_NULL(strstr(body.c_str(), "</html>"));
}

void test_write_error_closes_connection(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("GET / HTTP/1.1\r\n\r\n");
  sock->failWrites = true;
  rig.run(1, 1);
  TEST_ASSERT_TRUE(sock->stopped);
  TEST_ASSERT_EQUAL_UINT32(0, rig.server.activeConnections());
}

void test_event_stream_pushes_each_generation(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("GET /events HTTP/1.1\r\n\r\n");
  rig.run(1, 1);

  TEST_ASSERT_TRUE(startsWith(sock->fromServer, "HTTP/1.1 200 OK\r\n"));
  TEST_ASSERT_NOT_NULL(strstr(sock->fromServer.c_str(), "Content-Type: text/event-stream\r\n"));
  TEST_ASSERT_NULL(strstr(sock->fromServer.c_str(), "Content-Length"));
  TEST_ASSERT_NOT_NULL(strstr(sock->fromServer.c_str(), "id: 1\ndata: {"));

  rig.run(50, 10); // one more sample at t=500
  TEST_ASSERT_NOT_NULL(strstr(sock->fromServer.c_str(), "id: 2\ndata: {"));

  // a live stream stays open past the client timeout
  rig.run(700, 10);
  TEST_ASSERT_FALSE(sock->stopped);
  TEST_ASSERT_EQUAL_UINT32(1, rig.server.activeConnections());

  sock->open = false;
  rig.run(1, 1);
  TEST_ASSERT_EQUAL_UINT32(0, rig.server.activeConnections());
}

void test_slow_clients_do_not_delay_sampling(){
  Rig rig(24);
  TEST_ASSERT_TRUE(rig.start());

  std::vector<std::shared_ptr<FakeSocket> > slow;
  for (int i = 0; i < 20; i++){
    std::shared_ptr<FakeSocket> s = rig.net.connect("GET / HTTP/1.1\r\n\r\n");
    s->maxWritePerCall = 1;
    slow.push_back(s);
  }

  rig.run(2000, 10); // 20 s, every client drains one byte per tick

  const LoopStats &stats = rig.loop.getStats();
  TEST_ASSERT_EQUAL_UINT32(41, stats.samples);
  TEST_ASSERT_EQUAL_UINT32(0, stats.lateSamples);
  TEST_ASSERT_TRUE(stats.maxLagMs <= 10);
  TEST_ASSERT_EQUAL_UINT32(41, rig.store.getGeneration());

  // still mid-response, none dropped
  TEST_ASSERT_EQUAL_UINT32(20, rig.server.activeConnections());
  for (size_t i = 0; i < slow.size(); i++){
    TEST_ASSERT_FALSE(slow[i]->stopped);
    TEST_ASSERT_TRUE(slow[i]->fromServer.size() > 1000);
  }

  // a fast client is still served promptly alongside them
  std::shared_ptr<FakeSocket> fast = rig.net.connect("GET /status HTTP/1.1\r\n\r\n");
  rig.run(1, 10);
  TEST_ASSERT_TRUE(fast->stopped);
  TEST_ASSERT_TRUE(startsWith(fast->fromServer, "HTTP/1.1 200 OK\r\n"));
}

void test_client_gone_mid_request_is_dropped(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("GET /sta");
  rig.run(1, 1);
  TEST_ASSERT_EQUAL_UINT32(1, rig.server.activeConnections());

  sock->open = false; // peer hangs up before the blank line
  rig.run(1, 1);
  TEST_ASSERT_TRUE(sock->stopped);
  TEST_ASSERT_EQUAL_UINT32(0, rig.server.activeConnections());
  TEST_ASSERT_EQUAL_UINT32(0, sock->fromServer.size());
}

void test_render_failure_answers_500(){
  Rig rig(8, 64); // too small for the status document
  TEST_ASSERT_TRUE(rig.start());
  std::shared_ptr<FakeSocket> sock = rig.net.connect("GET /status HTTP/1.1\r\n\r\n");

  std::string raw = rig.exchange(sock);
  TEST_ASSERT_TRUE(startsWith(raw, "HTTP/1.1 500 Internal Server Error\r\n"));
  TEST_ASSERT_NOT_NULL(strstr(raw.c_str(), "Content-Type: text/plain\r\n"));
  TEST_ASSERT_EQUAL_STRING("Internal Server Error", httpBody(raw).c_str());
  TEST_ASSERT_EQUAL_UINT32(1, rig.loop.getStats().renderFailures);

  // the dashboard needs no JSON and is still served
  std::shared_ptr<FakeSocket> page = rig.net.connect("GET / HTTP/1.1\r\n\r\n");
  TEST_ASSERT_TRUE(startsWith(rig.exchange(page), "HTTP/1.1 200 OK\r\n"));
  TEST_ASSERT_EQUAL_UINT32(1, rig.loop.getStats().renderFailures);
}

void test_late_tick_takes_one_sample_and_reanchors(){
  Rig rig;
  TEST_ASSERT_TRUE(rig.start()); // t=0, next due at 500
  TEST_ASSERT_EQUAL_UINT64(500, rig.loop.getNextSampleMs());

  rig.run(1, 1300); // stalled for more than two intervals
  const LoopStats &stats = rig.loop.getStats();
  TEST_ASSERT_EQUAL_UINT32(2, stats.samples);
  TEST_ASSERT_EQUAL_UINT32(1, stats.lateSamples);
  TEST_ASSERT_EQUAL_UINT32(800, stats.maxLagMs);
  TEST_ASSERT_EQUAL_UINT64(1800, rig.loop.getNextSampleMs());
  TEST_ASSERT_EQUAL_UINT32(2, rig.store.getGeneration());
  TEST_ASSERT_EQUAL_UINT64(1300, rig.store.current()->timestampMs);

  // back on cadence from the new anchor
  rig.run(1, 499);
  TEST_ASSERT_EQUAL_UINT32(2, stats.samples);
  rig.run(1, 1);
  TEST_ASSERT_EQUAL_UINT32(3, stats.samples);
  TEST_ASSERT_EQUAL_UINT32(1, stats.lateSamples);
  TEST_ASSERT_EQUAL_UINT64(2300, rig.loop.getNextSampleMs());
}

void test_request_line_parsing(){
  HttpRequest req;
  TEST_ASSERT_TRUE(parseRequestLine("GET /status?x=1 HTTP/1.1", req));
  TEST_ASSERT_EQUAL_STRING("/status", req.path.c_str());
  TEST_ASSERT_EQUAL_STRING("x=1", req.query.c_str());
  TEST_ASSERT_FALSE(req.headOnly);

  TEST_ASSERT_TRUE(parseRequestLine("HEAD / HTTP/1.0", req));
  TEST_ASSERT_TRUE(req.headOnly);

  TEST_ASSERT_FALSE(parseRequestLine("GET /", req));
  TEST_ASSERT_FALSE(parseRequestLine("get / HTTP/1.1", req));
  TEST_ASSERT_FALSE(parseRequestLine("GET status HTTP/1.1", req));
  TEST_ASSERT_FALSE(parseRequestLine("GET / HTTP/2", req));
  TEST_ASSERT_FALSE(parseRequestLine("GET  / HTTP/1.1", req));

  TEST_ASSERT_EQUAL(Route::Dashboard, matchRoute("/index.html"));
  TEST_ASSERT_EQUAL(Route::Events, matchRoute("/events"));
  TEST_ASSERT_EQUAL(Route::NotFound, matchRoute("/status/"));
}

int main(int, char**){
  UNITY_BEGIN();
  RUN_TEST(test_get_status_lists_every_configured_pin);
  RUN_TEST(test_dashboard_and_alias);
  RUN_TEST(test_info_reports_sentinels_and_clients);
  RUN_TEST(test_unknown_path_is_404);
  RUN_TEST(test_malformed_request_gets_400_and_close);
  RUN_TEST(test_unsupported_method_is_405);
  RUN_TEST(test_head_sends_headers_only);
  RUN_TEST(test_request_split_across_ticks);
  RUN_TEST(test_oversized_request_is_431);
  RUN_TEST(test_idle_client_times_out);
  RUN_TEST(test_connection_limit_rejects_with_503);
  RUN_TEST(test_partial_writes_resume_where_they_stopped);
  RUN_TEST(test_write_error_closes_connection);
  RUN_TEST(test_event_stream_pushes_each_generation);
  RUN_TEST(test_slow_clients_do_not_delay_sampling);
  RUN_TEST(test_client_gone_mid_request_is_dropped);
  RUN_TEST(test_render_failure_answers_500);
  RUN_TEST(test_late_tick_takes_one_sample_and_reanchors);
  RUN_TEST(test_request_line_parsing);
  return UNITY_END();
}
