// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the HTTP status and wake endpoint

#include <catch2/catch_test_macros.hpp>
#include "hosts/registry.hpp"
#include "network/packet_sender.hpp"
#include "network/status_server.hpp"
#include "network/wol_dispatcher.hpp"
#include "util/time.hpp"

#include <array>
#include <cerrno>

#include <asio.hpp>

using namespace lanwake;
using namespace lanwake::network;
using lanwake::hosts::HostRecord;
using lanwake::hosts::ProbeResult;
using lanwake::hosts::Registry;
using json = nlohmann::json;

namespace {

class CountingSender : public PacketSender {
public:
    std::string send(const std::string&, uint16_t, const uint8_t*, size_t) override {
        ++sends;
        return "";
    }

    int sends{0};
};

std::vector<HostRecord> TestHosts() {
    HostRecord nas;
    nas.canonical_key = "nas";
    nas.aliases = {"nas", "nas.lan"};
    nas.addresses = {"192.168.1.10"};
    nas.macs = {*util::MacAddress::Parse("00:11:22:33:44:55")};
    nas.preferred_name = "Storage";

    HostRecord router;
    router.canonical_key = "router";
    router.aliases = {"router"};
    router.addresses = {"192.168.1.1"};

    return {nas, router};
}

HttpRequest Request(const std::string& method, const std::string& target, const std::string& body = "",
                    const std::string& content_type = "") {
    std::string raw = method + " " + target + " HTTP/1.1\r\nHost: localhost\r\n";
    if (!content_type.empty()) {
        raw += "Content-Type: " + content_type + "\r\n";
    }
    raw += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    auto request = ParseHttpRequest(raw);
    REQUIRE(request);
    return *request;
}

// Blocking client: send raw bytes, read until the server closes
std::string Exchange(uint16_t port, const std::string& raw) {
    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    asio::write(socket, asio::buffer(raw));

    std::string response;
    std::array<char, 1024> buffer;
    asio::error_code ec;
    while (true) {
        size_t n = socket.read_some(asio::buffer(buffer), ec);
        if (ec) {
            break;
        }
        response.append(buffer.data(), n);
    }
    return response;
}

}  // namespace

TEST_CASE("Http: UrlDecode", "[network][http]") {
    REQUIRE(UrlDecode("nas") == std::string("nas"));
    REQUIRE(UrlDecode("a%20b+c") == std::string("a b c"));
    REQUIRE(UrlDecode("00%3A11%3a22") == std::string("00:11:22"));
    REQUIRE_FALSE(UrlDecode("%"));
    REQUIRE_FALSE(UrlDecode("%4"));
    REQUIRE_FALSE(UrlDecode("%zz"));
}

TEST_CASE("Http: ParseQueryString", "[network][http]") {
    auto query = ParseQueryString("host=nas.lan&x=1&&flag&bad=%zz&=orphan");
    REQUIRE(query.size() == 3);
    REQUIRE(query["host"] == "nas.lan");
    REQUIRE(query["x"] == "1");
    REQUIRE(query["flag"].empty());
}

TEST_CASE("Http: ParseHttpRequest", "[network][http]") {
    SECTION("Request line, headers, body and query") {
        auto request = ParseHttpRequest(
            "POST /network/wake?host=nas HTTP/1.1\r\nContent-Type: application/json\r\nContent-Length: 4\r\n\r\n{}xyz");
        REQUIRE(request);
        REQUIRE(request->method == "POST");
        REQUIRE(request->target == "/network/wake?host=nas");
        REQUIRE(request->path == "/network/wake");
        REQUIRE(request->query.at("host") == "nas");
        REQUIRE(request->headers.at("content-type") == "application/json");
        REQUIRE(request->body == "{}xy");
    }

    SECTION("Bare newlines are tolerated") {
        auto request = ParseHttpRequest("GET /network HTTP/1.0\nHost: x\n\n");
        REQUIRE(request);
        REQUIRE(request->path == "/network");
        REQUIRE(request->body.empty());
    }

    SECTION("Percent-encoded paths are decoded") {
        auto request = ParseHttpRequest("GET /network/nas%2Elan HTTP/1.1\r\n\r\n");
        REQUIRE(request);
        REQUIRE(request->path == "/network/nas.lan");
    }

    SECTION("Malformed requests") {
        REQUIRE_FALSE(ParseHttpRequest("GET /network HTTP/1.1\r\n"));
        REQUIRE_FALSE(ParseHttpRequest("GET /network\r\n\r\n"));
        REQUIRE_FALSE(ParseHttpRequest("GET network HTTP/1.1\r\n\r\n"));
        REQUIRE_FALSE(ParseHttpRequest("GET /network FTP/1.1\r\n\r\n"));
        REQUIRE_FALSE(ParseHttpRequest("GET /network HTTP/1.1\r\nno colon here\r\n\r\n"));
        REQUIRE_FALSE(ParseHttpRequest("POST /x HTTP/1.1\r\nContent-Length: 10\r\n\r\nshort"));
        REQUIRE_FALSE(ParseHttpRequest("POST /x HTTP/1.1\r\nContent-Length: abc\r\n\r\n"));
        REQUIRE_FALSE(ParseHttpRequest("GET /%zz HTTP/1.1\r\n\r\n"));
    }
}

TEST_CASE("Http: SerializeHttpResponse", "[network][http]") {
    HttpResponse response;
    response.status = 409;
    response.body = "{}\n";
    REQUIRE(SerializeHttpResponse(response) ==
            "HTTP/1.1 409 Conflict\r\nContent-Type: application/json\r\nContent-Length: 3\r\n"
            "Cache-Control: no-store\r\nConnection: close\r\n\r\n{}\n");
    REQUIRE(std::string(HttpReasonPhrase(503)) == "Service Unavailable");
    REQUIRE(std::string(HttpReasonPhrase(299)) == "Unknown");
}

TEST_CASE("StatusServer: AcceptRetryDelay", "[network][http]") {
    SECTION("Transient errors retry at once") {
        REQUIRE(AcceptRetryDelay(EINTR, 1).count() == 0);
        REQUIRE(AcceptRetryDelay(ECONNABORTED, 7).count() == 0);
    }

    SECTION("Descriptor exhaustion backs off and caps") {
        REQUIRE(AcceptRetryDelay(EMFILE, 1) == std::chrono::milliseconds(10));
        REQUIRE(AcceptRetryDelay(EMFILE, 2) == std::chrono::milliseconds(20));
        REQUIRE(AcceptRetryDelay(ENFILE, 3) == std::chrono::milliseconds(40));
        REQUIRE(AcceptRetryDelay(EMFILE, 6) == std::chrono::milliseconds(250));
        REQUIRE(AcceptRetryDelay(EMFILE, 1000) == std::chrono::milliseconds(250));
    }

    SECTION("Never zero for a persistent error") {
        for (int failures = 0; failures < 20; ++failures) {
            REQUIRE(AcceptRetryDelay(ENOBUFS, failures).count() > 0);
        }
    }
}

TEST_CASE("Http: HostViewToJson", "[network][http]") {
    util::MockTimeScope mock_time(1700000000);
    Registry registry(TestHosts());
    ProbeResult up;
    up.reachable = true;
    up.address = "192.168.1.10";
    up.detail = "connected to port 22";
    registry.update_state("nas", up, hosts::DebouncePolicy{});

    util::SetMockTime(1700000120);
    json j = HostViewToJson(*registry.view("nas"));

    REQUIRE(j["key"] == "nas");
    REQUIRE(j["name"] == "Storage");
    REQUIRE(j["aliases"] == json::array({"nas", "nas.lan"}));
    REQUIRE(j["addresses"] == json::array({"192.168.1.10"}));
    REQUIRE(j["macs"] == json::array({"00:11:22:33:44:55"}));
    REQUIRE(j["status"] == "online");
    REQUIRE(j["can_wake"] == true);
    REQUIRE(j["ignored"] == false);
    REQUIRE(j["last_probe_at"] == "2023-11-14T22:13:20Z");
    REQUIRE(j["last_online_at"] == "2023-11-14T22:13:20Z");
    REQUIRE(j["last_wake_attempt_at"].is_null());
    REQUIRE(j["last_seen"] == "2 m");
    REQUIRE(j["last_probe"]["address"] == "192.168.1.10");
    REQUIRE(j["last_probe"]["detail"] == "connected to port 22");
    REQUIRE(j["last_wake"].empty());

    SECTION("A host never probed") {
        json router = HostViewToJson(*registry.view("router"));
        REQUIRE(router["status"] == "unknown");
        REQUIRE(router["can_wake"] == false);
        REQUIRE(router["last_probe"].is_null());
        REQUIRE(router["last_seen"].is_null());
    }
}

TEST_CASE("Http: HandleRequest routes", "[network][http]") {
    util::MockTimeScope mock_time(1700000000);
    Registry registry(TestHosts());
    CountingSender sender;
    WolDispatcher dispatcher(registry, sender);

    SECTION("GET /network lists every host") {
        auto response = HandleRequest(Request("GET", "/network"), registry, dispatcher);
        REQUIRE(response.status == 200);
        REQUIRE(response.content_type == "application/json");
        json body = json::parse(response.body);
        REQUIRE(body.is_array());
        REQUIRE(body.size() == 2);
        REQUIRE(body[0]["key"] == "nas");
        REQUIRE(body[1]["key"] == "router");

        auto slash = HandleRequest(Request("GET", "/network/"), registry, dispatcher);
        REQUIRE(slash.status == 200);
    }

    SECTION("GET /network/<host> resolves any identifier") {
        for (const char* id : {"/network/nas", "/network/nas.lan", "/network/192.168.1.10",
                               "/network/00-11-22-33-44-55"}) {
            auto response = HandleRequest(Request("GET", id), registry, dispatcher);
            REQUIRE(response.status == 200);
            REQUIRE(json::parse(response.body)["key"] == "nas");
        }
        auto missing = HandleRequest(Request("GET", "/network/toaster"), registry, dispatcher);
        REQUIRE(missing.status == 404);
        REQUIRE(json::parse(missing.body)["error"] == "Unknown host");
    }

    SECTION("Wrong methods and paths") {
        REQUIRE(HandleRequest(Request("POST", "/network"), registry, dispatcher).status == 405);
        REQUIRE(HandleRequest(Request("GET", "/network/wake"), registry, dispatcher).status == 405);
        REQUIRE(HandleRequest(Request("DELETE", "/network/nas"), registry, dispatcher).status == 405);
        auto other = HandleRequest(Request("GET", "/"), registry, dispatcher);
        REQUIRE(other.status == 404);
        REQUIRE(json::parse(other.body)["error"] == "Not found");
    }
}

TEST_CASE("Http: POST /network/wake", "[network][http][wol]") {
    util::MockTimeScope mock_time(1700000000);
    Registry registry(TestHosts());
    CountingSender sender;
    WolDispatcher dispatcher(registry, sender);

    auto post = [&](const std::string& target, const std::string& body = "", const std::string& type = "") {
        return HandleRequest(Request("POST", target, body, type), registry, dispatcher);
    };

    SECTION("JSON body") {
        auto response = post("/network/wake", R"({"host": "nas.lan"})", "application/json");
        REQUIRE(response.status == 200);
        json body = json::parse(response.body);
        REQUIRE(body["host"] == "nas");
        REQUIRE(body["sent"] == 1);
        REQUIRE(body["results"].size() == 1);
        REQUIRE(body["results"][0]["mac"] == "00:11:22:33:44:55");
        REQUIRE(body["results"][0]["sent"] == true);
        REQUIRE(body["results"][0]["target"] == "255.255.255.255:9");
        REQUIRE(body["results"][0]["error"].is_null());
        REQUIRE_FALSE(body.contains("error"));
        REQUIRE(sender.sends == 1);

        SECTION("The attempt shows up in the status view") {
            json view = json::parse(HandleRequest(Request("GET", "/network/nas"), registry, dispatcher).body);
            REQUIRE(view["last_wake_attempt_at"] == "2023-11-14T22:13:20Z");
            REQUIRE(view["last_wake"].size() == 1);
        }
    }

    SECTION("Form body and query string") {
        REQUIRE(post("/network/wake", "host=00%3A11%3A22%3A33%3A44%3A55",
                     "application/x-www-form-urlencoded; charset=utf-8")
                    .status == 200);
        REQUIRE(post("/network/wake?host=nas").status == 200);
        REQUIRE(sender.sends == 2);
    }

    SECTION("Bad requests") {
        auto missing = post("/network/wake");
        REQUIRE(missing.status == 400);
        REQUIRE(json::parse(missing.body)["error"] == "Missing host");

        REQUIRE(json::parse(post("/network/wake", "{not json").body)["error"] == "Invalid JSON");
        REQUIRE(json::parse(post("/network/wake", "[1,2]").body)["error"] == "Expected a JSON object");
        REQUIRE(json::parse(post("/network/wake", R"({"host": 5})").body)["error"] ==
                "Missing or invalid host field");
        REQUIRE(post("/network/wake", R"({"host": ""})").status == 400);
        REQUIRE(sender.sends == 0);
    }

    SECTION("Unknown host") {
        auto response = post("/network/wake?host=toaster");
        REQUIRE(response.status == 404);
        json body = json::parse(response.body);
        REQUIRE(body["error"] == "unknown host");
        REQUIRE(body["host"] == "toaster");
    }

    SECTION("Host without a MAC") {
        auto response = post("/network/wake?host=router");
        REQUIRE(response.status == 409);
        json body = json::parse(response.body);
        REQUIRE(body["error"] == "no MAC address");
        REQUIRE(body["host"] == "router");
        REQUIRE(sender.sends == 0);
    }
}

TEST_CASE("StatusServer: Serves requests over TCP", "[network][http][server]") {
    Registry registry(TestHosts());
    CountingSender sender;
    WolDispatcher dispatcher(registry, sender);
    StatusServer server("127.0.0.1", 0, registry, dispatcher);

    REQUIRE(server.Start());
    REQUIRE(server.IsRunning());
    REQUIRE(server.port() != 0);

    SECTION("GET /network") {
        std::string response = Exchange(server.port(), "GET /network HTTP/1.1\r\nHost: localhost\r\n\r\n");
        REQUIRE(response.starts_with("HTTP/1.1 200 OK\r\n"));
        size_t body_start = response.find("\r\n\r\n");
        REQUIRE(body_start != std::string::npos);
        json body = json::parse(response.substr(body_start + 4));
        REQUIRE(body.size() == 2);
    }

    SECTION("POST /network/wake with a JSON body") {
        const std::string payload = R"({"host":"nas"})";
        std::string response = Exchange(server.port(), "POST /network/wake HTTP/1.1\r\nContent-Type: application/json\r\n"
                                                        "Content-Length: " +
                                                            std::to_string(payload.size()) + "\r\n\r\n" + payload);
        REQUIRE(response.starts_with("HTTP/1.1 200 OK\r\n"));
        REQUIRE(sender.sends == 1);
    }

    SECTION("Garbage gets a 400") {
        std::string response = Exchange(server.port(), "HELLO\r\n\r\n");
        REQUIRE(response.starts_with("HTTP/1.1 400 Bad Request\r\n"));
    }

    SECTION("Oversized bodies get a 413") {
        std::string response =
            Exchange(server.port(), "POST /network/wake HTTP/1.1\r\nContent-Length: 100000\r\n\r\n");
        REQUIRE(response.starts_with("HTTP/1.1 413 "));
    }

    server.Stop();
    REQUIRE_FALSE(server.IsRunning());
}
