#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/HttpClient.hpp"

using namespace portsy::core;
using namespace portsy::infra;

TEST_CASE("HttpClient buildRequest", "[HttpClient]") {
    SECTION("GET request line and headers") {
        auto request = HttpClient::buildRequest(HttpMethod::Get, 3000, "/health");

        REQUIRE(request.rfind("GET /health HTTP/1.1\r\n", 0) == 0);
        REQUIRE(request.find("Host: localhost:3000\r\n") != std::string::npos);
        REQUIRE(request.find("Connection: close\r\n") != std::string::npos);
        REQUIRE(request.size() >= 4);
        REQUIRE(request.substr(request.size() - 4) == "\r\n\r\n");
    }

    SECTION("HEAD request") {
        auto request = HttpClient::buildRequest(HttpMethod::Head, 8080, "/docs");
        REQUIRE(request.rfind("HEAD /docs HTTP/1.1\r\n", 0) == 0);
    }

    SECTION("Empty path becomes the root") {
        auto request = HttpClient::buildRequest(HttpMethod::Get, 80, "");
        REQUIRE(request.rfind("GET / HTTP/1.1\r\n", 0) == 0);
    }
}

TEST_CASE("HttpClient parseResponseHead", "[HttpClient]") {
    SECTION("Status code and headers") {
        auto head = HttpClient::parseResponseHead("HTTP/1.1 200 OK\r\n"
                                                  "Server: uvicorn\r\n"
                                                  "Content-Length: 12\r\n"
                                                  "\r\n");
        REQUIRE(head.has_value());
        REQUIRE(head->statusCode == 200);
        REQUIRE(head->headers.at("Server") == "uvicorn");
        REQUIRE(head->contentLength == 12u);
    }

    SECTION("Header values are trimmed") {
        auto head = HttpClient::parseResponseHead("HTTP/1.0 404 Not Found\r\n"
                                                  "X-Powered-By:   Express  \r\n\r\n");
        REQUIRE(head.has_value());
        REQUIRE(head->statusCode == 404);
        REQUIRE(head->headers.at("X-Powered-By") == "Express");
    }

    SECTION("Repeated headers are joined") {
        auto head = HttpClient::parseResponseHead("HTTP/1.1 200 OK\r\n"
                                                  "Set-Cookie: a=1\r\n"
                                                  "set-cookie: b=2\r\n\r\n");
        REQUIRE(head.has_value());
        REQUIRE(head->headers.size() == 1);
        REQUIRE(head->headers.at("Set-Cookie") == "a=1, b=2");
    }

    SECTION("Lines without a colon are ignored") {
        auto head = HttpClient::parseResponseHead("HTTP/1.1 302 Found\r\n"
                                                  "garbage\r\n"
                                                  "Location: /login\r\n\r\n");
        REQUIRE(head.has_value());
        REQUIRE(head->statusCode == 302);
        REQUIRE(head->headers.size() == 1);
    }

    SECTION("Missing or malformed Content-Length") {
        auto none = HttpClient::parseResponseHead("HTTP/1.1 200 OK\r\n\r\n");
        REQUIRE(none.has_value());
        REQUIRE_FALSE(none->contentLength.has_value());

        auto bad = HttpClient::parseResponseHead("HTTP/1.1 200 OK\r\nContent-Length: lots\r\n\r\n");
        REQUIRE(bad.has_value());
        REQUIRE_FALSE(bad->contentLength.has_value());
    }

    SECTION("Malformed status lines are rejected") {
        REQUIRE_FALSE(HttpClient::parseResponseHead("").has_value());
        REQUIRE_FALSE(HttpClient::parseResponseHead("SSH-2.0-OpenSSH_9.6\r\n\r\n").has_value());
        REQUIRE_FALSE(HttpClient::parseResponseHead("HTTP/1.1 OK\r\n\r\n").has_value());
        REQUIRE_FALSE(HttpClient::parseResponseHead("HTTP/1.1 20 OK\r\n\r\n").has_value());
    }
}

TEST_CASE("HttpClient resolveRedirect", "[HttpClient]") {
    SECTION("Absolute path stays on the same port") {
        auto next = HttpClient::resolveRedirect("/docs/", 8000, "/docs");
        REQUIRE(next == RedirectTarget{8000, "/docs/"});
    }

    SECTION("Relative reference replaces the last segment") {
        REQUIRE(HttpClient::resolveRedirect("login", 3000, "/admin/panel") ==
                RedirectTarget{3000, "/admin/login"});
        REQUIRE(HttpClient::resolveRedirect("login", 3000, "/") == RedirectTarget{3000, "/login"});
        REQUIRE(HttpClient::resolveRedirect("?page=2", 3000, "/items?page=1") ==
                RedirectTarget{3000, "/items?page=2"});
    }

    SECTION("Local absolute URLs may change port") {
        REQUIRE(HttpClient::resolveRedirect("http://localhost:5173/app", 3000, "/") ==
                RedirectTarget{5173, "/app"});
        REQUIRE(HttpClient::resolveRedirect("http://127.0.0.1:8080", 3000, "/") ==
                RedirectTarget{8080, "/"});
        REQUIRE(HttpClient::resolveRedirect("HTTP://[::1]:9000/x?y=1#frag", 3000, "/") ==
                RedirectTarget{9000, "/x?y=1"});
        REQUIRE(HttpClient::resolveRedirect("http://localhost/", 3000, "/") ==
                RedirectTarget{80, "/"});
        REQUIRE(HttpClient::resolveRedirect("//localhost:4000/a", 3000, "/") ==
                RedirectTarget{4000, "/a"});
    }

    SECTION("Remote, https and malformed targets are not followed") {
        REQUIRE_FALSE(HttpClient::resolveRedirect("http://example.com/", 3000, "/").has_value());
        REQUIRE_FALSE(HttpClient::resolveRedirect("https://localhost/", 3000, "/").has_value());
        REQUIRE_FALSE(HttpClient::resolveRedirect("http://localhost:99999/", 3000, "/").has_value());
        REQUIRE_FALSE(HttpClient::resolveRedirect("http://localhost:abc/", 3000, "/").has_value());
        REQUIRE_FALSE(HttpClient::resolveRedirect("   ", 3000, "/").has_value());
    }
}

TEST_CASE("HttpClient isRedirect", "[HttpClient]") {
    for (int status : {301, 302, 303, 307, 308}) {
        REQUIRE(HttpClient::isRedirect(status));
    }
    for (int status : {200, 300, 304, 305, 400, 404}) {
        REQUIRE_FALSE(HttpClient::isRedirect(status));
    }
}

TEST_CASE("HttpClient methodToString", "[HttpClient]") {
    REQUIRE(IHttpClient::methodToString(HttpMethod::Get) == "GET");
    REQUIRE(IHttpClient::methodToString(HttpMethod::Head) == "HEAD");
}
