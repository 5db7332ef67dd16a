#include "infrastructure/network/HttpClient.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

namespace portsy::infra {

namespace {

constexpr const char* kHeaderTerminator = "\r\n\r\n";
constexpr const char* kUserAgent = "portsy/1.0";

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool hasNoBody(core::HttpMethod method, int statusCode) {
    return method == core::HttpMethod::Head || (statusCode >= 100 && statusCode < 200) ||
           statusCode == 204 || statusCode == 304;
}

/**
 * One request/response exchange on a private io_context. All handlers run on
 * the thread calling run(), so the members need no synchronization.
 */
class Exchange {
public:
    Exchange(core::HttpMethod method, const asio::ip::tcp::endpoint& endpoint,
             std::string request, std::chrono::milliseconds timeout, size_t maxBodyBytes)
        : method_(method), endpoint_(endpoint), request_(std::move(request)), timeout_(timeout),
          maxBodyBytes_(maxBodyBytes), socket_(io_), timer_(io_) {}

    core::HttpResponse run() {
        started_ = std::chrono::steady_clock::now();

        timer_.expires_after(timeout_);
        timer_.async_wait([this](const asio::error_code& ec) {
            if (ec || finished_) {
                return;
            }
            timedOut_ = true;
            asio::error_code ignored;
            socket_.close(ignored);
        });

        socket_.async_connect(endpoint_, [this](const asio::error_code& ec) { onConnect(ec); });
        io_.run();

        asio::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);

        if (timedOut_ && !response_.success) {
            response_.errorMessage = "Request timed out after " +
                                     std::to_string(timeout_.count()) + "ms";
        }
        return response_;
    }

private:
    void finish() {
        finished_ = true;
        timer_.cancel();
    }

    void fail(const std::string& stage, const asio::error_code& ec) {
        if (!timedOut_) {
            response_.errorMessage = stage + ": " + ec.message();
        }
        finish();
    }

    void onConnect(const asio::error_code& ec) {
        if (ec) {
            fail("connect", ec);
            return;
        }
        asio::async_write(socket_, asio::buffer(request_),
                          [this](const asio::error_code& writeEc, std::size_t /*bytes*/) {
                              onWrite(writeEc);
                          });
    }

    void onWrite(const asio::error_code& ec) {
        if (ec) {
            fail("write", ec);
            return;
        }
        asio::async_read_until(socket_, buffer_, kHeaderTerminator,
                               [this](const asio::error_code& readEc, std::size_t bytes) {
                                   onHead(readEc, bytes);
                               });
    }

    void onHead(const asio::error_code& ec, std::size_t headBytes) {
        if (ec) {
            fail("read headers", ec);
            return;
        }

        std::string head(asio::buffers_begin(buffer_.data()),
                         asio::buffers_begin(buffer_.data()) +
                             static_cast<std::ptrdiff_t>(headBytes));
        buffer_.consume(headBytes);

        auto parsed = HttpClient::parseResponseHead(head);
        if (!parsed) {
            response_.errorMessage = "Malformed HTTP status line";
            finish();
            return;
        }

        response_.success = true;
        response_.statusCode = parsed->statusCode;
        response_.headers = std::move(parsed->headers);
        response_.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started_);

        if (hasNoBody(method_, parsed->statusCode)) {
            finish();
            return;
        }

        drainBody(parsed->contentLength);
    }

    void drainBody(std::optional<size_t> contentLength) {
        size_t buffered = buffer_.size();
        size_t target = contentLength ? std::min(*contentLength, maxBodyBytes_) : maxBodyBytes_;
        if (buffered >= target) {
            finish();
            return;
        }

        auto remaining = target - buffered;
        auto sink = std::make_shared<std::vector<char>>(remaining);
        asio::async_read(socket_, asio::buffer(*sink),
                         [this, sink](const asio::error_code& readEc, std::size_t /*bytes*/) {
                             if (readEc && readEc != asio::error::eof) {
                                 spdlog::debug("Body drain stopped early: {}", readEc.message());
                             }
                             finish();
                         });
    }

    core::HttpMethod method_;
    asio::ip::tcp::endpoint endpoint_;
    std::string request_;
    std::chrono::milliseconds timeout_;
    size_t maxBodyBytes_;

    asio::io_context io_;
    asio::ip::tcp::socket socket_;
    asio::steady_timer timer_;
    asio::streambuf buffer_;

    std::chrono::steady_clock::time_point started_;
    core::HttpResponse response_;
    bool finished_{false};
    bool timedOut_{false};
};

} // namespace

HttpClient::HttpClient(std::string address, size_t maxBodyBytes, int maxRedirects)
    : address_(std::move(address)), maxBodyBytes_(maxBodyBytes),
      maxRedirects_(std::max(maxRedirects, 0)) {}

std::string HttpClient::buildRequest(core::HttpMethod method, uint16_t port,
                                     const std::string& path) {
    std::ostringstream ss;
    ss << methodToString(method) << " " << (path.empty() ? "/" : path) << " HTTP/1.1\r\n";
    ss << "Host: localhost:" << port << "\r\n";
    ss << "User-Agent: " << kUserAgent << "\r\n";
    ss << "Accept: */*\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    return ss.str();
}

std::optional<ResponseHead> HttpClient::parseResponseHead(const std::string& head) {
    std::istringstream iss(head);
    std::string line;

    if (!std::getline(iss, line)) {
        return std::nullopt;
    }

    std::istringstream statusLine(trim(line));
    std::string version;
    std::string code;
    statusLine >> version >> code;
    if (version.rfind("HTTP/", 0) != 0 || code.size() != 3 ||
        !std::all_of(code.begin(), code.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return std::nullopt;
    }

    ResponseHead result;
    result.statusCode = std::stoi(code);

    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            continue;
        }

        auto name = trim(line.substr(0, colon));
        auto value = trim(line.substr(colon + 1));

        auto existing = std::find_if(result.headers.begin(), result.headers.end(),
                                     [&](const auto& entry) { return iequals(entry.first, name); });
        if (existing != result.headers.end()) {
            existing->second += ", " + value;
        } else {
            result.headers.emplace(name, value);
        }

        if (iequals(name, "Content-Length")) {
            try {
                result.contentLength = static_cast<size_t>(std::stoull(value));
            } catch (const std::exception&) {
                result.contentLength.reset();
            }
        }
    }

    return result;
}

bool HttpClient::isRedirect(int statusCode) {
    return statusCode == 301 || statusCode == 302 || statusCode == 303 || statusCode == 307 ||
           statusCode == 308;
}

std::optional<RedirectTarget> HttpClient::resolveRedirect(const std::string& location,
                                                          uint16_t port,
                                                          const std::string& path) {
    std::string target = trim(location);
    if (auto hash = target.find('#'); hash != std::string::npos) {
        target.erase(hash);
    }
    if (target.empty()) {
        return std::nullopt;
    }

    RedirectTarget next;
    next.port = port;

    std::string authority;
    bool hasAuthority = false;
    if (target.size() >= 7 && iequals(target.substr(0, 7), "http://")) {
        target.erase(0, 7);
        hasAuthority = true;
    } else if (target.rfind("//", 0) == 0) {
        target.erase(0, 2);
        hasAuthority = true;
    } else if (target.find("://") != std::string::npos) {
        return std::nullopt;
    }

    if (hasAuthority) {
        auto slash = target.find_first_of("/?");
        authority = target.substr(0, slash);
        target = slash == std::string::npos ? "/" : target.substr(slash);
        if (target.front() == '?') {
            target.insert(0, "/");
        }

        std::string host = authority;
        std::string portText;
        if (!host.empty() && host.front() == '[') {
            auto close = host.find(']');
            if (close == std::string::npos) {
                return std::nullopt;
            }
            if (close + 1 < host.size()) {
                if (host[close + 1] != ':') {
                    return std::nullopt;
                }
                portText = host.substr(close + 2);
            }
            host = host.substr(0, close + 1);
        } else if (auto colon = host.rfind(':'); colon != std::string::npos) {
            portText = host.substr(colon + 1);
            host.erase(colon);
        }

        if (!iequals(host, "localhost") && host != "127.0.0.1" && host != "[::1]") {
            return std::nullopt;
        }

        if (portText.empty()) {
            next.port = 80;
        } else {
            if (portText.size() > 5 ||
                !std::all_of(portText.begin(), portText.end(), [](char c) {
                    return std::isdigit(static_cast<unsigned char>(c));
                })) {
                return std::nullopt;
            }
            auto value = std::stoul(portText);
            if (value == 0 || value > 65535) {
                return std::nullopt;
            }
            next.port = static_cast<uint16_t>(value);
        }
        next.path = target;
        return next;
    }

    if (target.front() == '/') {
        next.path = target;
        return next;
    }

    // Relative reference: replace the last segment of the current path
    std::string base = path.substr(0, path.find('?'));
    if (target.front() == '?') {
        next.path = (base.empty() ? "/" : base) + target;
        return next;
    }
    auto lastSlash = base.rfind('/');
    next.path = (lastSlash == std::string::npos ? "/" : base.substr(0, lastSlash + 1)) + target;
    return next;
}

core::HttpResponse HttpClient::send(core::HttpMethod method, uint16_t port,
                                    const std::string& path,
                                    std::chrono::milliseconds timeout) const {
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(address_), port);
    Exchange exchange(method, endpoint, buildRequest(method, port, path), timeout,
                      maxBodyBytes_);
    return exchange.run();
}

core::HttpResponse HttpClient::request(core::HttpMethod method, uint16_t port,
                                       const std::string& path,
                                       std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    uint16_t hopPort = port;
    std::string hopPath = path.empty() ? "/" : path;

    try {
        for (int hop = 0;; ++hop) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                core::HttpResponse response;
                response.errorMessage = "Request timed out after " +
                                        std::to_string(timeout.count()) + "ms";
                spdlog::debug("HTTP {} :{}{} failed: {}", methodToString(method), port, path,
                              response.errorMessage);
                return response;
            }

            auto response = send(method, hopPort, hopPath, remaining);
            if (!response.success) {
                spdlog::debug("HTTP {} :{}{} failed: {}", methodToString(method), hopPort,
                              hopPath, response.errorMessage);
                return response;
            }
            if (!isRedirect(response.statusCode)) {
                return response;
            }

            auto location = std::find_if(
                response.headers.begin(), response.headers.end(),
                [](const auto& entry) { return iequals(entry.first, "Location"); });
            if (location == response.headers.end()) {
                return response;
            }

            auto next = resolveRedirect(location->second, hopPort, hopPath);
            if (!next) {
                spdlog::debug("HTTP {} :{}{} redirects off-host to '{}'", methodToString(method),
                              hopPort, hopPath, location->second);
                return response;
            }

            if (hop >= maxRedirects_) {
                core::HttpResponse failed;
                failed.errorMessage =
                    "Exceeded " + std::to_string(maxRedirects_) + " redirects";
                spdlog::debug("HTTP {} :{}{} failed: {}", methodToString(method), port, path,
                              failed.errorMessage);
                return failed;
            }

            spdlog::trace("HTTP {} :{}{} -> {} :{}{}", methodToString(method), hopPort, hopPath,
                          response.statusCode, next->port, next->path);
            hopPort = next->port;
            hopPath = std::move(next->path);
        }
    } catch (const std::exception& e) {
        core::HttpResponse response;
        response.errorMessage = e.what();
        spdlog::debug("HTTP {} :{}{} failed: {}", methodToString(method), port, path, e.what());
        return response;
    }
}

} // namespace portsy::infra
