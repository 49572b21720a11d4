#include "catch.hpp"

#include "scoring/CurlHttpTransport.hpp"
#include "scoring/RiskScoringClient.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

// Listens on an ephemeral loopback port. Connections complete in the kernel
// backlog, so a listener that never accepts behaves like a server that
// never answers.
class LoopbackListener {
public:
    LoopbackListener() {
        // Keep a proxy from the environment away from loopback traffic.
        setenv("no_proxy", "127.0.0.1", 1);
        setenv("NO_PROXY", "127.0.0.1", 1);

        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            throw std::runtime_error("socket failed");
        }

        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;

        socklen_t length = sizeof(address);
        if (bind(fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0
            || listen(fd_, 4) != 0
            || getsockname(fd_, reinterpret_cast<sockaddr*>(&address), &length) != 0) {
            close(fd_);
            throw std::runtime_error("loopback listener setup failed");
        }

        port_ = ntohs(address.sin_port);
    }

    ~LoopbackListener() { close(fd_); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    std::string Url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    // Accepts one connection, reads the whole request, sends the canned reply
    // and returns the raw request text.
    std::string ServeOnce(const std::string& reply) {
        const int client = accept(fd_, nullptr, nullptr);
        if (client < 0) {
            return {};
        }

        std::string request;
        char buffer[4096];
        std::string::size_type expected = std::string::npos;
        while (expected == std::string::npos || request.size() < expected) {
            const auto count = read(client, buffer, sizeof(buffer));
            if (count <= 0) {
                break;
            }
            request.append(buffer, static_cast<std::size_t>(count));

            const auto headerEnd = request.find("\r\n\r\n");
            if (expected == std::string::npos && headerEnd != std::string::npos) {
                std::string::size_type contentLength = 0;
                const auto field = request.find("Content-Length: ");
                if (field != std::string::npos && field < headerEnd) {
                    contentLength = std::stoul(request.substr(field + 16));
                }
                expected = headerEnd + 4 + contentLength;
            }
        }

        std::string::size_type written = 0;
        while (written < reply.size()) {
            const auto count = write(client, reply.data() + written, reply.size() - written);
            if (count <= 0) {
                break;
            }
            written += static_cast<std::size_t>(count);
        }

        close(client);
        return request;
    }

private:
    int fd_ = -1;
    unsigned short port_ = 0;
};

} // namespace

SCENARIO("a silent server is abandoned when the request timeout expires", "[scoring][http]") {
    scoring::CurlGlobalScope curlScope;
    LoopbackListener listener;
    scoring::CurlHttpTransport transport;

    GIVEN("a request with a half second timeout") {
        scoring::HttpRequest request;
        request.url = listener.Url("/v1/chat/completions");
        request.body = "{}";
        request.timeout = std::chrono::milliseconds(500);

        THEN("the transport gives up with an exception close to the deadline") {
            const auto start = std::chrono::steady_clock::now();
            REQUIRE_THROWS_AS(transport.Post(request), scoring::HttpTransportException);
            const auto elapsed = std::chrono::steady_clock::now() - start;

            REQUIRE(elapsed >= std::chrono::milliseconds(400));
            REQUIRE(elapsed < std::chrono::seconds(5));
        }
    }

    GIVEN("a request without a timeout") {
        scoring::HttpRequest request;
        request.url = listener.Url("/v1/chat/completions");
        request.timeout = std::chrono::milliseconds(0);

        THEN("it is refused before any connection is made") {
            REQUIRE_THROWS_AS(transport.Post(request), scoring::HttpTransportException);
        }
    }

    GIVEN("a scoring client pointed at the silent server") {
        scoring::ScoringConfig config;
        config.apiBase = listener.Url("/v1");
        config.apiKey = "secret-key";
        config.timeout = std::chrono::milliseconds(500);
        scoring::RiskScoringClient client{config, &transport};

        THEN("the analysis degrades to the service error fallback") {
            const auto analysis = client.Analyze("ls -la", scoring::ScoringContext{});

            REQUIRE(analysis.level == policy::SecurityLevel::Caution);
            REQUIRE(analysis.confidence == Approx(0.2));
            REQUIRE(analysis.riskFactors == std::vector<std::string>{"scoring service error"});
        }
    }
}

SCENARIO("the transport sends headers and body and passes any status through", "[scoring][http]") {
    scoring::CurlGlobalScope curlScope;
    LoopbackListener listener;
    scoring::CurlHttpTransport transport;

    scoring::HttpRequest request;
    request.url = listener.Url("/v1/chat/completions");
    request.headers = {{"Content-Type", "application/json"}, {"Authorization", "Bearer secret-key"}};
    request.body = "{\"model\":\"moonshot-v1-8k\"}";
    request.timeout = std::chrono::seconds(5);

    std::string received;
    std::thread server([&listener, &received] {
        received = listener.ServeOnce(
            "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 4\r\nConnection: close\r\n\r\nbusy");
    });

    scoring::HttpResponse response;
    try {
        response = transport.Post(request);
    } catch (const scoring::HttpTransportException&) {
        server.join();
        throw;
    }
    server.join();

    REQUIRE(response.status == 503);
    REQUIRE(response.body == "busy");

    REQUIRE(received.find("POST /v1/chat/completions HTTP/1.1\r\n") == 0);
    REQUIRE(received.find("\r\nContent-Type: application/json\r\n") != std::string::npos);
    REQUIRE(received.find("\r\nAuthorization: Bearer secret-key\r\n") != std::string::npos);
    REQUIRE(received.substr(received.size() - request.body.size()) == request.body);
}
