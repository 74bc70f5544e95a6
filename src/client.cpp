#include <iostream>
#include <unistd.h>
#include <netinet/in.h>
#include <netdb.h>
#include <sys/socket.h>
#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>
#include <openssl/ssl.h>
#include <openssl/err.h>

#include <nlohmann/json.hpp>
#include "FdWrapper.hpp"
#include "HttpMessage.hpp"

constexpr int BUFFER_SIZE = 4096;
constexpr std::size_t MAX_BODY_SIZE = 1 << 20; // 1 MB per response.
constexpr const char *CERT_PATH = "config/cert.pem";
using json = nlohmann::json;

static bool write_all(SSL *ssl, const char *data, std::size_t len)
{
    std::size_t sent = 0;
    while (sent < len)
    {
        int ret = SSL_write(ssl, data + sent, static_cast<int>(len - sent));
        if (ret <= 0)
        {
            int err = SSL_get_error(ssl, ret);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                continue;
            return false;
        }
        sent += static_cast<std::size_t>(ret);
    }
    return true;
}

// Blocks until one full response has been read.
static bool read_response(SSL *ssl, std::string &recv_buffer, HttpResponse &response)
{
    while (true)
    {
        ParseResult parsed = parse_http_response(recv_buffer, MAX_BODY_SIZE, response);
        if (parsed.status == ParseStatus::Complete)
        {
            recv_buffer.erase(0, parsed.consumed);
            return true;
        }
        if (parsed.status != ParseStatus::Incomplete)
        {
            std::cerr << "Invalid response from server: " << parsed.error << "\n";
            return false;
        }

        char buffer[BUFFER_SIZE];
        int bytes = SSL_read(ssl, buffer, sizeof(buffer));
        if (bytes <= 0)
        {
            std::cerr << "Server disconnected.\n";
            return false;
        }
        recv_buffer.append(buffer, static_cast<std::size_t>(bytes));
    }
}

static void print_response(const HttpResponse &response)
{
    unsigned status = response.result_int();
    std::cout << (status < 400 ? "✅ " : "❌ ") << status << ' ' << response.reason() << "\n";
    for (const auto &field : response)
    {
        beast::string_view name = field.name_string();
        if (field.name() == http::field::retry_after || (name.size() > 2 && beast::iequals(name.substr(0, 2), "x-")))
            std::cout << "  " << name << ": " << field.value() << "\n";
    }

    try
    {
        json body = json::parse(response.body());
        if (body.contains("error"))
        {
            std::cout << "  [" << body["error"].get<std::string>() << "] " << body.value("message", "") << "\n";
        }
        else if (body.contains("completion"))
        {
            std::cout << "  💬 " << body["completion"].get<std::string>() << "\n";
        }
        else
        {
            std::cout << "  " << body.dump() << "\n";
        }
    }
    catch (const json::exception &)
    {
        std::cout << "  " << response.body() << "\n";
    }
}

static void print_usage(const char *prog)
{
    std::cerr << "Usage: " << prog << " <SERVER_ADDRESS> <PORT> health\n"
              << "       " << prog << " <SERVER_ADDRESS> <PORT> metrics\n"
              << "       " << prog << " <SERVER_ADDRESS> <PORT> generate <TOKENS> <PROMPT> [--session ID] [--repeat N]\n";
}

int main(int argc, char *argv[])
{
    if (argc < 4)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    const char *server_host = argv[1];
    const char *port_str = argv[2];
    std::string command = argv[3];

    HttpRequest request{http::verb::get, "", 11};
    request.set(http::field::host, std::string(server_host) + ":" + port_str);
    request.set(http::field::user_agent, "tokengate-client");
    int repeat = 1;

    if (command == "health" && argc == 4)
    {
        request.target("/health");
    }
    else if (command == "metrics" && argc == 4)
    {
        request.target("/metrics");
    }
    else if (command == "generate" && argc >= 6)
    {
        request.method(http::verb::post);
        request.target("/v1/generate");
        char *end = nullptr;
        long long tokens = std::strtoll(argv[4], &end, 10);
        if (*argv[4] == '\0' || *end != '\0' || tokens < 0)
        {
            std::cerr << "TOKENS must be a non-negative integer.\n";
            return EXIT_FAILURE;
        }
        json payload;
        payload["prompt"] = argv[5];
        payload["tokens"] = tokens;
        request.body() = payload.dump();
        request.set(http::field::content_type, "application/json");

        for (int i = 6; i < argc; ++i)
        {
            std::string_view arg(argv[i]);
            if (arg == "--session" && i + 1 < argc)
            {
                request.set("X-Session-Id", argv[++i]);
            }
            else if (arg == "--repeat" && i + 1 < argc)
            {
                repeat = std::atoi(argv[++i]);
                if (repeat <= 0)
                {
                    std::cerr << "--repeat must be positive.\n";
                    return EXIT_FAILURE;
                }
            }
            else
            {
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
        }
    }
    else
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;     // Allow IPv4 or IPv6.
    hints.ai_socktype = SOCK_STREAM; // TCP stream socket.
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo *result = nullptr;
    int gai_rc = getaddrinfo(server_host, port_str, &hints, &result);
    if (gai_rc != 0)
    {
        std::cerr << "Invalid address / Address not supported: " << gai_strerror(gai_rc) << "\n";
        return EXIT_FAILURE;
    }

    Fd sock;
    for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next)
    {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0)
            continue;
        if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0)
        {
            sock = Fd(fd);
            break;
        }
        ::close(fd);
    }
    freeaddrinfo(result);

    if (!sock.valid())
    {
        perror("Connection Failed");
        return EXIT_FAILURE;
    }

    SSL_library_init();
    SSL_load_error_strings();
    OpenSSL_add_all_algorithms();

    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx)
    {
        std::cerr << "Failed to create SSL_CTX\n";
        return EXIT_FAILURE;
    }

    if (SSL_CTX_load_verify_locations(ctx.get(), CERT_PATH, nullptr) == 1)
    {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    }
    else
    {
        // Dev-only fallback: skip verification if cert not provided locally.
        std::cerr << "⚠️  Could not load " << CERT_PATH << ", skipping verification (development only).\n";
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    }

    SslPtr ssl(SSL_new(ctx.get()));
    if (!ssl)
    {
        std::cerr << "Failed to create SSL object\n";
        return EXIT_FAILURE;
    }

    SSL_set_fd(ssl.get(), sock.get());
    SSL_set_tlsext_host_name(ssl.get(), server_host);
    if (SSL_connect(ssl.get()) <= 0)
    {
        ERR_print_errors_fp(stderr);
        return EXIT_FAILURE;
    }

    std::string wire = serialize_request(request);
    std::string recv_buffer;
    bool all_ok = true;

    for (int i = 0; i < repeat; ++i)
    {
        if (!write_all(ssl.get(), wire.data(), wire.size()))
        {
            std::cerr << "Failed to send request.\n";
            return EXIT_FAILURE;
        }

        HttpResponse response;
        if (!read_response(ssl.get(), recv_buffer, response))
            return EXIT_FAILURE;

        if (repeat > 1)
            std::cout << "#" << (i + 1) << " ";
        print_response(response);
        if (response.result_int() >= 300)
            all_ok = false;
        if (!response.keep_alive())
            break;
    }

    SSL_shutdown(ssl.get());
    return all_ok ? EXIT_SUCCESS : 1;
}
