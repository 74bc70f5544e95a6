#pragma once

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <fcntl.h>
#include <unistd.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <cstdint>
#include <memory>
#include <string>

class Fd
{
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd &) = delete;
    Fd &operator=(const Fd &) = delete;

    Fd(Fd &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Fd &operator=(Fd &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ != -1; }

    int release()
    {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    void reset(int new_fd = -1)
    {
        if (fd_ != -1)
        {
            ::close(fd_);
        }
        fd_ = new_fd;
    }

private:
    int fd_{-1};
};

class Epoll
{
public:
    Epoll() : epfd_(::epoll_create1(0)) {}
    explicit Epoll(int epfd) : epfd_(epfd) {}

    int get() const { return epfd_.get(); }
    bool valid() const { return epfd_.valid(); }

    bool add(int fd, uint32_t events) { return ctl(EPOLL_CTL_ADD, fd, events); }
    bool mod(int fd, uint32_t events) { return ctl(EPOLL_CTL_MOD, fd, events); }
    bool del(int fd) { return ctl(EPOLL_CTL_DEL, fd, 0); }

private:
    bool ctl(int op, int fd, uint32_t events)
    {
        if (!epfd_.valid())
            return false;
        epoll_event ev{};
        ev.events = events;
        ev.data.fd = fd;
        return ::epoll_ctl(epfd_.get(), op, fd, &ev) == 0;
    }

    Fd epfd_;
};

// Non-blocking counter fd used to wake an epoll loop from other threads.
class EventFd
{
public:
    EventFd() : fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {}

    int get() const { return fd_.get(); }
    bool valid() const { return fd_.valid(); }

    void notify()
    {
        std::uint64_t one = 1;
        // A full counter already guarantees a wakeup.
        (void)!::write(fd_.get(), &one, sizeof(one));
    }

    void drain()
    {
        std::uint64_t value = 0;
        while (::read(fd_.get(), &value, sizeof(value)) > 0)
        {
        }
    }

private:
    Fd fd_;
};

inline int set_nonblocking(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1)
        return -1;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Pops the OpenSSL error queue into one line.
inline std::string ssl_error_string()
{
    std::string out;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0)
    {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty())
            out += "; ";
        out += buf;
    }
    return out;
}

struct SslDeleter
{
    void operator()(SSL *ssl) const
    {
        if (ssl)
        {
            SSL_free(ssl);
        }
    }
};

struct SslCtxDeleter
{
    void operator()(SSL_CTX *ctx) const
    {
        if (ctx)
        {
            SSL_CTX_free(ctx);
        }
    }
};

using SslPtr = std::unique_ptr<SSL, SslDeleter>;
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
