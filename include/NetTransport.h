#ifndef NET_TRANSPORT_H
#define NET_TRANSPORT_H

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <string>

// One accepted TCP peer. None of these calls may block.
class NetClient {
    public:
        virtual ~NetClient() {}

        virtual bool connected() = 0;

        // Bytes copied into buf; 0 when nothing is pending, -1 on error.
        virtual int read(uint8_t *buf, size_t len) = 0;

        // Bytes the stack accepted (may be fewer than len, or 0 when the
        // send buffer is full); -1 on error.
        virtual int write(const uint8_t *buf, size_t len) = 0;

        virtual void stop() = 0;

        virtual std::string remoteAddress() = 0;
};

class NetServer {
    public:
        virtual ~NetServer() {}

        virtual bool begin(uint16_t port) = 0;

        // Next pending client, or nullptr when none is waiting.
        virtual std::unique_ptr<NetClient> accept() = 0;
};

#endif
