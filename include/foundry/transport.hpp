#ifndef FOUNDRY_TRANSPORT_HPP
#define FOUNDRY_TRANSPORT_HPP

#include "types.hpp"
#include "stream.hpp"

#include <memory>
#include <string>

namespace foundry {

/**
 * A response whose body is read incrementally.
 *
 * Status and headers are known once the transport returns the stream;
 * body bytes are pulled through next_chunk(). Destroying the stream
 * closes the connection.
 */
class ResponseStream : public ChunkSource {
public:
    virtual ~ResponseStream() {}

    virtual int status() const = 0;
    virtual const Headers& headers() const = 0;

    /** Upper bound for an error body read by read_all(). */
    static const size_t MAX_ERROR_BODY_BYTES = 64 * 1024;

    /**
     * Read the rest of the body, stopping once max_bytes have arrived.
     * The result is cut to max_bytes. Used to read error responses.
     */
    virtual std::string read_all(size_t max_bytes = MAX_ERROR_BODY_BYTES);
};

/**
 * One HTTP exchange, with no retry or auth policy of its own.
 *
 * Implementations report a failure to obtain a status by throwing
 * HttpError with status_code() == 0.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() {}

    virtual HttpResponse send(const HttpRequest& request) = 0;

    virtual std::unique_ptr<ResponseStream> open_stream(const HttpRequest& request) = 0;
};

/**
 * libcurl transport. send() runs a blocking easy transfer; open_stream()
 * drives a multi handle only while the caller pulls chunks, so nothing
 * runs in the background.
 */
class CurlTransport : public HttpTransport {
public:
    CurlTransport();

    HttpResponse send(const HttpRequest& request);

    std::unique_ptr<ResponseStream> open_stream(const HttpRequest& request);
};

} // namespace foundry

#endif // FOUNDRY_TRANSPORT_HPP
