/*
 * The MIT License (MIT)
 *
 * Copyright (c) 2025 Yaroslav Riabtsev <yaroslav.riabtsev@rwth-aachen.de>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NON-INFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef HERMES_CLIENT_HPP
#define HERMES_CLIENT_HPP

#include "config.hpp"
#include "error_codes.hpp"
#include "http_client.hpp"
#include "metric_dispatcher.hpp"
#include "metrics.hpp"
#include "request.hpp"

#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace hermespace {
/**
 * @struct response
 * @brief Outcome of one round trip as seen by the caller.
 *
 * A transport failure leaves `status` at 0 and fills `error_code` and
 * `error` with the classified failure. A failure while the body was read
 * keeps the head (status, headers) and fills the error fields as well.
 */
struct response {
    long status = 0;
    std::string remote_ip; ///< "ip:port" of the peer.
    std::string url;
    corespace::header_map headers;
    /// Unset for `response_type::none`, 1xx, 204 and 304 responses.
    std::optional<std::string> body;
    corespace::response_type type = corespace::response_type::text;
    corespace::error_code error_code = corespace::error_code::none;
    std::string error;

    /**
     * @brief Parse the body as JSON.
     * @throws std::invalid_argument if there is no body or it is not JSON.
     */
    [[nodiscard]] nlohmann::json json() const;
};

/**
 * @class client
 * @brief Request engine: sends request definitions through a shared
 * transport and reports every round trip to a metric dispatcher.
 *
 * Each send:
 *  1. leases a transfer handle from the definition's pool (a fresh one is
 *     set up completely, a cached one only gets method, body and keep-alive
 *     reset);
 *  2. emits the request staged by the previous send;
 *  3. performs the transfer and stages this request with its trail;
 *  4. returns the handle to the pool.
 *
 * The last staged request is emitted by `flush` or the destructor.
 *
 * Thread-safety:
 *  - Sends may run concurrently; the dispatcher serializes staging and
 *    emission.
 */
class client {
public:
    /**
     * @throws std::invalid_argument if @p config is invalid or @p state is
     *         null.
     * @throws std::runtime_error if libcurl cannot be initialized.
     */
    client(
        corespace::client_config config,
        std::shared_ptr<const corespace::run_state> state
    );
    ~client();
    client(const client&) = delete;
    client& operator=(const client&) = delete;

    response get(request& req) {
        return send(req, corespace::http_method::get);
    }
    response head(request& req) {
        return send(req, corespace::http_method::head);
    }
    response post(request& req) {
        return send(req, corespace::http_method::post);
    }
    response put(request& req) {
        return send(req, corespace::http_method::put);
    }
    response patch(request& req) {
        return send(req, corespace::http_method::patch);
    }
    response del(request& req) {
        return send(req, corespace::http_method::del);
    }
    response options(request& req) {
        return send(req, corespace::http_method::options);
    }

    /**
     * @brief Send @p req with @p method.
     *
     * A body is attached only for methods other than GET and HEAD.
     *
     * @throws corespace::request_error on a failed round trip if the request
     *         has `throw_on_error` set.
     * @throws std::runtime_error if a streamed body cannot be rewound.
     */
    response send(request& req, corespace::http_method method);

    /// @brief Emit the request still staged, if any.
    void flush();

    /// @brief Judge responses with @p callback (empty to stop judging).
    void set_response_callback(corespace::response_callback callback);

private:
    void setup_new(
        const request& req, corespace::easy_request& handle,
        corespace::http_method method
    ) const;
    void setup_cached(
        const request& req, corespace::easy_request& handle,
        corespace::http_method method
    ) const;
    void attach_body(
        const request& req, corespace::easy_request& handle,
        corespace::http_method method
    ) const;
    response do_request(
        const request& req, corespace::easy_request& handle,
        corespace::http_method method
    );

    std::shared_ptr<const corespace::run_state> state;
    corespace::http_client transport;
    corespace::metric_dispatcher metrics;
};
}
#endif // HERMES_CLIENT_HPP
