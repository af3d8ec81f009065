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

#include "client.hpp"
#include "transfer_failure.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace hermespace {
using namespace corespace;

namespace {
    std::shared_ptr<const run_state>
    checked(std::shared_ptr<const run_state> state) {
        if (!state) {
            throw std::invalid_argument("client requires a run state");
        }
        return state;
    }

    /// @brief Statuses that never carry content (RFC 9110, 6.4.1).
    bool without_content(const long status) noexcept {
        return (status >= 100 && status <= 199) || status == 204
            || status == 304;
    }

    template <class... Ts> struct overloaded : Ts... {
        using Ts::operator()...;
    };
}

nlohmann::json response::json() const {
    if (!body) {
        throw std::invalid_argument("response has no body");
    }
    try {
        return nlohmann::json::parse(*body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(
            std::string("response body is not JSON: ") + e.what()
        );
    }
}

client::client(client_config config, std::shared_ptr<const run_state> state)
    : state(checked(std::move(state)))
    , transport(std::move(config))
    , metrics(this->state->tags.clone(), this->state) { }

client::~client() {
    try {
        flush();
    } catch (const std::exception& e) {
        state->log().warn("dropping last request on shutdown: {}", e.what());
    }
}

void client::flush() { metrics.drain_and_emit(state->done); }

void client::set_response_callback(response_callback callback) {
    metrics.set_response_callback(std::move(callback));
}

response client::send(request& req, const http_method method) {
    auto handle = req.handles.get();
    const bool cached = handle && transport.owns(*handle);
    if (!cached) {
        // a handle prepared by another client keeps that client's transport
        handle = transport.new_request();
    }
    pool_lease lease(req.handles, std::move(handle));
    if (cached) {
        setup_cached(req, *lease, method);
    } else {
        setup_new(req, *lease, method);
    }
    return do_request(req, *lease, method);
}

void client::setup_new(
    const request& req, easy_request& handle, const http_method method
) const {
    handle.set_uri(req.target);
    if (!req.opt.host.empty()) {
        handle.set_host(req.opt.host);
    }
    handle.set_headers(req.opt.headers);
    handle.set_keep_alive(!req.opt.disable_keep_alive);
    handle.set_method(method);
    attach_body(req, handle, method);
}

void client::setup_cached(
    const request& req, easy_request& handle, const http_method method
) const {
    handle.set_keep_alive(!req.opt.disable_keep_alive);
    handle.set_method(method);
    attach_body(req, handle, method);
}

void client::attach_body(
    const request& req, easy_request& handle, const http_method method
) const {
    if (bodiless(method)) {
        handle.clear_body();
        return;
    }
    std::visit(
        overloaded {
            [&handle](std::monostate) { handle.clear_body(); },
            [&handle](const std::string& bytes) {
                if (handle.body() != body_kind::bytes
                    || handle.body_size() != bytes.size()) {
                    handle.set_body(bytes);
                }
            },
            [this, &handle](const std::shared_ptr<file_stream>& stream) {
                try {
                    stream->rewind();
                } catch (const std::exception& e) {
                    state->log().error(
                        "failed to reset stream to beginning: {}", e.what()
                    );
                    throw;
                }
                handle.set_body(stream);
            },
        },
        req.payload
    );
}

response client::do_request(
    const request& req, easy_request& handle, const http_method method
) {
    metrics.drain_and_emit(state->done);

    const auto started = std::chrono::steady_clock::now();
    transfer_result result = transport.perform(handle, req.opt.type);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    state->log().debug(
        "{} {} finished in {}us", to_string(method), req.target,
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count()
    );

    unfinished_request current;
    current.request.method = std::string(to_string(method));
    current.request.uri = req.target;
    current.request.tags = req.opt.tags;
    if (result.status > 0) {
        current.response = response_head { result.status };
    }
    current.trail.end_time = std::chrono::system_clock::now();
    current.trail.duration
        = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
    current.trail.conn_duration = result.conn_duration();
    current.trail.conn_remote_addr = result.remote_addr();

    std::optional<failure> error;
    if (result.code != CURLE_OK || result.rejection) {
        error = translate_transfer_failure(result, method, req.target);
    }
    const bool body_failed = error && body_phase_failure(result);
    if (error && !body_failed) {
        current.error = error;
    }
    metrics.stage(state->done, std::move(current));

    response out;
    out.url = req.target;
    out.type = req.opt.type;
    if (error && !body_failed) {
        if (req.opt.throw_on_error) {
            throw request_error(std::move(*error));
        }
        auto [code, message] = classify(*error);
        state->log().warn("request failed: {}", error->text());
        out.error_code = code;
        out.error = std::move(message);
        return out;
    }

    out.status = result.status;
    out.remote_ip = result.remote_addr().value_or("");
    if (!result.effective_url.empty()) {
        out.url = std::move(result.effective_url);
    }
    out.headers = std::move(result.headers);

    if (body_failed) {
        // the head was staged without error; report the body failure on it
        metrics.drain_and_emit(state->done, *error);
        if (req.opt.throw_on_error) {
            throw request_error(std::move(*error));
        }
        auto [code, message] = classify(*error);
        state->log().warn("reading response body failed: {}", error->text());
        out.error_code = code;
        out.error = std::move(message);
        return out;
    }

    if (out.status >= 400) {
        out.error_code = status_error_code(out.status);
    }
    if (req.opt.type != response_type::none && !without_content(out.status)) {
        out.body = std::move(result.body);
    }
    return out;
}
}
