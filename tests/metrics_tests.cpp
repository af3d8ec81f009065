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

#include "metrics.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <stop_token>

using namespace corespace;

namespace {
sample point(const metric& series, const double value) {
    sample s;
    s.series = &series;
    s.value = value;
    s.time = std::chrono::system_clock::time_point(
        std::chrono::seconds(1) + std::chrono::microseconds(250)
    );
    s.tags = { { "method", "GET" } };
    s.metadata = { { "vu", "3" } };
    return s;
}

class throwing_sink final : public sample_sink {
public:
    void push(std::vector<sample>) override {
        throw std::runtime_error("sink closed");
    }
};
}

TEST(SystemTags, DefaultsExcludeHighCardinalityTags) {
    const system_tag_set tags = system_tag_set::defaults();
    EXPECT_TRUE(tags.has(system_tag::status));
    EXPECT_TRUE(tags.has(system_tag::error_code));
    EXPECT_TRUE(tags.has(system_tag::expected_response));
    EXPECT_FALSE(tags.has(system_tag::ip));
    EXPECT_FALSE(tags.has(system_tag::vu));
    EXPECT_FALSE(tags.has(system_tag::iter));
}

TEST(SystemTags, AddRemove) {
    system_tag_set tags { system_tag::url };
    tags.add(system_tag::ip);
    tags.remove(system_tag::url);
    EXPECT_TRUE(tags.has(system_tag::ip));
    EXPECT_FALSE(tags.has(system_tag::url));
    EXPECT_EQ(to_string(system_tag::expected_response), "expected_response");
}

TEST(TagsAndMeta, SystemTagsRouting) {
    tags_and_meta ctm;
    ctm.set_system_tag_or_meta(system_tag::status, "200");
    ctm.set_system_tag_or_meta(system_tag::vu, "7");
    EXPECT_EQ(ctm.get("status"), "200");
    EXPECT_FALSE(ctm.get("vu").has_value());
    EXPECT_EQ(ctm.metadata.at("vu"), "7");
}

TEST(TagsAndMeta, IfEnabled) {
    tags_and_meta ctm;
    const system_tag_set enabled { system_tag::method };
    ctm.set_system_tag_or_meta_if_enabled(enabled, system_tag::method, "GET");
    ctm.set_system_tag_or_meta_if_enabled(enabled, system_tag::url, "/x");
    EXPECT_EQ(ctm.get("method"), "GET");
    EXPECT_FALSE(ctm.get("url").has_value());
}

TEST(TagsAndMeta, CloneIsIndependent) {
    tags_and_meta base;
    base.set_tag("scenario", "default");
    tags_and_meta copy = base.clone();
    copy.set_tag("scenario", "other");
    EXPECT_EQ(base.get("scenario"), "default");
    EXPECT_EQ(copy.get("scenario"), "other");
}

TEST(Metrics, ToMilliseconds) {
    EXPECT_DOUBLE_EQ(to_milliseconds(std::chrono::microseconds(1500)), 1.5);
    EXPECT_DOUBLE_EQ(to_milliseconds(std::chrono::nanoseconds(0)), 0.0);
}

TEST(BufferedSink, CollectsBatchesUntilClosed) {
    const builtin_metrics builtin;
    buffered_sink sink;
    sink.push({ point(builtin.http_reqs, 1) });
    sink.push({ point(builtin.http_reqs, 1), point(builtin.checks, 0) });
    sink.close();
    sink.push({ point(builtin.http_reqs, 1) });

    const auto batches = sink.batches();
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[1].size(), 2u);
    EXPECT_EQ(sink.drain().size(), 2u);
    EXPECT_TRUE(sink.batches().empty());
}

TEST(JsonSink, WritesOnePointPerLine) {
    const builtin_metrics builtin;
    std::ostringstream out;
    json_sink sink(out);
    sink.push({ point(builtin.http_reqs, 1),
                point(builtin.http_req_duration, 12.5) });

    std::istringstream lines(out.str());
    std::string line;
    std::vector<nlohmann::json> points;
    while (std::getline(lines, line)) {
        points.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(points[0]["type"], "Point");
    EXPECT_EQ(points[0]["metric"], "http_reqs");
    EXPECT_EQ(points[0]["data"]["time"], "1970-01-01T00:00:01.000250Z");
    EXPECT_EQ(points[0]["data"]["tags"]["method"], "GET");
    EXPECT_EQ(points[0]["data"]["metadata"]["vu"], "3");
    EXPECT_EQ(points[1]["metric"], "http_req_duration");
    EXPECT_DOUBLE_EQ(points[1]["data"]["value"].get<double>(), 12.5);
}

TEST(PushIfNotDone, SkipsFinishedRuns) {
    const builtin_metrics builtin;
    buffered_sink sink;
    std::stop_source source;

    EXPECT_TRUE(push_if_not_done(
        source.get_token(), sink, { point(builtin.http_reqs, 1) }
    ));
    source.request_stop();
    EXPECT_FALSE(push_if_not_done(
        source.get_token(), sink, { point(builtin.http_reqs, 1) }
    ));
    EXPECT_EQ(sink.batches().size(), 1u);
}

TEST(PushIfNotDone, PropagatesSinkFailures) {
    const builtin_metrics builtin;
    throwing_sink sink;
    EXPECT_THROW(
        push_if_not_done({}, sink, { point(builtin.http_reqs, 1) }),
        std::runtime_error
    );
}

TEST(RunState, FallsBackToDefaultLogger) {
    run_state state;
    EXPECT_EQ(&state.log(), spdlog::default_logger_raw());
}
