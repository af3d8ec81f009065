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

#include "trail.hpp"

namespace corespace {
bool trail::save_samples(
    const builtin_metrics& builtin, const tags_and_meta& ctm
) {
    if (saved) {
        return false;
    }
    saved = true;
    tags = ctm.tags;
    metadata = ctm.metadata;
    // one extra slot for a possible http_req_failed sample
    samples.reserve(samples.size() + 3);
    samples.push_back({ .series = &builtin.http_reqs,
                        .tags = tags,
                        .metadata = metadata,
                        .time = end_time,
                        .value = 1 });
    samples.push_back({ .series = &builtin.http_req_duration,
                        .tags = tags,
                        .metadata = metadata,
                        .time = end_time,
                        .value = to_milliseconds(duration) });
    return true;
}
}
