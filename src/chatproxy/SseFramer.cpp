//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/SseFramer.cpp
// Purpose: Line framing for relayed Server-Sent-Events streams
//==========================================================================================================

#include "chatproxy/SseFramer.hpp"
#include "chatproxy/Json.h"
#include "logging/Logger.h"

namespace chatproxy {

namespace {

std::string_view stripCr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

} // namespace

bool IsSseDoneLine(std::string_view line) {
    line = stripCr(line);
    return line == "data: [DONE]" || line == "data:[DONE]";
}

SseFramer::SseFramer(StreamingAdapter a, std::string al) : adapter(a), alias(std::move(al)) {}

std::string SseFramer::Feed(std::string_view data) {
    std::string out;
    if (finished) {
        return out;
    }
    partial.append(data.data(), data.size());

    std::size_t start = 0;
    for (;;) {
        const auto nl = partial.find('\n', start);
        if (nl == std::string::npos) {
            break;
        }
        takeLine(std::string_view(partial).substr(start, nl - start), out);
        start = nl + 1;
    }
    partial.erase(0, start);
    return out;
}

std::string SseFramer::Finish() {
    std::string out;
    if (finished) {
        return out;
    }
    if (!partial.empty()) {
        std::string last;
        last.swap(partial);
        takeLine(last, out);
    }
    if (!event.empty()) {
        out += event;
        out += '\n';
        event.clear();
    }
    out += kSseDoneEvent;
    finished = true;
    return out;
}

void SseFramer::takeLine(std::string_view line, std::string& out) {
    if (stripCr(line).empty()) {
        if (!event.empty()) {
            out += event;
            // The rewrite adapter normalizes line endings to LF
            out.append(adapter == StreamingAdapter::Rewrite ? std::string_view() : line);
            out += '\n';
            event.clear();
        }
        return;
    }
    if (IsSseDoneLine(line)) {
        if (doneSeen) {
            LOG_DEBUG("Ignoring repeated stream terminator");
        }
        doneSeen = true;
        return;
    }
    if (adapter == StreamingAdapter::Rewrite) {
        event += rewriteData(stripCr(line));
    } else {
        event.append(line.data(), line.size());
    }
    event += '\n';
}

std::string SseFramer::rewriteData(std::string_view line) const {
    std::string_view payload;
    if (line.substr(0, 5) != "data:") {
        return std::string(line);
    }
    payload = line.substr(5);
    if (!payload.empty() && payload.front() == ' ') {
        payload.remove_prefix(1);
    }
    if (payload.empty() || payload.front() != '{') {
        return std::string(line);
    }
    try {
        JSONValue chunk = ParseJson(payload);
        auto* obj = chunk.asObject();
        if (obj == nullptr || !obj->contains("model")) {
            return std::string(line);
        }
        obj->set("model", JSONValue(alias));
        return "data: " + SerializeJson(chunk);
    } catch (const JsonParseError& e) {
        LOG_DEBUG("Stream chunk is not valid JSON, forwarding unchanged: {}", e.what());
    } catch (const JsonSerializeError& e) {
        LOG_DEBUG("Stream chunk could not be re-serialized, forwarding unchanged: {}", e.what());
    }
    return std::string(line);
}

} // namespace chatproxy
