//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SseFramer.hpp
// Purpose: Line framing for relayed Server-Sent-Events streams
//==========================================================================================================

#pragma once

#include <string>
#include <string_view>

#include "chatproxy/Config.h"

namespace chatproxy {

// Terminator event written once at the end of every relayed stream.
inline constexpr std::string_view kSseDoneEvent = "data: [DONE]\n\n";

//==========================================================================================================
// SseFramer
// Purpose: Converts arbitrary upstream byte chunks into complete SSE events.
// Notes:
//   - Input is split on '\n'. A partial trailing line is buffered until the next Feed() or Finish().
//   - Lines are collected into an event and emitted when a blank line closes it. Blank lines that do
//     not close an event are dropped.
//   - The "data: [DONE]" terminator is withheld wherever it appears and emitted exactly once by Finish().
//   - StreamingAdapter::None forwards every other line byte-for-byte. StreamingAdapter::Rewrite normalises
//     CRLF to LF and replaces the top-level "model" of JSON object data payloads with the alias.
//==========================================================================================================
class SseFramer {
public:
    SseFramer(StreamingAdapter adapter, std::string alias);

    // Returns the events completed by data (possibly empty).
    std::string Feed(std::string_view data);

    // Flushes any pending line and event, then appends the terminator. Later calls return "".
    std::string Finish();

    // True once the upstream sent its own terminator.
    bool DoneSeen() const { return doneSeen; }

private:
    void takeLine(std::string_view line, std::string& out);
    std::string rewriteData(std::string_view line) const;

    StreamingAdapter adapter;
    std::string alias;
    std::string partial;
    std::string event;
    bool doneSeen{false};
    bool finished{false};
};

// True for "data: [DONE]" and "data:[DONE]", ignoring a trailing '\r'.
bool IsSseDoneLine(std::string_view line);

} // namespace chatproxy
