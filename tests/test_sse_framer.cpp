//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_sse_framer.cpp
// Purpose: GoogleTests for SSE event framing, terminator handling and the model rewrite adapter
//==========================================================================================================

#include <gtest/gtest.h>

#include "chatproxy/SseFramer.hpp"

using namespace chatproxy;

TEST(SseFramer, PassesCompleteEventsThrough) {
    SseFramer f(StreamingAdapter::None, "default");
    EXPECT_EQ(f.Feed("data: {\"a\":1}\n\ndata: {\"a\":2}\n\n"), "data: {\"a\":1}\n\ndata: {\"a\":2}\n\n");
    EXPECT_FALSE(f.DoneSeen());
}

TEST(SseFramer, HoldsPartialEventsUntilTheBlankLine) {
    SseFramer f(StreamingAdapter::None, "default");
    EXPECT_EQ(f.Feed("data: {\"a\""), "");
    EXPECT_EQ(f.Feed(":1}\n"), "");
    EXPECT_EQ(f.Feed("\n"), "data: {\"a\":1}\n\n");
}

TEST(SseFramer, PreservesCrLfWithoutAdapter) {
    SseFramer f(StreamingAdapter::None, "default");
    EXPECT_EQ(f.Feed("data: x\r\n\r\n"), "data: x\r\n\r\n");
}

TEST(SseFramer, ForwardsCommentsAndMultiLineEvents) {
    SseFramer f(StreamingAdapter::None, "default");
    EXPECT_EQ(f.Feed(": keep-alive\n\nevent: message\ndata: a\n\n"), ": keep-alive\n\nevent: message\ndata: a\n\n");
}

TEST(SseFramer, WithholdsUpstreamTerminatorAndEmitsItOnFinish) {
    SseFramer f(StreamingAdapter::None, "default");
    EXPECT_EQ(f.Feed("data: a\n\ndata: [DONE]\n\n"), "data: a\n\n");
    EXPECT_TRUE(f.DoneSeen());
    EXPECT_EQ(f.Finish(), "data: [DONE]\n\n");
}

TEST(SseFramer, RepeatedTerminatorIsEmittedOnce) {
    SseFramer f(StreamingAdapter::None, "default");
    std::string out = f.Feed("data: a\n\ndata: [DONE]\n\ndata:[DONE]\n\n");
    out += f.Finish();
    out += f.Finish();
    EXPECT_EQ(out, "data: a\n\ndata: [DONE]\n\n");
}

TEST(SseFramer, SynthesizesTerminatorWhenUpstreamOmitsIt) {
    SseFramer f(StreamingAdapter::None, "default");
    EXPECT_EQ(f.Feed("data: a\n\n"), "data: a\n\n");
    EXPECT_FALSE(f.DoneSeen());
    EXPECT_EQ(f.Finish(), "data: [DONE]\n\n");
}

TEST(SseFramer, FinishFlushesTrailingIncompleteEvent) {
    SseFramer f(StreamingAdapter::None, "default");
    EXPECT_EQ(f.Feed("data: a\n"), "");
    EXPECT_EQ(f.Feed("data: b"), "");
    EXPECT_EQ(f.Finish(), "data: a\ndata: b\n\ndata: [DONE]\n\n");
}

TEST(SseFramer, FeedAfterFinishIsIgnored) {
    SseFramer f(StreamingAdapter::None, "default");
    (void)f.Finish();
    EXPECT_EQ(f.Feed("data: late\n\n"), "");
    EXPECT_EQ(f.Finish(), "");
}

TEST(SseFramer, RewriteAdapterEchoesAlias) {
    SseFramer f(StreamingAdapter::Rewrite, "default");
    EXPECT_EQ(f.Feed("data: {\"id\":\"c1\",\"model\":\"glm-4.6\",\"choices\":[]}\r\n\r\n"),
              "data: {\"id\":\"c1\",\"model\":\"default\",\"choices\":[]}\n\n");
}

TEST(SseFramer, RewriteAdapterLeavesOtherLinesAlone) {
    SseFramer f(StreamingAdapter::Rewrite, "default");
    EXPECT_EQ(f.Feed("data: {\"id\": \"c1\"}\n\n"), "data: {\"id\": \"c1\"}\n\n");
    EXPECT_EQ(f.Feed("data: not json\n\n"), "data: not json\n\n");
    EXPECT_EQ(f.Feed("data: {broken\n\n"), "data: {broken\n\n");
    EXPECT_EQ(f.Feed(": ping\r\n\r\n"), ": ping\n\n");
}

TEST(SseFramer, DoneLineDetection) {
    EXPECT_TRUE(IsSseDoneLine("data: [DONE]"));
    EXPECT_TRUE(IsSseDoneLine("data:[DONE]"));
    EXPECT_TRUE(IsSseDoneLine("data: [DONE]\r"));
    EXPECT_FALSE(IsSseDoneLine("data: [DONE] "));
    EXPECT_FALSE(IsSseDoneLine("data: {\"text\":\"[DONE]\"}"));
}
