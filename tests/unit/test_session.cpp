#include <gtest/gtest.h>
#include "vlive/session.hpp"
#include "vlive/error.hpp"
#include "vlive/version.hpp"
#include <set>

using namespace vlive;

static HandshakeRequest make_handshake(const std::string& version = std::string(PROTOCOL_VERSION)) {
    HandshakeRequest req;
    req.protocol_version = version;
    req.client_info = {"test-client", std::nullopt, "1.0"};
    req.capabilities.streaming = true;
    return req;
}

TEST(Session, InitialState) {
    Session s;
    EXPECT_EQ(s.state(), SessionState::Uninitialized);
    EXPECT_FALSE(s.id().empty());
    EXPECT_EQ(s.in_flight(), 0u);
}

TEST(Session, HandshakeMovesToReady) {
    Session s;
    auto agreed = s.handshake(make_handshake());
    EXPECT_EQ(agreed, PROTOCOL_VERSION);
    EXPECT_EQ(s.state(), SessionState::Ready);
    EXPECT_EQ(s.protocol_version(), PROTOCOL_VERSION);
    EXPECT_EQ(s.client_info().name, "test-client");
    EXPECT_TRUE(s.client_capabilities().streaming);
}

TEST(Session, OlderSupportedVersionIsAccepted) {
    Session s;
    EXPECT_EQ(s.handshake(make_handshake("2024-11-05")), "2024-11-05");
    EXPECT_EQ(s.state(), SessionState::Ready);
}

TEST(Session, UnsupportedVersionLeavesSessionUninitialized) {
    Session s;
    try {
        s.handshake(make_handshake("1999-01-01"));
        FAIL() << "expected HandshakeError";
    } catch (const HandshakeError& e) {
        EXPECT_EQ(e.code, error::Handshake);
        ASSERT_TRUE(e.details.has_value());
        EXPECT_EQ((*e.details)["requested"], "1999-01-01");
        EXPECT_FALSE((*e.details)["supported"].empty());
    }
    EXPECT_EQ(s.state(), SessionState::Uninitialized);

    // A later handshake with a good version still succeeds
    s.handshake(make_handshake());
    EXPECT_EQ(s.state(), SessionState::Ready);
}

TEST(Session, SecondHandshakeIsProtocolStateError) {
    Session s;
    s.handshake(make_handshake());
    EXPECT_THROW(s.handshake(make_handshake()), ProtocolStateError);
    EXPECT_EQ(s.state(), SessionState::Ready);
}

TEST(Session, HandshakeAfterCloseFails) {
    Session s;
    s.close();
    EXPECT_THROW(s.handshake(make_handshake()), ProtocolStateError);
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(Session, AssumeReady) {
    Session s;
    s.assume_ready("2025-03-26");
    EXPECT_EQ(s.state(), SessionState::Ready);
    EXPECT_EQ(s.protocol_version(), "2025-03-26");
    EXPECT_THROW(s.assume_ready("2025-03-26"), ProtocolStateError);
}

TEST(Session, CloseIsIdempotentAndTerminal) {
    Session s;
    s.handshake(make_handshake());
    auto token = s.token();
    EXPECT_FALSE(token.is_cancelled());

    s.close();
    EXPECT_EQ(s.state(), SessionState::Closed);
    EXPECT_TRUE(token.is_cancelled());

    s.close();
    EXPECT_EQ(s.state(), SessionState::Closed);
}

TEST(Session, CloseCancelsInFlightRequests) {
    Session s;
    s.handshake(make_handshake());
    auto a = s.begin_request(RequestId{int64_t{1}});
    auto b = s.begin_request(RequestId{std::string("b")});
    EXPECT_EQ(s.in_flight(), 2u);

    s.close();
    EXPECT_TRUE(a.is_cancelled());
    EXPECT_TRUE(b.is_cancelled());
}

TEST(Session, BeginRequestOnClosedSessionIsAlreadyCancelled) {
    Session s;
    s.close();
    auto src = s.begin_request(RequestId{int64_t{1}});
    EXPECT_TRUE(src.is_cancelled());
    EXPECT_EQ(s.in_flight(), 0u);
}

TEST(Session, CancelRequest) {
    Session s;
    s.handshake(make_handshake());
    auto src = s.begin_request(RequestId{int64_t{7}});

    EXPECT_FALSE(s.cancel_request(RequestId{int64_t{8}}));
    EXPECT_FALSE(src.is_cancelled());

    EXPECT_TRUE(s.cancel_request(RequestId{int64_t{7}}));
    EXPECT_TRUE(src.is_cancelled());

    s.end_request(RequestId{int64_t{7}});
    EXPECT_EQ(s.in_flight(), 0u);
    EXPECT_FALSE(s.cancel_request(RequestId{int64_t{7}}));
}

TEST(Session, IntegerAndStringIdsAreDistinct) {
    Session s;
    s.handshake(make_handshake());
    auto num = s.begin_request(RequestId{int64_t{1}});
    auto str = s.begin_request(RequestId{std::string("1")});

    EXPECT_TRUE(s.cancel_request(RequestId{std::string("1")}));
    EXPECT_TRUE(str.is_cancelled());
    EXPECT_FALSE(num.is_cancelled());
}

TEST(Session, StateNames) {
    EXPECT_EQ(session_state_to_string(SessionState::Uninitialized), "uninitialized");
    EXPECT_EQ(session_state_to_string(SessionState::Ready), "ready");
    EXPECT_EQ(session_state_to_string(SessionState::Closed), "closed");
}

TEST(SessionId, GeneratedIdsAreUniqueUuids) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        auto id = generate_session_id();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[14], '4');
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 1000u);
}
