#include <gtest/gtest.h>
#include <duet/signaling/relay_server.hpp>

namespace duet::signaling::test {

TEST(RelayServerTest, RoomFromRequestPath) {
    EXPECT_EQ(roomFromRequestPath("/ws/video/r1/"), "r1");
    EXPECT_EQ(roomFromRequestPath("/ws/video/r1"), "r1");
    EXPECT_EQ(roomFromRequestPath("/ws/video/room-k3j9x2a1b/?x=1"), "room-k3j9x2a1b");

    // Shape only; the registry rejects ids it does not accept
    EXPECT_EQ(roomFromRequestPath("/ws/video/bad%20room/"), "bad%20room");
}

TEST(RelayServerTest, OtherPathsRejected) {
    EXPECT_FALSE(roomFromRequestPath("/ws/video/").has_value());
    EXPECT_FALSE(roomFromRequestPath("/ws/video").has_value());
    EXPECT_FALSE(roomFromRequestPath("/ws/video/r1/extra").has_value());
    EXPECT_FALSE(roomFromRequestPath("/ws/audio/r1/").has_value());
    EXPECT_FALSE(roomFromRequestPath("/").has_value());
}

TEST(RelayServerTest, StopBeforeRun) {
    RoomRegistry registry;
    SignalingRelay relay(registry);
    RelayServer::Options options;
    options.host = "127.0.0.1";
    options.port = 0;

    auto server = RelayServer::create(relay, options);
    server->stop();

    // Returns once the listener is closed again
    auto result = server->run();
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(server->isRunning());
    EXPECT_NE(server->port(), 0);
}

} // namespace duet::signaling::test
