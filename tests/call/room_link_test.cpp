#include <gtest/gtest.h>
#include <duet/call/room_link.hpp>
#include <duet/signaling/message.hpp>

#include <set>

namespace duet::call::test {

TEST(RoomLinkTest, GeneratedIdsAreValidAndDistinct) {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        auto id = generateRoomId();
        EXPECT_EQ(id.rfind("room-", 0), 0u);
        EXPECT_EQ(id.size(), 14u);
        EXPECT_TRUE(signaling::isValidRoomId(id)) << id;
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 200u);
}

TEST(RoomLinkTest, ShareLink) {
    EXPECT_EQ(makeShareLink("http://localhost:8080/video_call/", "room-abc"),
              "http://localhost:8080/video_call/?room=room-abc");
    EXPECT_EQ(makeShareLink("https://example.org/call?lang=en", "r1"),
              "https://example.org/call?lang=en&room=r1");
}

TEST(RoomLinkTest, RoomFromShareLink) {
    auto link = makeShareLink("http://localhost:8080/video_call/", "room-k3j9x2a1b");
    auto room = roomFromLink(link);
    ASSERT_TRUE(room.is_ok());
    EXPECT_EQ(room.value(), "room-k3j9x2a1b");
}

TEST(RoomLinkTest, RoomAmongOtherParameters) {
    auto room = roomFromLink("https://example.org/call?lang=en&room=r_2&x=1#top");
    ASSERT_TRUE(room.is_ok());
    EXPECT_EQ(room.value(), "r_2");
}

TEST(RoomLinkTest, PercentEncodedRoom) {
    auto room = roomFromLink("http://host/?room=room%2D1");
    ASSERT_TRUE(room.is_ok());
    EXPECT_EQ(room.value(), "room-1");
}

TEST(RoomLinkTest, BareRoomId) {
    auto room = roomFromLink("room-abc123");
    ASSERT_TRUE(room.is_ok());
    EXPECT_EQ(room.value(), "room-abc123");
}

TEST(RoomLinkTest, Rejections) {
    auto missing = roomFromLink("http://host/video_call/?lang=en");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code(), core::ErrorCode::InvalidRoom);

    auto empty = roomFromLink("http://host/?room=");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().code(), core::ErrorCode::InvalidRoom);

    auto traversal = roomFromLink("http://host/?room=..%2Fadmin");
    ASSERT_TRUE(traversal.is_error());
    EXPECT_EQ(traversal.error().code(), core::ErrorCode::InvalidRoom);

    EXPECT_TRUE(roomFromLink("http://host/?room=abc%4").is_error());
    EXPECT_TRUE(roomFromLink("http://host/?room=abc%zz").is_error());
    EXPECT_TRUE(roomFromLink("http://host/?room=a+b").is_error());
}

} // namespace duet::call::test
