#include <gtest/gtest.h>
#include <duet/core/config.hpp>
#include <filesystem>
#include <fstream>

namespace duet::core::test {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config().clear();
    }

    void TearDown() override {
        config().clear();
    }
};

TEST_F(ConfigTest, BasicTypes) {
    config().set("null_value", nullptr);
    config().set("bool_value", true);
    config().set("int_value", int64_t{42});
    config().set("double_value", 3.14);
    config().set("string_value", std::string("hello"));

    EXPECT_TRUE(config().get<std::nullptr_t>("null_value").is_ok());
    EXPECT_EQ(config().get<bool>("bool_value").value(), true);
    EXPECT_EQ(config().get<int64_t>("int_value").value(), 42);
    EXPECT_EQ(config().get<double>("double_value").value(), 3.14);
    EXPECT_EQ(config().get<std::string>("string_value").value(), "hello");
}

TEST_F(ConfigTest, IntegerReadAsDouble) {
    config().set("timeout", int64_t{120});
    EXPECT_EQ(config().get<double>("timeout").value(), 120.0);
}

TEST_F(ConfigTest, ErrorHandling) {
    config().set("value", int64_t{42});

    // Key not found
    auto missing = config().get<int64_t>("nonexistent");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code(), ErrorCode::FileNotFound);

    // Type mismatch
    auto mismatch = config().get<std::string>("value");
    ASSERT_TRUE(mismatch.is_error());
    EXPECT_EQ(mismatch.error().code(), ErrorCode::InvalidData);
}

TEST_F(ConfigTest, DottedPaths) {
    auto loaded = config().loadFromString(R"({
        "relay": { "host": "127.0.0.1", "port": 9000 },
        "log": { "level": "debug" }
    })");
    ASSERT_TRUE(loaded.is_ok());

    EXPECT_EQ(config().get<std::string>("relay.host").value(), "127.0.0.1");
    EXPECT_EQ(config().get<int64_t>("relay.port").value(), 9000);
    EXPECT_EQ(config().get<std::string>("log.level").value(), "debug");
    EXPECT_TRUE(config().get<int64_t>("relay.missing").is_error());
    EXPECT_TRUE(config().get<int64_t>("client.relay_url").is_error());
}

TEST_F(ConfigTest, ValueWithFallback) {
    ASSERT_TRUE(config().loadFromString(R"({"relay": {"port": 9000, "host": 7}})").is_ok());

    EXPECT_EQ(config().value<int64_t>("relay.port", 8080), 9000);
    EXPECT_EQ(config().value<int64_t>("relay.max_payload", 65536), 65536);
    // Tipe salah memakai fallback
    EXPECT_EQ(config().value<std::string>("relay.host", "0.0.0.0"), "0.0.0.0");
}

TEST_F(ConfigTest, IceServerList) {
    auto loaded = config().loadFromString(R"({
        "client": {
            "ice_servers": [
                { "urls": "stun:stun.l.google.com:19302" },
                { "urls": "turn:turn.example.org:3478", "username": "u", "credential": "p" }
            ]
        }
    })");
    ASSERT_TRUE(loaded.is_ok());

    auto servers = config().get<ConfigListPtr>("client.ice_servers");
    ASSERT_TRUE(servers.is_ok());
    ASSERT_EQ(servers.value()->items.size(), 2);

    const auto& turn = std::get<ConfigNodePtr>(servers.value()->items[1]);
    EXPECT_EQ(turn->get<std::string>("urls").value(), "turn:turn.example.org:3478");
    EXPECT_EQ(turn->get<std::string>("username").value(), "u");
    EXPECT_EQ(turn->get<std::string>("credential").value(), "p");
}

TEST_F(ConfigTest, NestedObject) {
    auto nested = ConfigNode::create();
    nested->set("key", std::string("value"));
    config().set("object", nested);

    auto result = config().get<ConfigNodePtr>("object");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()->get<std::string>("key").value(), "value");
    EXPECT_EQ(config().get<std::string>("object.key").value(), "value");
}

TEST_F(ConfigTest, GetOrCreateObject) {
    auto relay = config().root()->getOrCreateObject("relay");
    relay->set("port", int64_t{8081});

    EXPECT_EQ(config().root()->getOrCreateObject("relay"), relay);
    EXPECT_EQ(config().value<int64_t>("relay.port", 0), 8081);
}

TEST_F(ConfigTest, JsonSerialization) {
    config().set("bool_value", true);
    config().set("int_value", int64_t{42});
    config().set("string_value", std::string("hello"));
    config().set("array_value", ConfigList::create({true, int64_t{1}, std::string("test")}));

    auto nested = ConfigNode::create();
    nested->set("nested_key", std::string("nested_value"));
    config().set("object_value", nested);

    auto save_result = config().saveToString();
    ASSERT_TRUE(save_result.is_ok());

    config().clear();
    auto load_result = config().loadFromString(save_result.value());
    ASSERT_TRUE(load_result.is_ok());

    EXPECT_EQ(config().get<bool>("bool_value").value(), true);
    EXPECT_EQ(config().get<int64_t>("int_value").value(), 42);
    EXPECT_EQ(config().get<std::string>("string_value").value(), "hello");
    EXPECT_EQ(config().get<ConfigListPtr>("array_value").value()->items.size(), 3);
    EXPECT_EQ(config().get<std::string>("object_value.nested_key").value(), "nested_value");
}

TEST_F(ConfigTest, FileOperations) {
    config().set("test_value", std::string("test"));

    auto temp_path = std::filesystem::temp_directory_path() / "duet_config_test.json";
    auto save_result = config().saveToFile(temp_path);
    ASSERT_TRUE(save_result.is_ok());

    config().clear();
    auto load_result = config().loadFromFile(temp_path);
    ASSERT_TRUE(load_result.is_ok());
    EXPECT_EQ(config().get<std::string>("test_value").value(), "test");

    std::filesystem::remove(temp_path);
}

TEST_F(ConfigTest, InvalidJson) {
    auto result = config().loadFromString("invalid json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidData);

    // Valid JSON but not an object
    result = config().loadFromString("42");
    EXPECT_TRUE(result.is_error());
}

TEST_F(ConfigTest, FailedLoadKeepsPreviousValues) {
    config().set("kept", int64_t{1});
    EXPECT_TRUE(config().loadFromString("[1, 2]").is_error());
    EXPECT_EQ(config().value<int64_t>("kept", 0), 1);
}

TEST_F(ConfigTest, FileErrors) {
    auto result = config().loadFromFile("nonexistent.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), ErrorCode::FileNotFound);

    result = config().saveToFile("/invalid/path/config.json");
    EXPECT_TRUE(result.is_error());
}

} // namespace duet::core::test
