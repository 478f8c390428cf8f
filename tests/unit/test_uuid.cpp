#include <catch2/catch_test_macros.hpp>
#include "proxypool/core/uuid.hpp"

#include <set>

using namespace proxypool::core;

TEST_CASE("UUID generation", "[uuid]") {
    auto uuid1 = UUID::generate();
    auto uuid2 = UUID::generate();

    REQUIRE(uuid1.to_string() != uuid2.to_string());
    REQUIRE(uuid1.to_string().length() == 36);  // Standard UUID format
}

TEST_CASE("UUID uniqueness", "[uuid]") {
    std::set<std::string> uuids;

    for (int i = 0; i < 1000; ++i) {
        uuids.insert(UUID::generate().to_string());
    }

    REQUIRE(uuids.size() == 1000);
}

TEST_CASE("UUID version and variant bits", "[uuid]") {
    std::string text = UUID::generate().to_string();

    REQUIRE(text[8] == '-');
    REQUIRE(text[14] == '4');
    REQUIRE(std::string("89ab").find(text[19]) != std::string::npos);
}

TEST_CASE("UUID hex form", "[uuid]") {
    std::string hex = UUID::generate().to_hex();

    REQUIRE(hex.size() == 32);
    REQUIRE(hex.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("Prefixed ids", "[uuid]") {
    std::string message_id = generate_message_id();
    std::string tool_id = generate_tool_use_id();
    std::string request_id = generate_request_id();

    REQUIRE(message_id.rfind("msg_", 0) == 0);
    REQUIRE(message_id.size() == 4 + 24);
    REQUIRE(tool_id.rfind("toolu_", 0) == 0);
    REQUIRE(tool_id.size() == 6 + 24);
    REQUIRE(request_id.rfind("req_", 0) == 0);
    REQUIRE(request_id.size() == 4 + 12);
    REQUIRE(generate_message_id() != message_id);
}
