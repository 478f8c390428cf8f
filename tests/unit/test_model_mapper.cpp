#include <catch2/catch_test_macros.hpp>
#include "proxypool/rotation/model_mapper.hpp"

using namespace proxypool::rotation;

TEST_CASE("Upstream model names pass through", "[rotation][mapper]") {
    auto rotator = std::move(CredentialModelRotator::create({"k1"}, {"big-model"})).value();
    ModelMapper mapper(*rotator, {"gpt-", "deepseek-"});

    REQUIRE(mapper.is_passthrough("gpt-4o-mini"));
    REQUIRE(mapper.is_passthrough("deepseek-chat"));
    REQUIRE_FALSE(mapper.is_passthrough("claude-3-5-sonnet"));

    REQUIRE(mapper.resolve("gpt-4o-mini", "big-model") == "gpt-4o-mini");
    REQUIRE(mapper.resolve("claude-3-5-sonnet", "big-model") == "big-model");
}

TEST_CASE("map() draws from the round robin", "[rotation][mapper]") {
    auto rotator = std::move(CredentialModelRotator::create({"k1"}, {"m1", "m2"})).value();
    ModelMapper mapper(*rotator, {"gpt-"});

    REQUIRE(mapper.map("claude-haiku") == "m1");
    REQUIRE(mapper.map("claude-haiku") == "m2");
    REQUIRE(mapper.map("gpt-4o") == "gpt-4o");
    REQUIRE(mapper.map("claude-haiku") == "m1");
}

TEST_CASE("Empty prefixes never match", "[rotation][mapper]") {
    auto rotator = std::move(CredentialModelRotator::create({"k1"}, {"m1"})).value();
    ModelMapper mapper(*rotator, {""});

    REQUIRE_FALSE(mapper.is_passthrough("anything"));
}
