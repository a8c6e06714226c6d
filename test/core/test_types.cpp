#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/core/types.hpp>

#include <string>

using namespace mcp_bridge;

// ===========================================================================
// ProviderName
// ===========================================================================

TEST_CASE("ProviderName: valid names", "[types][ProviderName]") {
    for (const char* name : {"brave-search", "weather", "notes_v2", "a.b", "X"}) {
        auto r = ProviderName::Create(name);
        INFO(name);
        REQUIRE(r.IsOk());
        CHECK(r.Value().Value() == name);
    }
}

TEST_CASE("ProviderName: invalid names", "[types][ProviderName]") {
    CHECK(ProviderName::Create("").IsErr());
    CHECK(ProviderName::Create("has space").IsErr());
    CHECK(ProviderName::Create("slash/name").IsErr());
    CHECK(ProviderName::Create(std::string(65, 'a')).IsErr());
    CHECK(ProviderName::Create(std::string(64, 'a')).IsOk());
}

TEST_CASE("ProviderName: meta is reserved", "[types][ProviderName]") {
    auto r = ProviderName::Create("meta");
    REQUIRE(r.IsErr());
    CHECK(r.Error().find("reserved") != std::string::npos);
}

TEST_CASE("ProviderName: value semantics", "[types][ProviderName]") {
    auto a = ProviderName::Create("alpha").Value();
    auto b = ProviderName::Create("beta").Value();
    CHECK(a == ProviderName::Create("alpha").Value());
    CHECK(a != b);
    CHECK(a < b);
}

// ===========================================================================
// ServerUrl
// ===========================================================================

TEST_CASE("ServerUrl: http with port and path", "[types][ServerUrl]") {
    auto r = ServerUrl::Create("http://localhost:8080/api/mcp/");
    REQUIRE(r.IsOk());
    const auto& url = r.Value();
    CHECK(url.Host() == "localhost");
    CHECK(url.Port() == 8080);
    CHECK_FALSE(url.UseHttps());
    CHECK(url.BasePath() == "/api/mcp");
    CHECK(url.Origin() == "http://localhost:8080");
}

TEST_CASE("ServerUrl: default ports", "[types][ServerUrl]") {
    auto http = ServerUrl::Create("http://tools.example.com");
    REQUIRE(http.IsOk());
    CHECK(http.Value().Port() == 80);
    CHECK(http.Value().BasePath().empty());

    auto https = ServerUrl::Create("https://tools.example.com");
    REQUIRE(https.IsOk());
    CHECK(https.Value().Port() == 443);
    CHECK(https.Value().UseHttps());
}

TEST_CASE("ServerUrl: invalid URLs", "[types][ServerUrl]") {
    CHECK(ServerUrl::Create("").IsErr());
    CHECK(ServerUrl::Create("ftp://host").IsErr());
    CHECK(ServerUrl::Create("localhost:8080").IsErr());
    CHECK(ServerUrl::Create("http://").IsErr());
    CHECK(ServerUrl::Create("http://:8080").IsErr());
    CHECK(ServerUrl::Create("http://host:abc").IsErr());
    CHECK(ServerUrl::Create("http://host:70000").IsErr());
}
