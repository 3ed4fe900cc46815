// Endpoint discovery tests
//
// Denylist, seed exclusion, method inference, prefix filtering and manifest formats.

#include <catch2/catch_test_macros.hpp>

#include <cleanbench/discovery/endpoint_discovery.h>

#include <fstream>
#include <string>
#include <vector>

#include "../../support/scratch_dir.hpp"

using namespace cleanbench;
using namespace cleanbench::discovery;
using cleanbench::test_support::ScratchDir;

namespace {

std::shared_ptr<IRouteSource> sampleRoutes() {
    return std::make_shared<StaticRouteSource>(std::vector<RouteDeclaration>{
        {"root", "/", {"GET"}},
        {"health", "/health", {"GET"}},
        {"openapi", "/openapi.json", {"GET"}},
        {"docs", "/docs", {"GET"}},
        {"seed", "/api/db/seed", {"POST"}},
        {"read", "/api/db/read/{item_id}", {"GET"}},
        {"write", "/api/db/write/{item_id}", {"POST"}},
        {"cache_get", "/api/cache/get/{key}", {"GET", "HEAD"}},
        {"purge", "/api/cache/purge", {"DELETE"}},
        {"compute", "/api/compute/fib", {"GET"}},
    });
}

std::vector<std::string> names(const std::vector<EndpointSpec>& endpoints) {
    std::vector<std::string> out;
    for (const auto& e : endpoints)
        out.push_back(e.name);
    return out;
}

} // namespace

TEST_CASE("Discovery drops infrastructure and seed routes", "[discovery]") {
    EndpointDiscovery discovery(sampleRoutes(), "/api/db/seed");
    auto endpoints = discovery.discover();
    REQUIRE(endpoints);

    CHECK(names(endpoints.value()) ==
          std::vector<std::string>{"read", "write", "cache_get", "compute"});

    const auto& list = endpoints.value();
    CHECK(list[0] == EndpointSpec{"read", "GET", "/api/db/read/{item_id}"});
    CHECK(list[1] == EndpointSpec{"write", "POST", "/api/db/write/{item_id}"});
}

TEST_CASE("Discovery applies the path prefix filter", "[discovery]") {
    EndpointDiscovery discovery(sampleRoutes(), "/api/db/seed");

    SECTION("matching prefix") {
        auto endpoints = discovery.discover(std::string("/api/db"));
        REQUIRE(endpoints);
        CHECK(names(endpoints.value()) == std::vector<std::string>{"read", "write"});
    }

    SECTION("no match is an empty set, not an error") {
        auto endpoints = discovery.discover(std::string("/api/nothing"));
        REQUIRE(endpoints);
        CHECK(endpoints.value().empty());
    }
}

TEST_CASE("Discovery rejects duplicate endpoint names", "[discovery]") {
    auto source = std::make_shared<StaticRouteSource>(std::vector<RouteDeclaration>{
        {"item", "/api/a/{id}", {"GET"}},
        {"item", "/api/b/{id}", {"GET"}},
    });
    EndpointDiscovery discovery(source, "/api/db/seed");
    auto endpoints = discovery.discover();
    REQUIRE_FALSE(endpoints);
    CHECK(endpoints.error().code == ErrorCode::DiscoveryFailed);
}

TEST_CASE("Discovery rejects names that would escape the run directory", "[discovery]") {
    const std::vector<std::string> unsafe{"../../etc/cron", "nested/name", "win\\path", "up..",
                                          "tab\tname"};
    for (const auto& name : unsafe) {
        CAPTURE(name);
        auto source = std::make_shared<StaticRouteSource>(std::vector<RouteDeclaration>{
            {"read", "/api/db/read/{id}", {"GET"}},
            {name, "/api/db/other/{id}", {"GET"}},
        });
        EndpointDiscovery discovery(source, "/api/db/seed");
        auto endpoints = discovery.discover();
        REQUIRE_FALSE(endpoints);
        CHECK(endpoints.error().code == ErrorCode::DiscoveryFailed);
    }

    SECTION("dots, dashes and underscores are fine") {
        auto source = std::make_shared<StaticRouteSource>(std::vector<RouteDeclaration>{
            {"get_item.v2-beta", "/api/items/{id}", {"GET"}},
        });
        EndpointDiscovery discovery(source, "/api/db/seed");
        auto endpoints = discovery.discover();
        REQUIRE(endpoints);
        CHECK(endpoints.value().size() == 1);
    }
}

TEST_CASE("Method inference prefers declared methods", "[discovery]") {
    CHECK(inferMethod("/api/db/write/{id}") == "POST");
    CHECK(inferMethod("/api/db/writer") == "GET");
    CHECK(inferMethod("/api/db/read/{id}") == "GET");

    // A /write/ route that only declares GET is still benchmarked with GET
    auto source = std::make_shared<StaticRouteSource>(
        std::vector<RouteDeclaration>{{"legacy", "/api/write/legacy", {"GET"}},
                                      {"submit", "/api/submit", {"POST"}}});
    EndpointDiscovery discovery(source, "");
    auto endpoints = discovery.discover();
    REQUIRE(endpoints);
    REQUIRE(endpoints.value().size() == 2);
    CHECK(endpoints.value()[0].method == "GET");
    CHECK(endpoints.value()[1].method == "POST");
}

TEST_CASE("materializeUrl fills every placeholder", "[discovery]") {
    CHECK(materializeUrl("http://127.0.0.1:8000", "/api/db/read/{item_id}", "1000") ==
          "http://127.0.0.1:8000/api/db/read/1000");
    CHECK(materializeUrl("http://h:1", "/a/{x}/b/{y}", "7") == "http://h:1/a/7/b/7");
    CHECK(materializeUrl("http://h:1", "/plain", "7") == "http://h:1/plain");
    CHECK(materializeUrl("http://h:1", "/broken/{x", "7") == "http://h:1/broken/{x");
}

TEST_CASE("ManifestRouteSource reads both manifest layouts", "[discovery][manifest]") {
    auto dir = ScratchDir("cleanbench-routes");

    SECTION("routes array") {
        auto path = dir.path() / "routes.json";
        std::ofstream(path) << R"({"routes": [
            {"name": "read", "path": "/api/db/read/{item_id}", "methods": ["get"]},
            {"path": "/api/cache/stats", "method": "GET"},
            {"name": "health", "path": "/health", "methods": ["GET"]}
        ]})";

        ManifestRouteSource source(path);
        auto routes = source.routes();
        REQUIRE(routes);
        REQUIRE(routes.value().size() == 3);
        CHECK(routes.value()[0].methods.contains("GET"));
        CHECK(routes.value()[1].name == "stats");
    }

    SECTION("OpenAPI document keeps declaration order") {
        auto path = dir.path() / "openapi.json";
        std::ofstream(path) << R"({"openapi": "3.1.0", "paths": {
            "/health": {"get": {"operationId": "health"}},
            "/api/db/write/{item_id}": {"post": {"operationId": "db_write"}},
            "/api/db/read/{item_id}": {"get": {}}
        }})";

        EndpointDiscovery discovery(std::make_shared<ManifestRouteSource>(path), "/api/db/seed");
        auto endpoints = discovery.discover();
        REQUIRE(endpoints);
        CHECK(endpoints.value() ==
              std::vector<EndpointSpec>{{"db_write", "POST", "/api/db/write/{item_id}"},
                                        {"read", "GET", "/api/db/read/{item_id}"}});
    }

    SECTION("missing or malformed manifest fails discovery") {
        EndpointDiscovery missing(std::make_shared<ManifestRouteSource>(dir.path() / "nope.json"),
                                  "");
        auto result = missing.discover();
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::DiscoveryFailed);

        auto path = dir.path() / "bad.json";
        std::ofstream(path) << "{not json";
        EndpointDiscovery malformed(std::make_shared<ManifestRouteSource>(path), "");
        CHECK_FALSE(malformed.discover());
    }
}
