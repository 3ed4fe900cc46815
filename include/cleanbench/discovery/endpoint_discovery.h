#pragma once

#include <cleanbench/core/types.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cleanbench::discovery {

/**
 * @brief One endpoint to benchmark
 *
 * pathTemplate may contain `{...}` placeholders, filled with the resource id by materializeUrl.
 */
struct EndpointSpec {
    std::string name;
    std::string method;
    std::string pathTemplate;

    bool operator==(const EndpointSpec&) const = default;
};

/**
 * @brief A route as declared by the service under test
 */
struct RouteDeclaration {
    std::string name;
    std::string path;
    std::set<std::string> methods;
};

class IRouteSource {
public:
    virtual ~IRouteSource() = default;
    virtual Result<std::vector<RouteDeclaration>> routes() = 0;
    virtual std::string describe() const = 0;
};

/**
 * Route manifest on disk. Two layouts are accepted:
 *   {"routes": [{"name": "...", "path": "...", "methods": ["GET"]}, ...]}
 * or an exported OpenAPI document, where the name is each operation's operationId
 * (falling back to the last literal path segment).
 */
class ManifestRouteSource final : public IRouteSource {
public:
    explicit ManifestRouteSource(std::filesystem::path path);

    Result<std::vector<RouteDeclaration>> routes() override;
    std::string describe() const override { return path_.string(); }

private:
    std::filesystem::path path_;
};

class StaticRouteSource final : public IRouteSource {
public:
    explicit StaticRouteSource(std::vector<RouteDeclaration> routes) : routes_(std::move(routes)) {}

    Result<std::vector<RouteDeclaration>> routes() override { return routes_; }
    std::string describe() const override { return "static route table"; }

private:
    std::vector<RouteDeclaration> routes_;
};

/**
 * @brief Turns the declared route table into the ordered endpoint set for a run
 */
class EndpointDiscovery {
public:
    EndpointDiscovery(std::shared_ptr<IRouteSource> source, std::string seedPath);

    /**
     * Keep GET/POST routes outside the infrastructure denylist, optionally only those whose
     * path starts with @p filterPrefix. Declaration order is preserved.
     *
     * @return DiscoveryFailed if the table cannot be read or two routes share a name
     */
    Result<std::vector<EndpointSpec>> discover(const std::optional<std::string>& filterPrefix = {});

    static bool isInfrastructurePath(const std::string& path);

private:
    std::shared_ptr<IRouteSource> source_;
    std::string seedPath_;
};

// POST for paths with a /write/ segment, otherwise GET
std::string inferMethod(const std::string& path);

std::string materializeUrl(const std::string& baseUrl, const std::string& pathTemplate,
                           const std::string& resourceId);

} // namespace cleanbench::discovery
