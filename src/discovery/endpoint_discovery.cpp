#include <cleanbench/discovery/endpoint_discovery.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <unordered_set>

namespace cleanbench::discovery {

// ordered_json keeps OpenAPI paths in declaration order
using json = nlohmann::ordered_json;

namespace {

constexpr std::array<std::string_view, 6> kInfrastructurePaths = {
    "/", "/health", "/openapi.json", "/docs", "/docs/oauth2-redirect", "/redoc"};

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Last literal (non-placeholder) path segment, used when a route carries no name
std::string name_from_path(const std::string& path) {
    size_t end = path.size();
    while (end > 0) {
        size_t start = path.rfind('/', end - 1);
        start = (start == std::string::npos) ? 0 : start + 1;
        std::string segment = path.substr(start, end - start);
        if (!segment.empty() && segment.front() != '{') {
            return segment;
        }
        if (start == 0)
            break;
        end = start - 1;
    }
    return {};
}

Result<std::vector<RouteDeclaration>> parse_manifest(const json& doc) {
    std::vector<RouteDeclaration> out;
    for (const auto& item : doc.at("routes")) {
        RouteDeclaration route;
        route.path = item.at("path").get<std::string>();
        route.name = item.value("name", std::string{});
        if (item.contains("methods")) {
            for (const auto& m : item.at("methods")) {
                route.methods.insert(upper(m.get<std::string>()));
            }
        } else if (item.contains("method")) {
            route.methods.insert(upper(item.at("method").get<std::string>()));
        }
        if (route.name.empty())
            route.name = name_from_path(route.path);
        out.push_back(std::move(route));
    }
    return out;
}

Result<std::vector<RouteDeclaration>> parse_openapi(const json& doc) {
    std::vector<RouteDeclaration> out;
    for (const auto& [path, operations] : doc.at("paths").items()) {
        if (!operations.is_object())
            continue;
        RouteDeclaration route;
        route.path = path;
        for (const auto& [verb, op] : operations.items()) {
            auto method = upper(verb);
            route.methods.insert(method);
            if (route.name.empty() && (method == "GET" || method == "POST") && op.is_object()) {
                route.name = op.value("operationId", std::string{});
            }
        }
        if (route.name.empty())
            route.name = name_from_path(path);
        out.push_back(std::move(route));
    }
    return out;
}

// Names become t_<name>.txt and <name>_<rate>.bin inside the run directory
bool usable_as_file_name(const std::string& name) {
    if (name.find("..") != std::string::npos)
        return false;
    return std::none_of(name.begin(), name.end(), [](char c) {
        return c == '/' || c == '\\' || std::iscntrl(static_cast<unsigned char>(c));
    });
}

} // namespace

ManifestRouteSource::ManifestRouteSource(std::filesystem::path path) : path_(std::move(path)) {}

Result<std::vector<RouteDeclaration>> ManifestRouteSource::routes() {
    std::ifstream in(path_);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Route manifest not found: " + path_.string()};
    }
    try {
        json doc = json::parse(in);
        if (doc.contains("routes")) {
            return parse_manifest(doc);
        }
        if (doc.contains("paths")) {
            return parse_openapi(doc);
        }
        return Error{ErrorCode::InvalidData,
                     path_.string() + ": expected a 'routes' array or an OpenAPI 'paths' object"};
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, path_.string() + ": " + e.what()};
    }
}

EndpointDiscovery::EndpointDiscovery(std::shared_ptr<IRouteSource> source, std::string seedPath)
    : source_(std::move(source)), seedPath_(std::move(seedPath)) {}

bool EndpointDiscovery::isInfrastructurePath(const std::string& path) {
    return std::find(kInfrastructurePaths.begin(), kInfrastructurePaths.end(), path) !=
           kInfrastructurePaths.end();
}

Result<std::vector<EndpointSpec>>
EndpointDiscovery::discover(const std::optional<std::string>& filterPrefix) {
    if (!source_) {
        return Error{ErrorCode::DiscoveryFailed, "No route source configured"};
    }
    auto declared = source_->routes();
    if (!declared) {
        return Error{ErrorCode::DiscoveryFailed, "Cannot read route table from " +
                                                     source_->describe() + ": " +
                                                     declared.error().message};
    }

    std::vector<EndpointSpec> endpoints;
    std::unordered_set<std::string> names;
    for (const auto& route : declared.value()) {
        if (isInfrastructurePath(route.path) || (!seedPath_.empty() && route.path == seedPath_))
            continue;
        if (filterPrefix && route.path.rfind(*filterPrefix, 0) != 0)
            continue;

        const bool hasGet = route.methods.contains("GET");
        const bool hasPost = route.methods.contains("POST");
        if (!hasGet && !hasPost)
            continue;

        std::string method = inferMethod(route.path);
        if ((method == "POST" && !hasPost) || (method == "GET" && !hasGet)) {
            method = hasGet ? "GET" : "POST";
        }

        if (route.name.empty()) {
            return Error{ErrorCode::DiscoveryFailed, "Route " + route.path + " has no name"};
        }
        if (!usable_as_file_name(route.name)) {
            return Error{ErrorCode::DiscoveryFailed, "Endpoint name '" + route.name + "' (" +
                                                         route.path +
                                                         ") cannot be used in artifact file names"};
        }
        if (!names.insert(route.name).second) {
            return Error{ErrorCode::DiscoveryFailed,
                         "Duplicate endpoint name '" + route.name + "' (" + route.path + ")"};
        }
        endpoints.push_back(EndpointSpec{route.name, std::move(method), route.path});
    }

    spdlog::debug("Discovered {} endpoint(s) from {}", endpoints.size(), source_->describe());
    return endpoints;
}

std::string inferMethod(const std::string& path) {
    return path.find("/write/") != std::string::npos ? "POST" : "GET";
}

std::string materializeUrl(const std::string& baseUrl, const std::string& pathTemplate,
                           const std::string& resourceId) {
    std::string path;
    path.reserve(pathTemplate.size());
    size_t pos = 0;
    while (pos < pathTemplate.size()) {
        auto open = pathTemplate.find('{', pos);
        if (open == std::string::npos) {
            path.append(pathTemplate, pos, std::string::npos);
            break;
        }
        auto close = pathTemplate.find('}', open);
        if (close == std::string::npos) {
            path.append(pathTemplate, pos, std::string::npos);
            break;
        }
        path.append(pathTemplate, pos, open - pos);
        path += resourceId;
        pos = close + 1;
    }
    return baseUrl + path;
}

} // namespace cleanbench::discovery
