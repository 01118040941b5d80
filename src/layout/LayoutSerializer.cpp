#include "matchgraph/layout/util/LayoutSerializer.h"
#include "matchgraph/layout/config/LayoutResult.h"
#include "matchgraph/core/ContestGraph.h"
#include "matchgraph/common/Logger.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace matchgraph {

namespace {
    /// Team reference: either "id" or {"id": "..."}
    std::string teamRef(const json& game, const char* field) {
        if (!game.contains(field)) return {};
        const json& ref = game[field];
        if (ref.is_string()) return ref.get<std::string>();
        if (ref.is_object() && ref.contains("id") && ref["id"].is_string()) {
            return ref["id"].get<std::string>();
        }
        return {};
    }

    std::string stringField(const json& j, const char* field, const std::string& fallback = "") {
        if (j.contains(field) && j[field].is_string()) {
            return j[field].get<std::string>();
        }
        return fallback;
    }

    json pointToJson(const Point& p) {
        return {{"x", p.x}, {"y", p.y}};
    }
}

ContestGraph LayoutSerializer::contestGraphFromJson(const std::string& jsonStr) {
    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Failed to parse schedule JSON: ") + e.what());
    }

    if (!j.is_object() || !j.contains("teams") || !j["teams"].is_array() ||
        !j.contains("games") || !j["games"].is_array()) {
        throw std::runtime_error("Schedule JSON must contain 'teams' and 'games' arrays");
    }

    ContestGraph graph;

    for (const auto& team : j["teams"]) {
        std::string id = stringField(team, "id");
        if (id.empty()) {
            LOG_WARN("skipping team without id");
            continue;
        }
        graph.addNode(id, stringField(team, "name", id));
    }

    size_t skipped = 0;
    for (const auto& game : j["games"]) {
        std::string gameId = stringField(game, "id");
        std::string home = teamRef(game, "home");
        std::string away = teamRef(game, "away");

        if (!graph.hasNode(home) || !graph.hasNode(away)) {
            LOG_WARN("skipping game '{}': unknown team ('{}' vs '{}')", gameId, home, away);
            ++skipped;
            continue;
        }

        double leverage = 0.0;
        if (game.contains("leverage") && game["leverage"].is_number()) {
            leverage = game["leverage"].get<double>();
        }
        if (!(leverage > 0.0)) {
            LOG_WARN("skipping game '{}': leverage must be positive", gameId);
            ++skipped;
            continue;
        }

        ContestRecord record(home, away, leverage,
                             stringField(game, "type", ALL_CATEGORIES), gameId);
        if (!graph.addContest(record)) {
            ++skipped;
        }
    }

    LOG_INFO("loaded {} teams and {} games ({} skipped)",
             graph.nodeCount(), graph.contestCount(), skipped);
    return graph;
}

ContestGraph LayoutSerializer::loadContestGraph(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open schedule file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return contestGraphFromJson(buffer.str());
}

std::string LayoutSerializer::toJson(const LayoutResult& result) {
    json j;
    j["empty"] = result.isEmpty();
    j["source"] = result.request.source;
    j["destination"] = result.request.destination;
    j["maxDegree"] = result.request.maxDegree;
    j["filter"] = {
        {"category", result.request.filter.category},
        {"minImportance", result.request.filter.minImportance}
    };

    j["canonicalPath"] = result.subgraph.canonicalPath;
    j["canonicalWeight"] = result.subgraph.canonicalWeight;

    json nodes = json::array();
    for (const auto& id : result.subgraph.nodes) {
        nodes.push_back(id);
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& key : result.subgraph.edges) {
        json edge = {{"key", key}};
        auto it = result.subgraph.edgeDetails.find(key);
        if (it != result.subgraph.edgeDetails.end()) {
            edge["weight"] = it->second.weight;
            edge["meanImportance"] = it->second.meanImportance;
            edge["contests"] = it->second.contestIds;
        }
        edges.push_back(edge);
    }
    j["edges"] = edges;

    json degrees = json::object();
    for (const auto& [id, degree] : result.layering.degrees) {
        degrees[id] = degree;
    }
    j["degrees"] = degrees;

    json edgeDegrees = json::object();
    for (const auto& [key, degree] : result.layering.edgeDegree) {
        edgeDegrees[key] = degree;
    }
    j["edgeDegrees"] = edgeDegrees;

    json bridges = json::array();
    for (const auto& id : result.layering.bridges) {
        bridges.push_back(id);
    }
    j["bridges"] = bridges;

    json layers = json::array();
    for (const auto& layer : result.layers) {
        layers.push_back({{"degree", layer.degree}, {"nodes", layer.nodes}});
    }
    j["layers"] = layers;

    json positions = json::object();
    for (const auto& [id, pos] : result.positions) {
        positions[id] = pointToJson(pos);
    }
    j["positions"] = positions;

    j["stats"] = {
        {"nodeCount", result.stats.nodeCount},
        {"edgeCount", result.stats.edgeCount},
        {"layerCount", result.stats.layerCount},
        {"bridgeCount", result.stats.bridgeCount},
        {"initialCrossings", result.stats.initialCrossings},
        {"finalCrossings", result.stats.finalCrossings},
        {"crossingIterations", result.stats.crossingIterations}
    };

    return j.dump(2);
}

bool LayoutSerializer::saveToFile(const LayoutResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        LOG_ERROR("cannot write layout result to '{}'", path);
        return false;
    }
    file << toJson(result);
    return file.good();
}

}  // namespace matchgraph
