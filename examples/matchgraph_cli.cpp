#include <matchgraph/matchgraph.h>
#include <matchgraph/common/Logger.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace matchgraph;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <schedule.json> <source> <destination> [options]\n"
              << "  --degree=N          maximum path length in hops (default 3)\n"
              << "  --category=TYPE     only contests of this type (default ALL)\n"
              << "  --min-importance=X  only contests with importance >= X\n"
              << "  --options=FILE      layout options JSON\n"
              << "  --out=FILE          write the result to FILE instead of stdout\n"
              << "  --log-dir=DIR       also write matchgraph.log to DIR\n"
              << "  --verbose           log pipeline progress (stderr)\n";
}

/// Forwards pipeline events to the logger
class LoggingObserver : public ILayoutObserver {
public:
    void onRequestRejected(const LayoutRequest& request, const std::string& reason) override {
        LOG_WARN("request '{}' -> '{}' rejected: {}", request.source, request.destination, reason);
    }

    void onBridgeDetected(const NodeId& node, int hopDistance, int canonicalHops) override {
        LOG_INFO("bridge: {} reaches the destination in {} hops (canonical path: {})",
                 node, hopDistance + 1, canonicalHops);
    }

    void onCrossingIteration(int iteration, int crossings) override {
        LOG_DEBUG("crossing sweep {}: {} crossings", iteration, crossings);
    }
};

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open options file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        printUsage(argv[0]);
        return 1;
    }

    LayoutRequest request;
    request.source = argv[2];
    request.destination = argv[3];
    request.maxDegree = 3;

    std::string optionsPath;
    std::string outPath;
    std::string logDir;
    bool verbose = false;

    try {
        for (int i = 4; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.find("--degree=") == 0) {
                request.maxDegree = std::stoi(arg.substr(9));
            } else if (arg.find("--category=") == 0) {
                request.filter.category = arg.substr(11);
            } else if (arg.find("--min-importance=") == 0) {
                request.filter.minImportance = std::stod(arg.substr(17));
            } else if (arg.find("--options=") == 0) {
                optionsPath = arg.substr(10);
            } else if (arg.find("--out=") == 0) {
                outPath = arg.substr(6);
            } else if (arg.find("--log-dir=") == 0) {
                logDir = arg.substr(10);
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }

    if (logDir.empty()) {
        Logger::initialize();
    } else {
        Logger::initialize(logDir, true);
    }
    // Pipeline progress is only shown with --verbose
    if (!verbose) {
        Logger::setLevel(LogLevel::Warn);
    }

    try {
        ContestGraph graph = LayoutSerializer::loadContestGraph(argv[1]);

        LayoutOptions options;
        if (!optionsPath.empty()) {
            options = LayoutOptions::fromJson(readFile(optionsPath));
        }

        LoggingObserver observer;
        ComparisonLayout layout(options);
        layout.setObserver(&observer);

        LayoutResult result = layout.layout(graph, request);
        if (result.isEmpty()) {
            LOG_INFO("no connection between {} and {} within {} hops",
                     graph.label(request.source), graph.label(request.destination), request.maxDegree);
        }

        if (outPath.empty()) {
            std::cout << LayoutSerializer::toJson(result) << "\n";
        } else if (!LayoutSerializer::saveToFile(result, outPath)) {
            Logger::flush();
            return 1;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        Logger::flush();
        return 1;
    }

    Logger::flush();
    return 0;
}
