#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/AnalyticsPipeline.hpp"
#include "application/IdentityAnalyticsService.hpp"
#include "domain/AnalyticsErrors.hpp"
#include "domain/Clock.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/IdentityStateRepositoryFs.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fs = std::filesystem;
using namespace healthiq;
using json = nlohmann::json;

namespace {

struct CommandLine {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
};

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  healthiq compute <events.json> [--previous <hsi.json>] [--now <iso>] [--top-n N]\n"
              << "                   [--config <settings.json>] [--output <result.json>]\n"
              << "  healthiq ingest <state-dir> <identity> <events.json> [--now <iso>]\n"
              << "                  [--config <settings.json>] [--output <result.json>]\n";
}

CommandLine ParseCommandLine(int argc, char** argv) {
    static const std::set<std::string> kValued = {"--previous", "--now", "--top-n", "--config", "--output"};

    CommandLine cli;
    if (argc < 2) throw std::invalid_argument("missing command");
    cli.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (!kValued.count(arg)) throw std::invalid_argument("unknown option " + arg);
            if (i + 1 >= argc) throw std::invalid_argument("option " + arg + " needs a value");
            cli.options[arg] = argv[++i];
        } else {
            cli.positional.push_back(arg);
        }
    }
    return cli;
}

std::optional<std::string> Option(const CommandLine& cli, const std::string& name) {
    auto it = cli.options.find(name);
    if (it == cli.options.end()) return std::nullopt;
    return it->second;
}

json ReadJson(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Cannot open " + path);
    try {
        json j;
        in >> j;
        return j;
    } catch (const json::parse_error& e) {
        throw domain::MalformedEventError("Invalid JSON in " + path + ": " + e.what());
    }
}

void WriteResult(const CommandLine& cli, const json& result) {
    auto output = Option(cli, "--output");
    if (!output) {
        std::cout << result.dump(2) << std::endl;
        return;
    }
    std::ofstream out(*output);
    if (!out.is_open()) throw std::runtime_error("Cannot write " + *output);
    out << result.dump(2) << std::endl;
    std::cerr << "[healthiq] Result written to " << *output << std::endl;
}

domain::AnalyticsConfig LoadConfig(const CommandLine& cli) {
    if (auto path = Option(cli, "--config")) {
        return infrastructure::ConfigLoader::LoadAnalyticsConfigFile(*path);
    }
    return infrastructure::ConfigLoader::LoadAnalyticsConfig(fs::current_path().string());
}

std::shared_ptr<const domain::Clock> MakeClock(const CommandLine& cli) {
    if (auto now = Option(cli, "--now")) {
        return std::make_shared<domain::FixedClock>(domain::ParseIsoTimestamp(*now));
    }
    return std::make_shared<domain::SystemClock>();
}

std::optional<int> TopN(const CommandLine& cli) {
    auto raw = Option(cli, "--top-n");
    if (!raw) return std::nullopt;
    try {
        size_t used = 0;
        int value = std::stoi(*raw, &used);
        if (used != raw->size()) throw std::invalid_argument(*raw);
        return value;
    } catch (const std::logic_error&) {
        throw domain::ConfigurationError("--top-n must be an integer, got '" + *raw + "'");
    }
}

int RunCompute(const CommandLine& cli) {
    if (cli.positional.size() != 1) throw std::invalid_argument("compute takes exactly one events file");

    application::AnalyticsPipeline pipeline(LoadConfig(cli), MakeClock(cli));
    auto input = infrastructure::JsonCodec::DecodeComputeInput(ReadJson(cli.positional[0]));
    if (auto previous = Option(cli, "--previous")) {
        input.previousHSI = infrastructure::JsonCodec::DecodeHSIScore(ReadJson(*previous));
    }
    std::cerr << "[healthiq] Computing analytics over " << input.events.size() << " event(s)" << std::endl;

    auto result = pipeline.compute(input.events, input.previousHSI, TopN(cli));
    WriteResult(cli, infrastructure::JsonCodec::EncodeResult(result));
    return EXIT_SUCCESS;
}

int RunIngest(const CommandLine& cli) {
    if (cli.positional.size() != 3) throw std::invalid_argument("ingest takes <state-dir> <identity> <events.json>");
    const std::string& stateDir = cli.positional[0];
    const std::string& identity = cli.positional[1];

    auto pipeline = std::make_shared<const application::AnalyticsPipeline>(LoadConfig(cli), MakeClock(cli));
    application::AnalyticsStores stores{
        std::make_shared<infrastructure::GraphStore>(),
        std::make_shared<infrastructure::AlertStore>(pipeline->config().alertDedupWindow),
        std::make_shared<infrastructure::HsiHistoryStore>(),
    };
    application::IdentityAnalyticsService service(pipeline, stores);

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    infrastructure::IdentityStateRepositoryFs repository(stateDir, persistence);

    std::vector<domain::HealthEvent> history;
    if (auto snapshot = repository.load(identity)) {
        service.importState(identity, *snapshot);
        history = std::move(snapshot->events);
        std::cerr << "[healthiq] Restored " << identity << " with " << history.size() << " event(s)" << std::endl;
    }

    std::set<std::string> seen;
    for (const auto& event : history) seen.insert(domain::IdOf(event));

    auto incoming = infrastructure::JsonCodec::DecodeEvents(ReadJson(cli.positional[2]));
    size_t ingested = 0;
    for (const auto& event : incoming) {
        if (!seen.insert(domain::IdOf(event)).second) {
            std::cerr << "[healthiq] Skipping already ingested event " << domain::IdOf(event) << std::endl;
            continue;
        }
        service.ingest(identity, event, history);
        history.push_back(event);
        ++ingested;
    }
    std::cerr << "[healthiq] Ingested " << ingested << " new event(s) for " << identity << std::endl;

    auto result = service.refresh(identity, history);
    repository.save(identity, service.exportState(identity, history));
    persistence->flush();
    persistence->stop();
    if (persistence->failedWrites() > 0) {
        std::cerr << "[healthiq] " << persistence->failedWrites() << " snapshot write(s) failed" << std::endl;
        return EXIT_FAILURE;
    }

    WriteResult(cli, infrastructure::JsonCodec::EncodeResult(result));
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cli;
    try {
        cli = ParseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[healthiq] " << e.what() << std::endl;
        PrintUsage();
        return 2;
    }

    try {
        if (cli.command == "compute") return RunCompute(cli);
        if (cli.command == "ingest") return RunIngest(cli);
        std::cerr << "[healthiq] Unknown command: " << cli.command << std::endl;
        PrintUsage();
        return 2;
    } catch (const domain::MalformedEventError& e) {
        std::cerr << "[healthiq] Malformed input: " << e.what() << std::endl;
        return 3;
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "[healthiq] Configuration error: " << e.what() << std::endl;
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "[healthiq] Error: " << e.what() << std::endl;
        return 1;
    }
}
