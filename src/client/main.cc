#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../broadcast/stats_request.h"
#include "../broadcast/suggest_builder.h"
#include "../common/configuration.h"
#include "../common/document.h"
#include "../dispatch/broadcast_dispatcher.h"
#include "../dispatch/fixture_cluster.h"
#include "../stats/indices_stats_response.h"

namespace {

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool ReadFile(const std::string& path, std::string& contents) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG(ERROR) << "Cannot open " << path;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    contents = buffer.str();
    return true;
}

bool WriteFile(const std::string& path, const std::string& contents) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        LOG(ERROR) << "Cannot open " << path << " for writing";
        return false;
    }
    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    return static_cast<bool>(file);
}

} // end of namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options("statfan_cli", "Broadcast an indices stats request and render the response");

    options.add_options()
        ("config", "Configuration file", cxxopts::value<std::string>())
        ("cluster", "Cluster fixture file", cxxopts::value<std::string>())
        ("indices", "Comma separated indices, empty for all", cxxopts::value<std::string>()->default_value(""))
        ("routing", "Comma separated routing values", cxxopts::value<std::string>())
        ("preference", "Shard copy preference (_primary, _replica, _shards:0,1)", cxxopts::value<std::string>())
        ("query", "Query payload text", cxxopts::value<std::string>())
        ("query_file", "Read the query payload from a file", cxxopts::value<std::string>())
        ("suggest_text", "Build a term suggestion payload for this text", cxxopts::value<std::string>())
        ("suggest_field", "Field of the term suggestion", cxxopts::value<std::string>()->default_value("_all"))
        ("level", "Render level: cluster, indices or shards", cxxopts::value<std::string>())
        ("format", "Render format: yaml or flow", cxxopts::value<std::string>())
        ("binary_out", "Also write the binary response to this file", cxxopts::value<std::string>())
        ("binary_in", "Render a previously written binary response instead of dispatching",
            cxxopts::value<std::string>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid arguments: " << e.what();
        std::cerr << options.help() << std::endl;
        return EXIT_FAILURE;
    }
    const cxxopts::ParseResult& arguments = *parsed;

    if (arguments.count("help")) {
        std::cout << options.help() << std::endl;
        return EXIT_SUCCESS;
    }
    FLAGS_v = arguments["log_level"].as<int>();

    Statfan::Configuration& config = Statfan::Configuration::getInstance();
    if (arguments.count("config")) {
        if (!config.loadFromFile(arguments["config"].as<std::string>())) {
            return EXIT_FAILURE;
        }
    } else if (!config.validate()) {
        for (const auto& error : config.getValidationErrors()) {
            LOG(ERROR) << "Invalid configuration: " << error;
        }
        return EXIT_FAILURE;
    }

    const std::string level = arguments.count("level") ? arguments["level"].as<std::string>()
                                                       : config.getRenderLevel();
    const std::string format_name = arguments.count("format") ? arguments["format"].as<std::string>()
                                                              : config.getRenderFormat();
    auto format = Statfan::ParseDocumentFormat(format_name);
    if (!format) {
        LOG(ERROR) << "Unknown format " << format_name;
        return EXIT_FAILURE;
    }

    // Kept alive until dispatch is over; a borrowed payload may point into it.
    std::string query_buffer;

    try {
        // Responses carry compute-once caches and are not assignable.
        std::optional<Statfan::IndicesStatsResponse> response;

        if (arguments.count("binary_in")) {
            std::string bytes;
            if (!ReadFile(arguments["binary_in"].as<std::string>(), bytes)) {
                return EXIT_FAILURE;
            }
            response.emplace(Statfan::IndicesStatsResponse::FromBytes(bytes, config.getStreamLimits()));
        } else {
            if (!arguments.count("cluster")) {
                LOG(ERROR) << "Either --cluster or --binary_in is required";
                return EXIT_FAILURE;
            }
            auto cluster = Statfan::FixtureCluster::FromFile(arguments["cluster"].as<std::string>(),
                                                             config.getStreamLimits());

            Statfan::StatsRequest request(SplitList(arguments["indices"].as<std::string>()));
            if (arguments.count("routing")) {
                request.SetRouting(SplitList(arguments["routing"].as<std::string>()));
            }
            if (arguments.count("preference")) {
                request.SetPreference(arguments["preference"].as<std::string>());
            }
            if (arguments.count("query_file")) {
                if (!ReadFile(arguments["query_file"].as<std::string>(), query_buffer)) {
                    return EXIT_FAILURE;
                }
                request.SetPayload(Statfan::PayloadBytes::Borrow(query_buffer.data(), query_buffer.size()), true);
            } else if (arguments.count("query")) {
                request.SetPayload(arguments["query"].as<std::string>());
            } else if (arguments.count("suggest_text")) {
                Statfan::SuggestionBuilder suggestion("suggest", Statfan::SuggestionBuilder::Type::kTerm);
                suggestion.Text(arguments["suggest_text"].as<std::string>())
                    .Field(arguments["suggest_field"].as<std::string>());
                request.SetPayload(suggestion);
            }

            Statfan::BroadcastDispatcher dispatcher(*cluster, *cluster,
                                                    Statfan::DispatchOptions::FromConfig(config));
            response.emplace(dispatcher.Execute(request));
            LOG(INFO) << "Stats collected from " << response->successful_shards() << " of "
                      << response->total_shards() << " shards";
        }

        if (arguments.count("binary_out")) {
            if (!WriteFile(arguments["binary_out"].as<std::string>(), response->ToBytes())) {
                return EXIT_FAILURE;
            }
        }

        Statfan::Document document = Statfan::NewMapDocument();
        if (!response->Render(document, level)) {
            LOG(WARNING) << "Unknown level " << level << ", nothing rendered";
        }
        std::cout << Statfan::EmitDocument(document, *format) << std::endl;
    } catch (const Statfan::CodecError& e) {
        LOG(ERROR) << "Decode failed: " << e.what();
        return EXIT_FAILURE;
    } catch (const Statfan::IndexNotFoundError& e) {
        LOG(ERROR) << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
