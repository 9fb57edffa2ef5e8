#include "bridge/Graph.hpp"
#include "adapters/GraphSageAdapter.hpp"
#include "postgres/PostgresGraphDatabase.hpp"
#include "storage/SqliteGraphDatabase.hpp"
#include "util/Config.hpp"
#include "util/Logger.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>

using util::Config;
using util::Logger;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " --from FORMAT --to FORMAT [options]\n"
              << "Formats: graphsage, database, boost_graph\n"
              << "Options:\n"
              << "  --prefix NAME          GraphSAGE input prefix\n"
              << "  --dir PATH             GraphSAGE input directory (default: .)\n"
              << "  --out-prefix NAME      GraphSAGE output prefix (default: input prefix)\n"
              << "  --out-dir PATH         GraphSAGE output directory (default: .)\n"
              << "  --sqlite PATH          SQLite database to read from\n"
              << "  --out-sqlite PATH      SQLite database to write to\n"
              << "  --postgres CONN        PostgreSQL connection string or path to config file\n"
              << "                         String: \"host=localhost port=5432 dbname=mydb user=postgres\"\n"
              << "                         File: @/path/to/postgres.conf (one param per line)\n"
              << "  --flatten              Stitch per-class node features into one matrix\n"
              << "  --walks MODE           Walk list check: permissive, strict (default: permissive)\n"
              << "  --config FILE          Parameters file (key=value lines); flags override it\n"
              << "  -l, --log-level LVL    Log level: debug, info, warn, error (default: info)\n"
              << "  --log-file PATH        Also write log lines to a file\n"
              << "  -h, --help             Show this help\n";
}

std::shared_ptr<adapters::GraphDatabase> openPostgres(const std::string& conn) {
    std::string connString = conn;
    if (!conn.empty() && conn[0] == '@') {
        connString = Config::readConnectionFile(conn);
    }
    return std::make_shared<postgres::PostgresGraphDatabase>(connString);
}

/**
 * Database collaborator for one side of the conversion: the SQLite file if
 * one is named, PostgreSQL otherwise
 */
std::shared_ptr<adapters::GraphDatabase> openDatabase(const Config& config, const std::string& sqliteKey) {
    if (auto path = config.get(sqliteKey)) {
        return std::make_shared<storage::SqliteGraphDatabase>(*path);
    }
    if (auto conn = config.get("postgres")) {
        return openPostgres(*conn);
    }
    throw std::invalid_argument("The database format needs --" +
                                std::string(sqliteKey == "sqlite" ? "sqlite" : "out-sqlite") +
                                " or --postgres");
}

bridge::Graph loadSource(const Config& config, adapters::Format from, adapters::WalkOrderPolicy policy) {
    switch (from) {
        case adapters::Format::GraphSage: {
            auto prefix = config.get("prefix");
            if (!prefix) {
                throw std::invalid_argument("Reading GraphSAGE needs --prefix");
            }
            return bridge::Graph::fromGraphSage(*prefix, config.get("dir", "."), policy);
        }
        case adapters::Format::Database:
            return bridge::Graph::fromDatabase(openDatabase(config, "sqlite"));
        case adapters::Format::BoostGraph:
            break;
    }
    throw std::invalid_argument("boost_graph only exists in memory and cannot be read from the command line");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        Config flags;
        std::string configFile;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--from" && i + 1 < argc) {
                flags.set("from", argv[++i]);
            } else if (arg == "--to" && i + 1 < argc) {
                flags.set("to", argv[++i]);
            } else if (arg == "--prefix" && i + 1 < argc) {
                flags.set("prefix", argv[++i]);
            } else if (arg == "--dir" && i + 1 < argc) {
                flags.set("dir", argv[++i]);
            } else if (arg == "--out-prefix" && i + 1 < argc) {
                flags.set("out_prefix", argv[++i]);
            } else if (arg == "--out-dir" && i + 1 < argc) {
                flags.set("out_dir", argv[++i]);
            } else if (arg == "--sqlite" && i + 1 < argc) {
                flags.set("sqlite", argv[++i]);
            } else if (arg == "--out-sqlite" && i + 1 < argc) {
                flags.set("out_sqlite", argv[++i]);
            } else if (arg == "--postgres" && i + 1 < argc) {
                flags.set("postgres", argv[++i]);
            } else if (arg == "--flatten") {
                flags.set("flatten", "true");
            } else if (arg == "--walks" && i + 1 < argc) {
                flags.set("walks", argv[++i]);
            } else if (arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                flags.set("log_level", argv[++i]);
            } else if (arg == "--log-file" && i + 1 < argc) {
                flags.set("log_file", argv[++i]);
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        // Flags override the parameters file
        Config config;
        if (!configFile.empty()) {
            config = Config::fromFile(configFile[0] == '@' ? configFile.substr(1) : configFile);
        }
        for (const auto& [key, value] : flags.values()) {
            config.set(key, value);
        }

        // Configure Logger
        if (auto level = config.get("log_level")) {
            auto parsed = Logger::parseLevel(*level);
            if (!parsed) {
                std::cerr << "Error: Unknown log level: " << *level << std::endl;
                return 1;
            }
            Logger::instance().setLevel(*parsed);
        }
        if (auto logFile = config.get("log_file")) {
            Logger::instance().enableFileLogging(*logFile);
        }
        if (!configFile.empty()) {
            LOG_INFO("Loaded " + Logger::formatCount(config.size(), "parameter"));
        }

        auto fromTag = config.get("from");
        auto toTag = config.get("to");
        if (!fromTag || !toTag) {
            std::cerr << "Error: --from and --to are required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        const adapters::Format from = adapters::stringToFormat(*fromTag);
        const adapters::Format to = adapters::stringToFormat(*toTag);
        const auto policy = adapters::stringToWalkOrderPolicy(config.get("walks", "permissive"));

        adapters::SerializeOptions options;
        options.flattenClasses = config.getBool("flatten", false);

        bridge::Graph graph = loadSource(config, from, policy);
        LOG_INFO("Source graph:\n" + graph.model().summary());

        adapters::AdapterOptions adapterOptions;
        adapterOptions.walkPolicy = policy;
        if (to == adapters::Format::Database) {
            adapterOptions.database = openDatabase(config, "out_sqlite");
        }

        graph.convertInplace(to, options, adapterOptions);

        if (to == adapters::Format::GraphSage) {
            auto& sage = dynamic_cast<adapters::GraphSageAdapter&>(graph.adapter());
            const std::string outPrefix = config.get("out_prefix", config.get("prefix", "graph"));
            const std::string outDir = config.get("out_dir", ".");
            sage.save(outPrefix, outDir);
            LOG_INFO("Wrote GraphSAGE dataset '" + outPrefix + "' to " + outDir);
        }

        std::cout << graph.describe();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
