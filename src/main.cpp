#include "http_client.hpp"
#include "http_transport.hpp"
#include "models.hpp"
#include "next_page.hpp"
#include "osu_client.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

using namespace osu_rankings;

struct Config {
    std::string endpoint  = "https://osu.ppy.sh/api/v2";
    std::string token;
    std::string mode      = "osu";
    std::string resource  = "performance";
    int         pages     = 2;
    int         timeoutMs = 5000;
    bool        verbose   = false;
};

static void printUsage() {
    std::cout
        << "Usage: osu_rankings [options]\n\n"
        << "Options:\n"
        << "  --endpoint URL   API base URL              "
           "(default: https://osu.ppy.sh/api/v2)\n"
        << "  --token T        OAuth access token\n"
        << "  --mode M         osu | taiko | fruits | mania (default: osu)\n"
        << "  --resource R     performance | score | country | charts | news\n"
        << "                                             (default: performance)\n"
        << "  --pages N        Pages to walk              (default: 2)\n"
        << "  --timeout-ms N   HTTP timeout in ms         (default: 5000)\n"
        << "  --verbose        Enable verbose diagnostics\n"
        << "  --help, -h       Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--endpoint") && i + 1 < argc) {
            cfg.endpoint = argv[++i];
        } else if ((arg == "--token") && i + 1 < argc) {
            cfg.token = argv[++i];
        } else if ((arg == "--mode") && i + 1 < argc) {
            cfg.mode = argv[++i];
        } else if ((arg == "--resource") && i + 1 < argc) {
            cfg.resource = argv[++i];
        } else if ((arg == "--pages") && i + 1 < argc) {
            cfg.pages = std::stoi(argv[++i]);
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return cfg;
}

static void printRankings(const Rankings& page, std::size_t offset) {
    for (std::size_t i = 0; i < page.items().size(); ++i) {
        const auto& user  = page.items()[i];
        const auto& stats = *user.statistics;
        std::cout << std::setw(6) << (offset + i + 1) << "  "
                  << std::left << std::setw(20) << user.username
                  << std::setw(4) << user.countryCode << std::right
                  << std::fixed << std::setprecision(2)
                  << std::setw(12) << stats.pp
                  << std::setw(8) << stats.accuracy << "%\n";
    }
}

static void printCountries(const CountryRankings& page, std::size_t offset) {
    for (std::size_t i = 0; i < page.items().size(); ++i) {
        const auto& country = page.items()[i];
        std::cout << std::setw(6) << (offset + i + 1) << "  "
                  << std::left << std::setw(4) << country.countryCode
                  << std::setw(28) << country.country << std::right
                  << std::setw(10) << country.activeUsers
                  << std::fixed << std::setprecision(0)
                  << std::setw(14) << country.pp << "\n";
    }
}

static void printNews(const News& page) {
    for (const auto& post : page.items()) {
        std::cout << "  " << post.publishedAt.substr(0, 10) << "  "
                  << post.title << "  (" << post.author << ")\n";
    }
}

/// Fetch the first page with @p first, then follow cursors until the
/// page budget is spent or the listing is exhausted.
template <typename Page, typename First, typename Print>
static std::size_t walk(const NextPageDispatcher& dispatcher, int maxPages,
                        First first, Print print, int& pagesFetched) {
    Page page = first().get();
    std::size_t entries = 0;

    while (true) {
        ++pagesFetched;
        print(page, entries);
        entries += page.items().size();

        if (pagesFetched >= maxPages) {
            break;
        }
        auto next = dispatcher.next(page);
        if (!next) {
            std::cout << "-- no more pages --\n";
            break;
        }
        page = next->get();
    }
    return entries;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);
        const GameMode mode = parseGameMode(cfg.mode);

        std::cout
            << "=== osu_rankings ===\n"
            << "Endpoint:   " << cfg.endpoint  << "\n"
            << "Mode:       " << cfg.mode      << "\n"
            << "Resource:   " << cfg.resource  << "\n"
            << "Pages:      " << cfg.pages     << "\n"
            << "Timeout:    " << cfg.timeoutMs << " ms\n"
            << "Verbose:    " << (cfg.verbose ? "yes" : "no") << "\n"
            << "====================\n\n";

        HttpClient client(cfg.endpoint, cfg.token, cfg.timeoutMs);
        client.setVerbose(cfg.verbose);
        HttpTransport transport(client, cfg.verbose);
        OsuClient osu(transport, cfg.verbose);
        NextPageDispatcher dispatcher(osu);

        int pagesFetched = 0;
        std::size_t entries = 0;

        if (cfg.resource == "news") {
            entries = walk<News>(
                dispatcher, cfg.pages,
                [&] { return osu.news(); },
                [](const News& page, std::size_t) { printNews(page); },
                pagesFetched);
        } else {
            const RankingType type = parseRankingType(cfg.resource);

            if (const auto kind = toDispatchable(type)) {
                entries = walk<Rankings>(
                    dispatcher, cfg.pages,
                    [&] { return osu.rankings(mode, *kind); },
                    printRankings, pagesFetched);
            } else if (type == RankingType::Country) {
                entries = walk<CountryRankings>(
                    dispatcher, cfg.pages,
                    [&] { return osu.countryRankings(mode); },
                    printCountries, pagesFetched);
            } else {
                // Charts are a single page per spotlight.
                auto chart = osu.chartRankings(mode).get();
                std::cout << "Spotlight: " << chart.spotlight.name << "\n";
                for (std::size_t i = 0; i < chart.ranking.size(); ++i) {
                    std::cout << std::setw(6) << (i + 1) << "  "
                              << chart.ranking[i].username << "\n";
                }
                entries = chart.ranking.size();
                pagesFetched = 1;
            }
        }

        const auto stats = transport.getStats();
        std::cout
            << "\n=== Summary Report ===\n"
            << "Pages fetched:       " << pagesFetched        << "\n"
            << "Entries:             " << entries             << "\n"
            << "HTTP requests:       " << stats.totalRequests << "\n"
            << "Retries:             " << stats.totalRetries  << "\n"
            << "======================\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
