// Config
#include "config/Config.hpp"

// Storage
#include "storage/Gateway.hpp"
#include "storage/Errors.hpp"

// Move
#include "move/Coordinator.hpp"

// Database
#include "database/Transactions.hpp"
#include "database/Queries/MoveIntentQueries.hpp"

// Misc
#include "log/Registry.hpp"

// Libraries
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fmt/core.h>
#include <iostream>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace mg;
using namespace mg::storage;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) { shouldExit = true; }

void usage() {
    std::cerr << "usage: mediagate <config.yaml> <command> [args...]\n"
                 "  stat  <path>\n"
                 "  cat   <path>\n"
                 "  put   <local-file> <path> [--checksum]\n"
                 "  cp    <from> <to>\n"
                 "  mv    <from> <to>\n"
                 "  rm    <path>\n"
                 "  df    <root>\n"
                 "  crawl <root>... [--hidden] [--exclude <glob>]... [--ext <.ext>]...\n"
                 "  watch <root>... [--initial]\n"
                 "  move  <entity-id> <kind> <old-path> <new-path> [--size <bytes> [--checksum <sha1>]]\n";
}

std::vector<std::string> positional(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i].starts_with("--")) {
            if (args[i] == "--exclude" || args[i] == "--ext" || args[i] == "--size" || args[i] == "--checksum") ++i;
            continue;
        }
        out.push_back(args[i]);
    }
    return out;
}

std::vector<std::string> flagValues(const std::vector<std::string>& args, const std::string& flag) {
    std::vector<std::string> out;
    for (size_t i = 0; i + 1 < args.size(); ++i)
        if (args[i] == flag) out.push_back(args[i + 1]);
    return out;
}

bool hasFlag(const std::vector<std::string>& args, const std::string& flag) {
    return std::ranges::find(args, flag) != args.end();
}

void require(const std::vector<std::string>& pos, const size_t n) {
    if (pos.size() < n) throw std::invalid_argument(fmt::format("expected {} argument(s), got {}", n, pos.size()));
}

int runMove(const config::Config& cfg, const std::shared_ptr<Gateway>& gateway, const std::vector<std::string>& args) {
    const auto pos = positional(args);
    require(pos, 4);

    database::Transactions::init(cfg.database);

    std::optional<move::AssetInfo> assetInfo;
    const auto sizes = flagValues(args, "--size");
    const auto sums = flagValues(args, "--checksum");
    if (!sizes.empty()) {
        assetInfo = move::AssetInfo{.sizeInBytes = std::stoull(sizes.front())};
        if (!sums.empty()) assetInfo->checksum = sums.front();
    } else if (!sums.empty()) {
        throw std::invalid_argument("--checksum requires --size");
    }

    move::Coordinator coordinator(
        gateway,
        std::make_shared<database::MoveIntentQueries>(),
        [](const move::PathKind kind, const std::string& entityId, const std::string& newPath) {
            // the owning record lives with the caller; report the commit so it can be applied
            std::cout << nlohmann::json{{"entity_id", entityId}, {"path_kind", std::string(move::to_string(kind))}, {"new_path", newPath}}.dump()
                      << std::endl;
        },
        layout::LayoutConfig{cfg.storage.media_location},
        cfg.storage.hash_verification_enabled);

    const auto result = coordinator.moveFile({
        .entityId = pos[0],
        .pathKind = move::pathKindFromString(pos[1]),
        .oldPath = pos[2],
        .newPath = pos[3],
        .assetInfo = assetInfo
    });

    std::cerr << fmt::format("{}{}", move::to_string(result.state), result.reason.empty() ? "" : ": " + result.reason)
              << std::endl;
    return result.settled() ? 0 : 1;
}

int runWatch(const std::shared_ptr<Gateway>& gateway, const std::vector<std::string>& args) {
    const auto roots = positional(args);
    require(roots, 1);

    const auto print = [](const char* event) {
        return [event](const std::string& path) {
            std::cout << nlohmann::json{{"event", event}, {"path", path}}.dump() << std::endl;
        };
    };

    auto handle = gateway->watch(roots, {.recursive = true, .ignoreInitial = !hasFlag(args, "--initial")}, {
        .onReady = [] { log::Registry::mediagate()->info("[main] Watching for changes, Ctrl+C to stop"); },
        .onAdd = print("add"),
        .onChange = print("change"),
        .onUnlink = print("unlink"),
        .onError = print("error")
    });

    while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    handle.close();
    return 0;
}

int dispatch(const config::Config& cfg, const std::string& cmd, const std::vector<std::string>& args) {
    const auto gateway = std::make_shared<Gateway>(cfg.storage, cfg.object_store);
    const auto pos = positional(args);

    if (cmd == "stat") {
        require(pos, 1);
        std::cout << nlohmann::json(gateway->stat(pos[0])).dump(2) << std::endl;
    } else if (cmd == "cat") {
        require(pos, 1);
        auto rs = gateway->createReadStream(pos[0]);
        std::cout << rs.stream->rdbuf();
    } else if (cmd == "put") {
        require(pos, 2);
        std::ifstream in(pos[0], std::ios::binary);
        if (!in) throw NotFoundError("Cannot open local file: " + pos[0]);
        const auto res = gateway->uploadFromStream(in, pos[1], {.computeChecksum = hasFlag(args, "--checksum")});
        std::cout << nlohmann::json(res).dump(2) << std::endl;
    } else if (cmd == "cp") {
        require(pos, 2);
        gateway->copy(pos[0], pos[1]);
    } else if (cmd == "mv") {
        require(pos, 2);
        gateway->rename(pos[0], pos[1]);
    } else if (cmd == "rm") {
        require(pos, 1);
        gateway->unlink(pos[0]);
    } else if (cmd == "df") {
        require(pos, 1);
        std::cout << nlohmann::json(gateway->checkDiskUsage(pos[0])).dump(2) << std::endl;
    } else if (cmd == "crawl") {
        require(pos, 1);
        CrawlOptions opts{
            .roots = pos,
            .exclusionPatterns = flagValues(args, "--exclude"),
            .includeHidden = hasFlag(args, "--hidden"),
            .extensions = flagValues(args, "--ext")
        };
        if (opts.extensions.empty()) opts.extensions = cfg.storage.supported_extensions;
        auto walker = gateway->walk(opts);
        while (auto batch = walker.next())
            for (const auto& path : *batch) std::cout << path << '\n';
    } else if (cmd == "watch") {
        return runWatch(gateway, args);
    } else if (cmd == "move") {
        return runMove(cfg, gateway, args);
    } else {
        usage();
        return 2;
    }
    return 0;
}
}

int main(const int argc, char** argv) {
    if (argc < 3) {
        usage();
        return 2;
    }

    try {
        const auto cfg = config::loadConfig(argv[1]);
        log::Registry::init(cfg.logging);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const std::vector<std::string> args(argv + 3, argv + argc);
        return dispatch(cfg, argv[2], args);
    } catch (const StorageError& e) {
        std::cerr << fmt::format("mediagate: {} ({})", e.what(), to_string(e.kind())) << std::endl;
        if (log::Registry::isInitialized())
            log::Registry::mediagate()->error("[main] {} failed: {}", argv[2], e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "mediagate: " << e.what() << std::endl;
        return 1;
    }
}
