/**
 * @file worldgen_demo.cpp
 * @brief Command-line driver: generate a world and print a summary
 *
 * Usage:
 *   worldgen_demo [--seed N] [--size WxH] [--config file.conf]
 *                 [--export file.tgc] [--map] [--threads N] [--verbose]
 */

#include "tectogen/core/config_parser.hpp"
#include "tectogen/worldgen/generation_params.hpp"
#include "tectogen/worldgen/world_chunk_io.hpp"
#include "tectogen/worldgen/world_generator.hpp"

#include <array>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace tectogen;
using namespace tectogen::worldgen;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--seed N] [--size WxH] [--config file.conf] [--export file.tgc]"
                 " [--map] [--threads N] [--verbose]\n";
}

bool parseSize(const std::string& text, int32_t& width, int32_t& height) {
    auto x = text.find_first_of("xX");
    if (x == std::string::npos) return false;
    char* end = nullptr;
    long w = std::strtol(text.c_str(), &end, 10);
    if (end != text.c_str() + x) return false;
    long h = std::strtol(text.c_str() + x + 1, &end, 10);
    if (*end != '\0') return false;
    width = static_cast<int32_t>(w);
    height = static_cast<int32_t>(h);
    return true;
}

void printMap(const WorldData& world) {
    for (int32_t y = 0; y < world.height(); ++y) {
        std::string row;
        row.reserve(static_cast<size_t>(world.width()));
        for (int32_t x = 0; x < world.width(); ++x) {
            row.push_back(biomeProperties(world.biomeAt(x, y)).mapSymbol);
        }
        std::cout << row << "\n";
    }
}

void printSummary(const WorldData& world) {
    std::cout << "World " << world.width() << "x" << world.height()
              << ", seed " << world.seed() << "\n";

    std::cout << "\nPlates (" << world.plates().size() << "):\n";
    for (const auto& plate : world.plates()) {
        std::cout << "  #" << plate.id() << " " << plateKindName(plate.kind())
                  << " at (" << plate.center().x << ", " << plate.center().y << ")"
                  << ", drift (" << std::fixed << std::setprecision(3)
                  << plate.drift().x << ", " << plate.drift().y << ")"
                  << ", " << plate.tiles().size() << " tiles\n";
    }

    std::array<size_t, kBiomeCount> biomeTiles{};
    for (Biome biome : world.biomes()) {
        ++biomeTiles[static_cast<size_t>(biome)];
    }
    std::cout << "\nBiomes:\n";
    for (const auto& props : kBiomeTable) {
        size_t count = biomeTiles[static_cast<size_t>(props.biome)];
        if (count == 0) continue;
        std::cout << "  " << props.mapSymbol << " " << props.displayName << ": " << count << "\n";
    }

    std::cout << "\nRivers (" << world.rivers().size() << "):\n";
    for (const auto& river : world.rivers()) {
        std::cout << "  #" << river.id() << " (" << river.source().x << ", " << river.source().y
                  << ") -> (" << river.terminus().x << ", " << river.terminus().y << ")"
                  << ", " << river.length() << " tiles"
                  << (river.isLake() ? ", ends in lake" : ", reaches ocean") << "\n";
    }

    std::cout << "\nFeatures (" << world.features().size() << "):\n";
    for (const auto& feature : world.features()) {
        std::cout << "  #" << feature.id << " " << featureTypeName(feature.type)
                  << " at (" << feature.x << ", " << feature.y << ")"
                  << ", intensity " << std::setprecision(2) << feature.intensity
                  << ": " << feature.effectDescription() << "\n";
    }

    std::cout << "\nChecksum: " << world.checksum() << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    uint64_t seed = 123456789ULL;
    int32_t width = 128;
    int32_t height = 128;
    std::optional<std::string> configPath;
    std::optional<std::string> exportPath;
    std::optional<size_t> threads;
    bool showMap = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--seed" && hasValue) {
            seed = std::strtoull(argv[++i], nullptr, 0);
        } else if (arg == "--size" && hasValue) {
            if (!parseSize(argv[++i], width, height)) {
                std::cerr << "Invalid --size, expected WxH\n";
                return 1;
            }
        } else if (arg == "--config" && hasValue) {
            configPath = argv[++i];
        } else if (arg == "--export" && hasValue) {
            exportPath = argv[++i];
        } else if (arg == "--threads" && hasValue) {
            threads = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--map") {
            showMap = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    GenerationParams params;
    if (configPath) {
        ConfigParser parser;
        auto doc = parser.parseFile(*configPath);
        if (!doc) {
            std::cerr << "Failed to open config file: " << *configPath << "\n";
            return 1;
        }
        params = loadGenerationParams(*doc);
        if (auto* entry = doc->get("seed")) {
            seed = entry->value.asUInt64(seed);
        }
    }
    if (threads) params.threads = *threads;
    if (verbose) params.verbose = true;

    try {
        WorldData world = WorldGenerator::generate(seed, width, height, params);
        printSummary(world);

        if (showMap) {
            std::cout << "\n";
            printMap(world);
        }

        if (exportPath) {
            saveWorldChunk(world, *exportPath);
            std::cout << "\nExported elevation chunk to " << *exportPath << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Generation failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
