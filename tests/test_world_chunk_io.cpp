#include <gtest/gtest.h>
#include "tectogen/core/cbor.hpp"
#include "tectogen/worldgen/world_chunk_io.hpp"
#include "tectogen/worldgen/world_generator.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace tectogen;
using namespace tectogen::worldgen;

class WorldChunkIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = std::filesystem::temp_directory_path() /
                   ("tectogen_chunk_test_" + std::string(
                       ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir_);
    }

    std::vector<uint8_t> readFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }

    static WorldChunk sampleChunk() {
        Grid2D<float> elevation(5, 3, 0.0f);
        for (int32_t y = 0; y < 3; ++y) {
            for (int32_t x = 0; x < 5; ++x) {
                elevation(x, y) = static_cast<float>(x * 3 + y) / 17.0f;
            }
        }
        uint64_t checksum = gridChecksum(elevation);
        return WorldChunk{0xFEEDFACECAFEBEEFULL, std::move(elevation), checksum};
    }

    std::filesystem::path testDir_;
};

// ============================================================================
// CBOR serialization
// ============================================================================

TEST_F(WorldChunkIOTest, SerializePreservesFields) {
    auto chunk = sampleChunk();
    auto bytes = serializeWorldChunk(chunk);
    auto restored = deserializeWorldChunk(bytes);

    EXPECT_EQ(restored.seed, chunk.seed);
    EXPECT_EQ(restored.elevation, chunk.elevation);
    EXPECT_EQ(restored.elevationChecksum, chunk.elevationChecksum);
}

TEST_F(WorldChunkIOTest, UnknownKeysAreSkipped) {
    auto chunk = sampleChunk();
    auto original = serializeWorldChunk(chunk);

    // Rebuild the map with one extra entry in front
    std::vector<uint8_t> bytes;
    cbor::encodeMapHeader(bytes, 7);
    cbor::encodeString(bytes, "generator");
    cbor::encodeString(bytes, "tectogen");
    bytes.insert(bytes.end(), original.begin() + 1, original.end());

    auto restored = deserializeWorldChunk(bytes);
    EXPECT_EQ(restored.elevation, chunk.elevation);
}

TEST_F(WorldChunkIOTest, ChecksumMismatchRejected) {
    auto chunk = sampleChunk();
    chunk.elevationChecksum ^= 1;
    auto bytes = serializeWorldChunk(chunk);

    EXPECT_THROW((void)deserializeWorldChunk(bytes), std::runtime_error);
}

TEST_F(WorldChunkIOTest, TruncatedCborRejected) {
    auto bytes = serializeWorldChunk(sampleChunk());
    bytes.resize(bytes.size() / 2);

    EXPECT_THROW((void)deserializeWorldChunk(bytes), std::runtime_error);
}

TEST_F(WorldChunkIOTest, WrongVersionRejected) {
    std::vector<uint8_t> bytes;
    cbor::encodeMapHeader(bytes, 1);
    cbor::encodeString(bytes, "version");
    cbor::encodeInt(bytes, 99);

    EXPECT_THROW((void)deserializeWorldChunk(bytes), std::runtime_error);
}

TEST_F(WorldChunkIOTest, PayloadSizeMismatchRejected) {
    auto chunk = sampleChunk();

    std::vector<uint8_t> bytes;
    cbor::encodeMapHeader(bytes, 6);
    cbor::encodeString(bytes, "version");
    cbor::encodeInt(bytes, 1);
    cbor::encodeString(bytes, "seed");
    cbor::encodeUInt(bytes, chunk.seed);
    cbor::encodeString(bytes, "width");
    cbor::encodeInt(bytes, 1000);
    cbor::encodeString(bytes, "height");
    cbor::encodeInt(bytes, 1000);
    cbor::encodeString(bytes, "elevation");
    std::vector<uint8_t> payload(16, 0);
    cbor::encodeBytes(bytes, payload);
    cbor::encodeString(bytes, "checksum");
    cbor::encodeUInt(bytes, chunk.elevationChecksum);

    EXPECT_THROW((void)deserializeWorldChunk(bytes), std::runtime_error);
}

TEST_F(WorldChunkIOTest, NotAMapRejected) {
    std::vector<uint8_t> bytes;
    cbor::encodeArrayHeader(bytes, 0);
    EXPECT_THROW((void)deserializeWorldChunk(bytes), std::runtime_error);
}

// ============================================================================
// File I/O
// ============================================================================

TEST_F(WorldChunkIOTest, SaveAndLoadChunk) {
    auto chunk = sampleChunk();
    auto path = testDir_ / "sample.tgc";

    saveWorldChunk(chunk, path);
    ASSERT_TRUE(std::filesystem::exists(path));

    auto bytes = readFile(path);
    ASSERT_GE(bytes.size(), 12u);
    EXPECT_EQ(bytes[0], 'T');
    EXPECT_EQ(bytes[1], 'G');
    EXPECT_EQ(bytes[2], 'C');
    EXPECT_EQ(bytes[3], 'K');

    auto loaded = loadWorldChunk(path);
    EXPECT_EQ(loaded.seed, chunk.seed);
    EXPECT_EQ(loaded.elevation, chunk.elevation);
}

TEST_F(WorldChunkIOTest, SaveGeneratedWorld) {
    auto world = WorldGenerator::generate(42, 64, 48);
    auto path = testDir_ / "world.tgc";

    saveWorldChunk(world, path);
    auto loaded = loadWorldChunk(path);

    EXPECT_EQ(loaded.seed, 42u);
    EXPECT_EQ(loaded.elevation, world.elevation());
    EXPECT_EQ(loaded.elevationChecksum, gridChecksum(world.elevation()));
}

TEST_F(WorldChunkIOTest, MissingFileThrows) {
    EXPECT_THROW((void)loadWorldChunk(testDir_ / "absent.tgc"), std::runtime_error);
}

TEST_F(WorldChunkIOTest, UnwritablePathThrows) {
    EXPECT_THROW(saveWorldChunk(sampleChunk(), testDir_ / "no_such_dir" / "x.tgc"),
                 std::runtime_error);
}

TEST_F(WorldChunkIOTest, CorruptMagicRejected) {
    auto path = testDir_ / "magic.tgc";
    saveWorldChunk(sampleChunk(), path);

    auto bytes = readFile(path);
    bytes[0] = 'X';
    writeFile(path, bytes);

    EXPECT_THROW((void)loadWorldChunk(path), std::runtime_error);
}

TEST_F(WorldChunkIOTest, TruncatedFileRejected) {
    auto path = testDir_ / "short.tgc";
    saveWorldChunk(sampleChunk(), path);

    auto bytes = readFile(path);
    bytes.pop_back();
    writeFile(path, bytes);
    EXPECT_THROW((void)loadWorldChunk(path), std::runtime_error);

    bytes.resize(8);
    writeFile(path, bytes);
    EXPECT_THROW((void)loadWorldChunk(path), std::runtime_error);
}

TEST_F(WorldChunkIOTest, CorruptPayloadRejected) {
    auto path = testDir_ / "payload.tgc";
    saveWorldChunk(sampleChunk(), path);

    auto bytes = readFile(path);
    // Claim a larger uncompressed size than the payload decodes to
    bytes[4] = static_cast<uint8_t>(bytes[4] + 1);
    writeFile(path, bytes);

    EXPECT_THROW((void)loadWorldChunk(path), std::runtime_error);
}
