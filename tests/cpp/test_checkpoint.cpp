#include <catch2/catch.hpp>
#include "fr_search/checkpoint.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

using namespace fr_search;
using fr_search::testing::TempDir;
namespace fs = std::filesystem;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

}  // namespace

// ============================================================================
// CheckpointStore tests
// ============================================================================

TEST_CASE("Checkpoint keys are derived from the domain", "[checkpoint]") {
    PolyDomain d1(1, CoefRange{-3, 3}, 0, CoefRange{-5, 5});
    PolyDomain d2(1, CoefRange{-3, 3}, 0, CoefRange{-5, 4});
    PolyDomain d3(1, CoefRange{-3, 3}, 0, CoefRange{-5, 5}, true, "job7_");
    CheckpointStore store;

    SECTION("identity is deterministic and 16 hex digits") {
        auto id = CheckpointStore::identity(d1);
        REQUIRE(id.size() == 16);
        REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        REQUIRE(id == CheckpointStore::identity(PolyDomain(1, CoefRange{-3, 3}, 0, CoefRange{-5, 5})));
    }

    SECTION("different ranges give different keys") {
        REQUIRE(store.key_for(d1) != store.key_for(d2));
    }

    SECTION("prefix is prepended") {
        REQUIRE(store.key_for(d3) == "job7_" + CheckpointStore::identity(d1));
    }

    SECTION("path without a directory") {
        REQUIRE(store.path_for("abc") == "abc.json");
    }
}

TEST_CASE("Checkpoint save, load and remove", "[checkpoint]") {
    TempDir dir;
    CheckpointStore store(dir.str());
    PolyDomain d(1, CoefRange{-3, 3}, 0, CoefRange{-5, 5});
    const auto key = store.key_for(d);

    SECTION("missing file loads the origin") {
        REQUIRE(!store.exists(key));
        auto cp = store.load(d);
        REQUIRE(cp == Checkpoint::origin(d));
        REQUIRE(cp.a == CoefTuple{-3, 1});
        REQUIRE(cp.b == CoefTuple{-5});
    }

    SECTION("saved coordinate is loaded back") {
        store.save(key, {2, 3}, {-1});
        REQUIRE(store.exists(key));
        auto cp = store.load(d);
        REQUIRE(cp.a == CoefTuple{2, 3});
        REQUIRE(cp.b == CoefTuple{-1});
        REQUIRE(cp.of(SeriesId::B) == CoefTuple{-1});
    }

    SECTION("file content is a JSON object with a and b") {
        store.save(key, {2, 3}, {-1});
        auto text = read_file(store.path_for(key));
        REQUIRE(text.find("\"a\":[2,3]") != std::string::npos);
        REQUIRE(text.find("\"b\":[-1]") != std::string::npos);
    }

    SECTION("save overwrites the previous coordinate") {
        store.save(key, {2, 3}, {-1});
        store.save(key, {0, 1}, {4});
        auto cp = store.load(d);
        REQUIRE(cp.a == CoefTuple{0, 1});
        REQUIRE(cp.b == CoefTuple{4});
    }

    SECTION("remove is idempotent") {
        store.save(key, {2, 3}, {-1});
        REQUIRE(store.remove(key));
        REQUIRE(!store.exists(key));
        REQUIRE(!store.remove(key));
    }
}

TEST_CASE("Broken checkpoints are quarantined", "[checkpoint]") {
    TempDir dir;
    CheckpointStore store(dir.str());
    PolyDomain d(1, CoefRange{-3, 3}, 0, CoefRange{-5, 5});
    const auto key = store.key_for(d);
    const auto path = store.path_for(key);

    SECTION("unparsable file") {
        write_file(path, "{\"a\": [1, 2");
        REQUIRE(store.load(d) == Checkpoint::origin(d));
        REQUIRE(!fs::exists(path));
        REQUIRE(fs::exists(path + ".corrupted"));
    }

    SECTION("missing field") {
        write_file(path, "{\"a\": [1, 2]}");
        REQUIRE(store.load(d) == Checkpoint::origin(d));
        REQUIRE(fs::exists(path + ".corrupted"));
    }

    SECTION("wrong value type") {
        write_file(path, "{\"a\": [\"x\", 2], \"b\": [0]}");
        REQUIRE(store.load(d) == Checkpoint::origin(d));
        REQUIRE(fs::exists(path + ".corrupted"));
    }

    SECTION("fractional coefficient") {
        // -1.7 を切り捨てて読むと領域内の座標になってしまう
        write_file(path, "{\"a\": [-1.7, 2], \"b\": [0]}");
        REQUIRE(store.load(d) == Checkpoint::origin(d));
        REQUIRE(!fs::exists(path));
        REQUIRE(fs::exists(path + ".corrupted"));
    }

    SECTION("coefficient beyond int64_t") {
        write_file(path, "{\"a\": [0, 1], \"b\": [18446744073709551615]}");
        REQUIRE(store.load(d) == Checkpoint::origin(d));
        REQUIRE(fs::exists(path + ".corrupted"));
    }

    SECTION("coordinate outside the domain") {
        store.save(key, {9, 1}, {0});
        REQUIRE(store.load(d) == Checkpoint::origin(d));
        REQUIRE(fs::exists(path + ".corrupted"));
    }

    SECTION("coordinate of another shape") {
        store.save(key, {0, 1, 1}, {0});
        REQUIRE(store.load(d) == Checkpoint::origin(d));
        REQUIRE(fs::exists(path + ".corrupted"));
    }
}

TEST_CASE("Checkpoint write failure is reported", "[checkpoint]") {
    TempDir dir;
    CheckpointStore store(dir.str() + "/no/such/dir");
    REQUIRE_THROWS_AS(store.save("key", {1}, {1}), std::runtime_error);
    REQUIRE_THROWS_AS(store.save_matches("key", {{{1}, {1}}}), std::runtime_error);
}

// ============================================================================
// Saved matches
// ============================================================================

TEST_CASE("Saved matches", "[checkpoint]") {
    TempDir dir;
    CheckpointStore store(dir.str());
    PolyDomain d(1, CoefRange{-3, 3}, 0, CoefRange{-5, 5});
    const auto key = store.key_for(d);
    const auto path = store.path_for(CheckpointStore::matches_key(key));

    SECTION("missing file loads nothing") {
        REQUIRE(store.load_matches(d).empty());
    }

    SECTION("saved matches are loaded back in order") {
        const CoefPairList matches{{{2, 3}, {-1}}, {{0, 1}, {4}}};
        store.save_matches(key, matches);
        REQUIRE(fs::exists(path));
        REQUIRE(store.load_matches(d) == matches);
        // チェックポイント本体とは別のファイル
        REQUIRE(!store.exists(key));
    }

    SECTION("file content") {
        store.save_matches(key, {{{2, 3}, {-1}}});
        REQUIRE(read_file(path) == "{\"matches\":[{\"a\":[2,3],\"b\":[-1]}]}");
    }

    SECTION("remove") {
        store.save_matches(key, {{{2, 3}, {-1}}});
        REQUIRE(store.remove_matches(key));
        REQUIRE(!fs::exists(path));
        REQUIRE(!store.remove_matches(key));
    }

    SECTION("fractional coefficient is quarantined") {
        write_file(path, "{\"matches\": [{\"a\": [0, 1], \"b\": [2.5]}]}");
        REQUIRE(store.load_matches(d).empty());
        REQUIRE(fs::exists(path + ".corrupted"));
    }

    SECTION("match outside the domain is quarantined") {
        store.save_matches(key, {{{0, 1}, {2}}, {{0, 9}, {2}}});
        REQUIRE(store.load_matches(d).empty());
        REQUIRE(fs::exists(path + ".corrupted"));
    }

    SECTION("missing list is quarantined") {
        write_file(path, "{\"a\": [0, 1], \"b\": [2]}");
        REQUIRE(store.load_matches(d).empty());
        REQUIRE(fs::exists(path + ".corrupted"));
    }
}
