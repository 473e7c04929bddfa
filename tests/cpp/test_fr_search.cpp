#include <catch2/catch.hpp>
#include "fr_search/constants.hpp"
#include "fr_search/fr_search.hpp"
#include "test_helpers.hpp"
#include <memory>
#include <stdexcept>

using namespace fr_search;
using fr_search::testing::TempDir;

namespace {

// 常に 1 / (e - 2) を返す評価器
class FixedEvaluator : public ValueEvaluator {
public:
    explicit FixedEvaluator(unsigned precision) : precision_(precision) {}

    EvaluatedValue evaluate(const CoefTuple&, const CoefTuple&) override {
        ++calls;
        BigFloat e = *ConstantRegistry::value("e");
        BigFloat value = 1 / (e - 2);
        return EvaluatedValue{value, precision_, 0};
    }

    size_t calls = 0;

private:
    unsigned precision_;
};

class FailingEvaluator : public ValueEvaluator {
public:
    EvaluatedValue evaluate(const CoefTuple&, const CoefTuple&) override {
        throw std::domain_error("no convergent");
    }
};

bool close_to(const BigFloat& a, const BigFloat& b, const char* tolerance) {
    BigFloat diff = a - b;
    diff = abs(diff);
    return diff < BigFloat(tolerance);
}

// a(n) = 1 or 2, b(n) = -1, 0, 1 の 6 候補
PolyDomain constant_domain() {
    return PolyDomain({CoefRange{1, 2}}, {CoefRange{-1, 1}});
}

}  // namespace

// ============================================================================
// MatchStore
// ============================================================================

TEST_CASE("MatchStore ignores duplicates and keeps order", "[search]") {
    MatchStore store;
    REQUIRE(store.add(Match{{2}, {1}}));
    REQUIRE(store.add(Match{{1}, {1}}));
    REQUIRE(!store.add(Match{{2}, {1}}));
    REQUIRE(store.size() == 2);
    REQUIRE(store.matches()[0] == Match{{2}, {1}});
    REQUIRE(store.matches()[1] == Match{{1}, {1}});
}

// ============================================================================
// first_enumeration
// ============================================================================

TEST_CASE("first_enumeration collects the FR matches of a domain", "[search]") {
    TempDir dir;
    CheckpointStore store(dir.str());

    SECTION("constant polynomials") {
        FrSearch search(constant_domain(), SearchConfig{}, store);
        size_t callbacks = 0;
        search.set_match_callback([&callbacks](const Match&) { ++callbacks; });

        auto matches = search.first_enumeration();
        REQUIRE(matches == std::vector<Match>{
            Match{{1}, {-1}}, Match{{1}, {1}}, Match{{2}, {-1}}, Match{{2}, {1}}});
        REQUIRE(callbacks == 4);

        const auto& s = search.stats();
        REQUIRE(s.candidates == 6);
        REQUIRE(s.fr_matches == 4);
        REQUIRE(s.degenerate == 2);
        REQUIRE(s.diverging == 0);
        REQUIRE(s.exhausted == 0);
        REQUIRE(!store.exists(store.key_for(constant_domain())));
    }

    SECTION("b-major order") {
        SearchConfig config;
        config.primary = SeriesId::B;
        FrSearch search(constant_domain(), config, store);
        auto matches = search.first_enumeration();
        REQUIRE(matches == std::vector<Match>{
            Match{{1}, {-1}}, Match{{2}, {-1}}, Match{{1}, {1}}, Match{{2}, {1}}});
    }

    SECTION("linear a(n) without FR") {
        PolyDomain d({CoefRange{0, 1}, CoefRange{1, 1}}, {CoefRange{-1, 1}});
        FrSearch search(d, SearchConfig{}, store);
        auto matches = search.first_enumeration();
        REQUIRE(matches.empty());
        REQUIRE(search.stats().candidates == 6);
        REQUIRE(search.stats().exhausted == 4);
        REQUIRE(search.stats().degenerate == 2);
    }

    SECTION("matches are saved as they are found") {
        const auto domain = constant_domain();
        FrSearch search(domain, SearchConfig{}, store);
        search.first_enumeration();
        REQUIRE(store.load_matches(domain) == CoefPairList{
            {{1}, {-1}}, {{1}, {1}}, {{2}, {-1}}, {{2}, {1}}});
    }

    SECTION("resumes from a checkpoint") {
        const auto domain = constant_domain();
        store.save(store.key_for(domain), {2}, {-1});
        FrSearch search(domain, SearchConfig{}, store);
        auto matches = search.first_enumeration();
        REQUIRE(matches == std::vector<Match>{Match{{2}, {-1}}, Match{{2}, {1}}});
        REQUIRE(search.stats().candidates == 3);
    }
}

TEST_CASE("Matches found before an interruption survive the resume", "[search]") {
    TempDir dir;
    CheckpointStore store(dir.str());
    const auto domain = constant_domain();
    SearchConfig config;
    config.checkpoint_dump_size = 1;

    // 3 件目の Match（a = [2], b = [-1]）で中断する
    {
        FrSearch search(domain, config, store);
        std::vector<Match> emitted;
        search.set_match_callback([&emitted](const Match& m) {
            emitted.push_back(m);
            if (emitted.size() == 3) {
                throw std::runtime_error("interrupted");
            }
        });
        REQUIRE_THROWS_AS(search.first_enumeration(), std::runtime_error);
        REQUIRE(emitted.size() == 3);
    }
    REQUIRE(store.exists(store.key_for(domain)));
    REQUIRE(store.load(domain) == Checkpoint{{2}, {-1}});

    FrSearch resumed(domain, config, store);
    std::vector<Match> emitted;
    resumed.set_match_callback([&emitted](const Match& m) { emitted.push_back(m); });
    auto matches = resumed.first_enumeration();

    // 中断前の Match も結果に含まれ、コールバックは新しい Match だけ
    REQUIRE(matches == std::vector<Match>{
        Match{{1}, {-1}}, Match{{1}, {1}}, Match{{2}, {-1}}, Match{{2}, {1}}});
    REQUIRE(emitted == std::vector<Match>{Match{{2}, {1}}});

    const auto& s = resumed.stats();
    REQUIRE(s.restored_matches == 3);
    REQUIRE(s.candidates == 3);
    REQUIRE(s.fr_matches == 1);
    REQUIRE(s.duplicate_matches == 1);
    REQUIRE(!store.exists(store.key_for(domain)));
}

TEST_CASE("FrSearch rejects unknown constants", "[search]") {
    CheckpointStore store;
    SearchConfig config;

    SECTION("unknown name") {
        config.constants = {"zeta3", "zeta5"};
        REQUIRE_THROWS_AS(FrSearch(constant_domain(), config, store), std::invalid_argument);
    }

    SECTION("empty list") {
        config.constants.clear();
        REQUIRE_THROWS_AS(FrSearch(constant_domain(), config, store), std::invalid_argument);
    }
}

// ============================================================================
// improve_results_precision
// ============================================================================

TEST_CASE("improve_results_precision tests every configured constant", "[search][pslq]") {
    CheckpointStore store;
    SearchConfig config;
    config.constants = {"e", "pi"};
    FrSearch search(constant_domain(), config, store);
    search.set_evaluator(std::make_unique<FixedEvaluator>(40));

    auto results = search.improve_results_precision({Match{{1, 1}, {0, 1}}});
    REQUIRE(results.size() == 2);

    REQUIRE(results[0].constant == "e");
    REQUIRE(results[0].match == Match{{1, 1}, {0, 1}});
    REQUIRE(results[0].precision == 40);
    REQUIRE(results[0].relation.has_value());
    REQUIRE(results[0].relation->numerator == std::vector<BigInt>{1, 0, 0});
    REQUIRE(results[0].relation->denominator == std::vector<BigInt>{-2, 1, 0});

    REQUIRE(results[1].constant == "pi");
    REQUIRE(!results[1].relation.has_value());

    REQUIRE(search.stats().relations_found == 1);
    REQUIRE(search.stats().relations_missing == 1);
}

TEST_CASE("improve_results_precision skips candidates that fail", "[search]") {
    CheckpointStore store;
    FrSearch search(constant_domain(), SearchConfig{}, store);
    search.set_evaluator(std::make_unique<FailingEvaluator>());

    auto results = search.improve_results_precision({Match{{1}, {1}}, Match{{2}, {1}}});
    REQUIRE(results.empty());
    REQUIRE(search.stats().refine_failures == 2);
}

TEST_CASE("run chains enumeration and refinement", "[search]") {
    TempDir dir;
    CheckpointStore store(dir.str());
    SearchConfig config;
    config.constants = {"e"};
    FrSearch search(constant_domain(), config, store);
    auto evaluator = std::make_unique<FixedEvaluator>(40);
    auto* raw = evaluator.get();
    search.set_evaluator(std::move(evaluator));

    auto results = search.run();
    REQUIRE(results.size() == 4);
    REQUIRE(raw->calls == 4);
    for (const auto& r : results) {
        REQUIRE(r.relation.has_value());
        REQUIRE(format_relation(*r.relation, r.constant) == "(1) / (-2 + e)");
    }
    REQUIRE(results[3].match == Match{{2}, {1}});

    // 完了した探索は保存した Match を残さない
    REQUIRE(!store.exists(CheckpointStore::matches_key(store.key_for(constant_domain()))));
}

// ============================================================================
// ConvergentEvaluator
// ============================================================================

TEST_CASE("ConvergentEvaluator doubles the depth until the digits agree", "[search][evaluator]") {
    ScopedDigits digits(50);

    SECTION("a(n) = n + 1, b(n) = n converges to 1 / (e - 2)") {
        ConvergentEvaluator evaluator(16, 1024, 50);
        auto result = evaluator.evaluate({1, 1}, {0, 1});
        BigFloat e = *ConstantRegistry::value("e");
        BigFloat expected = 1 / (e - 2);
        REQUIRE(close_to(result.value, expected, "1e-45"));
        REQUIRE(result.precision == 50);
        REQUIRE(result.depth == 128);
    }

    SECTION("a(n) = 1, b(n) = 1 converges to the golden ratio") {
        ConvergentEvaluator evaluator(16, 1024, 50);
        auto result = evaluator.evaluate({1}, {1});
        REQUIRE(close_to(result.value, *ConstantRegistry::value("golden"), "1e-45"));
        REQUIRE(result.depth == 256);
    }

    SECTION("stops at the maximum depth") {
        ConvergentEvaluator evaluator(16, 64, 50);
        auto result = evaluator.evaluate({1}, {1});
        REQUIRE(result.depth == 64);
        REQUIRE(result.precision > 5);
        REQUIRE(result.precision < 50);
    }

    SECTION("vanishing denominator") {
        ConvergentEvaluator evaluator(1, 1, 50);
        REQUIRE_THROWS_AS(evaluator.evaluate({0}, {1}), std::domain_error);
    }

    SECTION("invalid depths") {
        REQUIRE_THROWS_AS(ConvergentEvaluator(0, 10, 50), std::invalid_argument);
        REQUIRE_THROWS_AS(ConvergentEvaluator(10, 5, 50), std::invalid_argument);
    }
}
