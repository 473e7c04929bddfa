/**
 * @file fr_search.hpp
 * @brief FR を持つ GCF の探索と、定数との関係の探索
 */
#ifndef FR_SEARCH_FR_SEARCH_HPP
#define FR_SEARCH_FR_SEARCH_HPP

#include "fr_search/checkpoint.hpp"
#include "fr_search/enumerator.hpp"
#include "fr_search/evaluator.hpp"
#include "fr_search/fr_test.hpp"
#include "fr_search/poly_domain.hpp"
#include "fr_search/pslq.hpp"
#include "fr_search/relation.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fr_search {

/**
 * @brief 探索の設定
 */
struct SearchConfig {
    // FR 判定
    size_t burst_number = BURST_NUMBER;
    size_t min_iters = MIN_ITERS;
    double convergence_threshold = CONVERGENCE_THRESHOLD;
    size_t first_enumeration_max_depth = FIRST_ENUMERATION_MAX_DEPTH;
    unsigned fr_digits = 50;

    // 列挙
    SeriesId primary = SeriesId::A;
    size_t checkpoint_dump_size = CHECKPOINT_DUMP_SIZE;

    // 精度向上と関係探索
    size_t refine_min_depth = 2000;
    size_t refine_max_depth = 64000;
    unsigned refine_target_digits = 50;
    size_t pslq_max_coeff = PSLQ_MAX_COEFF;
    size_t pslq_max_steps = PSLQ_MAX_STEPS;
    std::vector<std::string> constants = {"zeta3"};
};

/**
 * @brief FR 判定を通過した係数の組（値は未計算）
 */
struct Match {
    CoefTuple an_coef;
    CoefTuple bn_coef;

    bool operator==(const Match& other) const {
        return an_coef == other.an_coef && bn_coef == other.bn_coef;
    }
    bool operator<(const Match& other) const {
        if (an_coef != other.an_coef) return an_coef < other.an_coef;
        return bn_coef < other.bn_coef;
    }
};

/**
 * @brief 高精度で値を計算し、定数との関係を探した結果
 */
struct RefinedMatch {
    Match match;
    BigFloat value;
    std::string constant;                    ///< 関係を探した定数の名前
    std::optional<RelationFraction> relation;  ///< 見つからなければ空
    unsigned precision;
};

/**
 * @brief 重複を無視する Match の集合（追加順を保持）
 *
 * 再開時にチェックポイントの座標が 2 回処理されるため、同じ Match が来ても新規扱いしない。
 */
class MatchStore {
public:
    /**
     * @return 新しい Match なら true
     */
    bool add(const Match& match);

    const std::vector<Match>& matches() const { return matches_; }
    size_t size() const { return matches_.size(); }

private:
    std::vector<Match> matches_;
    std::set<Match> seen_;
};

/**
 * @brief 探索の統計情報
 */
struct SearchStats {
    size_t candidates = 0;
    size_t fr_matches = 0;
    size_t restored_matches = 0;
    size_t duplicate_matches = 0;
    size_t degenerate = 0;
    size_t diverging = 0;
    size_t exhausted = 0;
    size_t relations_found = 0;
    size_t relations_missing = 0;
    size_t refine_failures = 0;
};

/**
 * @brief 1 つの探索領域に対する FR 探索
 *
 * 1. first_enumeration(): 領域の全 (a, b) について FR を判定し Match を集める
 * 2. improve_results_precision(): Match ごとに値を高精度で計算し、各定数との関係を PSLQ で探す
 * 3. refine_results(): そのまま返す
 *
 * Match は見つかるたびにチェックポイントと同じキーで保存し、中断後の再開時に読み戻す。
 * 保存した Match は run() の完了時に削除する。
 *
 * 候補 1 件の失敗（評価器や PSLQ の例外）はログに出してその候補だけ飛ばす。
 */
class FrSearch {
public:
    using MatchCallback = std::function<void(const Match&)>;

    /**
     * @param domain 探索領域
     * @param config 設定
     * @param store チェックポイントの保存先（探索中は参照を保持する）
     * @throws std::invalid_argument 未知の定数名を含む場合
     */
    FrSearch(PolyDomain domain, SearchConfig config, const CheckpointStore& store);

    /**
     * @brief 値の評価器を差し替える（既定は ConvergentEvaluator）
     */
    void set_evaluator(std::unique_ptr<ValueEvaluator> evaluator);

    /**
     * @brief 新しい Match が見つかるたびに呼ばれるコールバック
     *
     * Match の保存後に呼ぶ。前回の実行から読み戻した Match では呼ばない。
     */
    void set_match_callback(MatchCallback callback) { on_match_ = std::move(callback); }

    /**
     * @brief 領域の全候補に FR 判定をかける
     *
     * 中断された実行が保存した Match を先頭に含む。
     * @throws std::runtime_error チェックポイントの書き込みに失敗した場合
     */
    std::vector<Match> first_enumeration();

    /**
     * @brief Match の値を高精度で計算し、設定された全定数との関係を探す
     */
    std::vector<RefinedMatch> improve_results_precision(const std::vector<Match>& matches);

    std::vector<RefinedMatch> refine_results(std::vector<RefinedMatch> results) { return results; }

    /**
     * @brief 3 段階をまとめて実行
     */
    std::vector<RefinedMatch> run();

    const SearchStats& stats() const { return stats_; }
    const PolyDomain& domain() const { return domain_; }
    const SearchConfig& config() const { return config_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    void refine_one(const Match& match, std::vector<RefinedMatch>& out);
    void save_matches(const MatchStore& results) const;

    PolyDomain domain_;
    SearchConfig config_;
    const CheckpointStore& store_;
    std::unique_ptr<ValueEvaluator> evaluator_;
    MatchCallback on_match_;
    SearchStats stats_;
    bool verbose_ = false;
};

} // namespace fr_search

#endif // FR_SEARCH_FR_SEARCH_HPP
