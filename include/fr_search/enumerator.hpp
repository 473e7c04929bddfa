/**
 * @file enumerator.hpp
 * @brief チェックポイント対応の探索領域列挙
 */
#ifndef FR_SEARCH_ENUMERATOR_HPP
#define FR_SEARCH_ENUMERATOR_HPP

#include "fr_search/checkpoint.hpp"
#include "fr_search/poly_domain.hpp"
#include <optional>

namespace fr_search {

/**
 * @brief 軸区間の直積を辞書順に巡る桁上がりカウンタ
 *
 * 最後の軸が最も速く変化する。
 */
class TupleCursor {
public:
    explicit TupleCursor(std::vector<CoefRange> ranges);

    const CoefTuple& current() const { return current_; }

    /**
     * @brief 起点（全軸の最小値）に戻す
     */
    void reset();

    /**
     * @brief 指定タプルの位置へ移動
     * @throws std::invalid_argument タプルが区間の外にある場合
     */
    void seek(const CoefTuple& coefs);

    /**
     * @brief 次のタプルへ進める
     * @return 末尾を越えて起点に戻ったら false
     */
    bool advance();

private:
    std::vector<CoefRange> ranges_;
    CoefTuple current_;
};

/**
 * @brief 係数の組 (a, b)
 */
struct CoefPair {
    CoefTuple a;
    CoefTuple b;
};

/**
 * @brief 探索領域の (a, b) を入れ子ループ順に 1 件ずつ返す
 *
 * primary 系列が外側、もう一方（secondary）が内側のループ。
 * 状態は (primary カーソル, secondary カーソル, 通過件数) だけで表され、
 * next() を呼ぶたびに次の組を返す。
 *
 * 開始時にチェックポイントを読み込み、その座標から再開する。
 * チェックポイントの座標そのものはもう一度返す（処理途中で中断された可能性があるため）。
 * checkpoint_interval 件ごとに現在の座標を保存し、全件を返し終えたら削除する。
 */
class DomainEnumerator {
public:
    /**
     * @param domain 列挙する領域
     * @param store チェックポイントの保存先（列挙中は参照を保持する）
     * @param primary 外側ループの系列
     * @param checkpoint_interval チェックポイント保存間隔（件数）
     */
    DomainEnumerator(PolyDomain domain, const CheckpointStore& store,
                     SeriesId primary = SeriesId::A,
                     size_t checkpoint_interval = CHECKPOINT_DUMP_SIZE);

    /**
     * @brief 次の組を取得
     * @return 列挙が終わったら std::nullopt
     * @throws std::runtime_error チェックポイントの書き込み・削除に失敗した場合
     */
    std::optional<CoefPair> next();

    /**
     * @brief 全件を返し終えたか
     */
    bool finished() const { return state_ == State::Done; }

    /**
     * @brief これまでに返した件数
     */
    size_t items_passed() const { return items_passed_; }

    SeriesId primary() const { return primary_; }
    SeriesId secondary() const { return primary_ == SeriesId::A ? SeriesId::B : SeriesId::A; }

    /**
     * @brief 再開位置のチェックポイント（最初の next() 以降に有効）
     */
    const Checkpoint& resumed_from() const { return resumed_from_; }

    const std::string& checkpoint_key() const { return checkpoint_key_; }

    const PolyDomain& domain() const { return domain_; }

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    enum class State {
        Fresh,    // チェックポイント未読み込み
        Running,
        Done
    };

    CoefPair current_pair() const;

    PolyDomain domain_;
    const CheckpointStore& store_;
    SeriesId primary_;
    size_t checkpoint_interval_;
    std::string checkpoint_key_;

    TupleCursor primary_cursor_;
    TupleCursor secondary_cursor_;
    size_t items_passed_ = 0;
    State state_ = State::Fresh;
    Checkpoint resumed_from_;
    bool verbose_ = false;
};

} // namespace fr_search

#endif // FR_SEARCH_ENUMERATOR_HPP
