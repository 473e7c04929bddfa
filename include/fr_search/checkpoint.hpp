/**
 * @file checkpoint.hpp
 * @brief 列挙位置のチェックポイント保存・復元
 */
#ifndef FR_SEARCH_CHECKPOINT_HPP
#define FR_SEARCH_CHECKPOINT_HPP

#include "fr_search/poly_domain.hpp"
#include <string>
#include <utility>
#include <vector>

namespace fr_search {

/// 何件ごとにチェックポイントを書き出すか
constexpr size_t CHECKPOINT_DUMP_SIZE = 5000;

/**
 * @brief 最後に訪れた係数の組 (a, b)
 */
struct Checkpoint {
    CoefTuple a;
    CoefTuple b;

    /**
     * @brief 領域の起点（全軸の最小値）を指すチェックポイント
     */
    static Checkpoint origin(const PolyDomain& domain);

    const CoefTuple& of(SeriesId series) const { return series == SeriesId::A ? a : b; }

    bool operator==(const Checkpoint& other) const { return a == other.a && b == other.b; }
    bool operator!=(const Checkpoint& other) const { return !(*this == other); }
};

/// 保存済みの Match の係数の組（a, b）
using CoefPairList = std::vector<std::pair<CoefTuple, CoefTuple>>;

/**
 * @brief チェックポイントファイルの読み書き
 *
 * ファイルは領域の区間から計算したハッシュをキーとし、
 * <directory>/<prefix><hash>.json に {"a": [...], "b": [...]} 形式で保存する。
 * 分割された部分領域は区間が異なるため、並列ワーカー間でファイルが衝突しない。
 * 列挙中に見つかった Match は同じキーの <prefix><hash>.matches.json に
 * {"matches": [{"a": [...], "b": [...]}, ...]} 形式で保存する。
 *
 * 読み込めないファイル（整数以外の係数を含むものを含む）は <file>.corrupted に退避し、
 * 起点から再開する。
 */
class CheckpointStore {
public:
    /**
     * @param directory チェックポイントを置くディレクトリ（空ならカレント）
     */
    explicit CheckpointStore(std::string directory = "");

    /**
     * @brief 領域の区間から決定的な指紋（16 桁の 16 進）を計算
     */
    static std::string identity(const PolyDomain& domain);

    /**
     * @brief 領域のチェックポイントキー（接頭辞 + 指紋）
     */
    std::string key_for(const PolyDomain& domain) const;

    /**
     * @brief キーに対応するファイルパス
     */
    std::string path_for(const std::string& key) const;

    /**
     * @brief チェックポイントを読み込む
     *
     * ファイルがなければ起点を返す。壊れている、あるいは領域と形が合わない場合は
     * ファイルを退避して起点を返す。
     * @throws std::runtime_error 壊れたファイルを退避できない場合
     */
    Checkpoint load(const PolyDomain& domain) const;

    /**
     * @brief チェックポイントを上書き保存
     * @throws std::runtime_error 書き込みに失敗した場合
     */
    void save(const std::string& key, const CoefTuple& a, const CoefTuple& b) const;

    /**
     * @brief チェックポイントを削除
     * @return ファイルが存在して削除したら true（存在しなければ false、例外なし）
     * @throws std::runtime_error 存在するファイルを削除できない場合
     */
    bool remove(const std::string& key) const;

    /**
     * @brief チェックポイントファイルが存在するか
     */
    bool exists(const std::string& key) const;

    /**
     * @brief Match を保存するファイルのキー
     */
    static std::string matches_key(const std::string& key) { return key + ".matches"; }

    /**
     * @brief 保存済みの Match を読み込む
     *
     * ファイルがなければ空。壊れている、あるいは領域外の組を含む場合は
     * ファイルを退避して空を返す。
     * @throws std::runtime_error 壊れたファイルを退避できない場合
     */
    CoefPairList load_matches(const PolyDomain& domain) const;

    /**
     * @brief Match の一覧を上書き保存
     * @throws std::runtime_error 書き込みに失敗した場合
     */
    void save_matches(const std::string& key, const CoefPairList& matches) const;

    /**
     * @brief 保存済みの Match を削除
     * @throws std::runtime_error 存在するファイルを削除できない場合
     */
    bool remove_matches(const std::string& key) const;

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    void quarantine(const std::string& path, const std::string& reason) const;
    void write_json(const std::string& path, const std::string& text) const;
    bool remove_file(const std::string& path) const;

    std::string directory_;
    bool verbose_ = false;
};

} // namespace fr_search

#endif // FR_SEARCH_CHECKPOINT_HPP
