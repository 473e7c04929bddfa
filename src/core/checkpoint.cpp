#include "fr_search/checkpoint.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace fr_search {

namespace fs = std::filesystem;

namespace {

// FNV-1a 64-bit
uint64_t fnv1a64(const std::string& text) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : text) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

// 整数以外（小数、範囲外の値）を含む配列は壊れたファイルとして扱う
CoefTuple read_tuple(const nlohmann::json& j, const char* field) {
    const nlohmann::json& values = j.at(field);
    if (!values.is_array()) {
        throw std::runtime_error(std::string("field ") + field + " is not an array");
    }
    CoefTuple tuple;
    for (const auto& v : values) {
        if (!v.is_number_integer()) {
            throw std::runtime_error(std::string("field ") + field + " has a non-integer value " +
                                     v.dump());
        }
        if (v.is_number_unsigned() &&
            v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw std::runtime_error(std::string("field ") + field + " has an out of range value " +
                                     v.dump());
        }
        tuple.push_back(v.get<int64_t>());
    }
    return tuple;
}

nlohmann::json read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open file");
    }
    return nlohmann::json::parse(in);
}

}  // namespace

Checkpoint Checkpoint::origin(const PolyDomain& domain) {
    return Checkpoint{domain.origin(SeriesId::A), domain.origin(SeriesId::B)};
}

CheckpointStore::CheckpointStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string CheckpointStore::identity(const PolyDomain& domain) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx",
                  static_cast<unsigned long long>(fnv1a64(domain.describe())));
    return buf;
}

std::string CheckpointStore::key_for(const PolyDomain& domain) const {
    return domain.checkpoint_prefix() + identity(domain);
}

std::string CheckpointStore::path_for(const std::string& key) const {
    if (directory_.empty()) {
        return key + ".json";
    }
    return (fs::path(directory_) / (key + ".json")).string();
}

bool CheckpointStore::exists(const std::string& key) const {
    std::error_code ec;
    return fs::is_regular_file(path_for(key), ec);
}

Checkpoint CheckpointStore::load(const PolyDomain& domain) const {
    const std::string path = path_for(key_for(domain));
    if (!exists(key_for(domain))) {
        return Checkpoint::origin(domain);
    }

    Checkpoint checkpoint;
    try {
        nlohmann::json j = read_file(path);
        checkpoint.a = read_tuple(j, "a");
        checkpoint.b = read_tuple(j, "b");
    } catch (const nlohmann::json::exception& e) {
        quarantine(path, e.what());
        return Checkpoint::origin(domain);
    } catch (const std::runtime_error& e) {
        quarantine(path, e.what());
        return Checkpoint::origin(domain);
    }

    // 別の形の領域から来たチェックポイントは使わない
    if (!domain.contains(SeriesId::A, checkpoint.a) ||
        !domain.contains(SeriesId::B, checkpoint.b)) {
        quarantine(path, "coordinate " + format_tuple(checkpoint.a) + " / " +
                         format_tuple(checkpoint.b) + " is outside " + domain.describe());
        return Checkpoint::origin(domain);
    }

    if (verbose_) {
        std::cerr << "% [checkpoint] loaded " << path << ": a=" << format_tuple(checkpoint.a)
                  << " b=" << format_tuple(checkpoint.b) << "\n";
    }
    return checkpoint;
}

void CheckpointStore::quarantine(const std::string& path, const std::string& reason) const {
    const std::string target = path + ".corrupted";
    std::cerr << "% [checkpoint] WARNING: loading " << path << " failed: " << reason
              << "; moving it to " << target << "\n";
    std::error_code ec;
    fs::rename(path, target, ec);
    if (ec) {
        throw std::runtime_error("Cannot quarantine checkpoint " + path + ": " + ec.message());
    }
}

CoefPairList CheckpointStore::load_matches(const PolyDomain& domain) const {
    const std::string key = matches_key(key_for(domain));
    const std::string path = path_for(key);
    if (!exists(key)) {
        return {};
    }

    CoefPairList matches;
    try {
        nlohmann::json j = read_file(path);
        const nlohmann::json& entries = j.at("matches");
        if (!entries.is_array()) {
            throw std::runtime_error("field matches is not an array");
        }
        for (const auto& entry : entries) {
            matches.emplace_back(read_tuple(entry, "a"), read_tuple(entry, "b"));
        }
    } catch (const nlohmann::json::exception& e) {
        quarantine(path, e.what());
        return {};
    } catch (const std::runtime_error& e) {
        quarantine(path, e.what());
        return {};
    }

    for (const auto& m : matches) {
        if (!domain.contains(SeriesId::A, m.first) || !domain.contains(SeriesId::B, m.second)) {
            quarantine(path, "match " + format_tuple(m.first) + " / " + format_tuple(m.second) +
                             " is outside " + domain.describe());
            return {};
        }
    }

    if (verbose_) {
        std::cerr << "% [checkpoint] loaded " << matches.size() << " matches from " << path << "\n";
    }
    return matches;
}

void CheckpointStore::write_json(const std::string& path, const std::string& text) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open checkpoint for writing: " + path);
    }
    out << text;
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing checkpoint: " + path);
    }
}

void CheckpointStore::save(const std::string& key, const CoefTuple& a, const CoefTuple& b) const {
    const std::string path = path_for(key);
    nlohmann::json j;
    j["a"] = a;
    j["b"] = b;
    write_json(path, j.dump());

    if (verbose_) {
        std::cerr << "% [checkpoint] dumped a=" << format_tuple(a)
                  << " b=" << format_tuple(b) << " to " << path << "\n";
    }
}

void CheckpointStore::save_matches(const std::string& key, const CoefPairList& matches) const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& m : matches) {
        nlohmann::json entry;
        entry["a"] = m.first;
        entry["b"] = m.second;
        entries.push_back(entry);
    }
    nlohmann::json j;
    j["matches"] = entries;
    write_json(path_for(matches_key(key)), j.dump());
}

bool CheckpointStore::remove_file(const std::string& path) const {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot delete checkpoint " + path + ": " + ec.message());
    }
    if (verbose_) {
        if (removed) {
            std::cerr << "% [checkpoint] deleted " << path << "\n";
        } else {
            std::cerr << "% [checkpoint] nothing to delete at " << path << "\n";
        }
    }
    return removed;
}

bool CheckpointStore::remove(const std::string& key) const {
    return remove_file(path_for(key));
}

bool CheckpointStore::remove_matches(const std::string& key) const {
    return remove_file(path_for(matches_key(key)));
}

} // namespace fr_search
