#include "fr_search/checkpoint.hpp"
#include "fr_search/constants.hpp"
#include "fr_search/domain_splitter.hpp"
#include "fr_search/fr_search.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n";
    std::cerr << "  --a-deg D              Degree of a(n) (default 2)\n";
    std::cerr << "  --a-range LO HI        Coefficient range of a(n) (default -2 2)\n";
    std::cerr << "  --b-deg D              Degree of b(n) (default 2)\n";
    std::cerr << "  --b-range LO HI        Coefficient range of b(n) (default -2 2)\n";
    std::cerr << "  --allow-negative-lead  Do not restrict the leading a(n) coefficient to positive\n";
    std::cerr << "  -c NAME                Target constant (repeatable, default zeta3)\n";
    std::cerr << "  -d DEPTH               Max depth of the FR test (default 1000)\n";
    std::cerr << "  --burst N              Iterations between FR samples (default 200)\n";
    std::cerr << "  --digits N             Target digits when refining matches (default 50)\n";
    std::cerr << "  --checkpoint-dir DIR   Directory for checkpoint files\n";
    std::cerr << "  --checkpoint-prefix P  Prefix of checkpoint file names\n";
    std::cerr << "  --checkpoint-every N   Save a checkpoint every N candidates (default 5000)\n";
    std::cerr << "  --workers N            Split the domain into N parts\n";
    std::cerr << "  --worker-index K       Search only part K (0-based) of the split\n";
    std::cerr << "  --split-only           Print the split parts and exit\n";
    std::cerr << "  --primary a|b          Series iterated in the outer loop (default a)\n";
    std::cerr << "  --json                 Print results as JSON lines\n";
    std::cerr << "  -s                     Print search statistics to stderr\n";
    std::cerr << "  -v                     Verbose mode (print progress to stderr)\n";
    std::cerr << "  -h                     Show this help\n";
    std::cerr << "Constants:";
    for (const auto& name : fr_search::ConstantRegistry::names()) {
        std::cerr << " " << name;
    }
    std::cerr << "\n";
}

bool g_print_stats = false;
bool g_verbose = false;
bool g_json = false;

void print_stats(const fr_search::FrSearch& search) {
    if (!g_print_stats) return;
    const auto& s = search.stats();
    std::cerr << "% Stats: candidates=" << s.candidates
              << " fr_matches=" << s.fr_matches
              << " restored=" << s.restored_matches
              << " duplicates=" << s.duplicate_matches
              << " degenerate=" << s.degenerate
              << " diverging=" << s.diverging
              << " exhausted=" << s.exhausted
              << " relations=" << s.relations_found
              << " no_relation=" << s.relations_missing
              << " failures=" << s.refine_failures
              << "\n";
}

std::vector<std::string> to_strings(const std::vector<fr_search::BigInt>& values) {
    std::vector<std::string> result;
    for (const auto& v : values) {
        result.push_back(v.str());
    }
    return result;
}

// FR 判定を通過した時点で出力する（値の計算前）
void print_match(const fr_search::Match& match) {
    if (g_json) {
        nlohmann::json j;
        j["an"] = match.an_coef;
        j["bn"] = match.bn_coef;
        j["fr"] = true;
        std::cout << j.dump() << std::endl;
        return;
    }
    std::cout << "% [fr] an = " << fr_search::format_tuple(match.an_coef)
              << ", bn = " << fr_search::format_tuple(match.bn_coef) << std::endl;
}

void print_result(const fr_search::RefinedMatch& result) {
    if (g_json) {
        nlohmann::json j;
        j["an"] = result.match.an_coef;
        j["bn"] = result.match.bn_coef;
        j["value"] = result.value.str(static_cast<std::streamsize>(result.precision));
        j["precision"] = result.precision;
        j["constant"] = result.constant;
        if (result.relation) {
            j["numerator"] = to_strings(result.relation->numerator);
            j["denominator"] = to_strings(result.relation->denominator);
        } else {
            j["numerator"] = nullptr;
            j["denominator"] = nullptr;
        }
        std::cout << j.dump() << "\n";
        return;
    }

    std::cout << "an = " << fr_search::format_tuple(result.match.an_coef)
              << ", bn = " << fr_search::format_tuple(result.match.bn_coef)
              << ", value = " << result.value.str(static_cast<std::streamsize>(result.precision))
              << " (" << result.precision << " digits)";
    if (result.relation) {
        std::cout << " = " << fr_search::format_relation(*result.relation, result.constant);
    } else {
        std::cout << ", no relation with " << result.constant;
    }
    std::cout << "\n";
}

void print_split(const std::vector<fr_search::PolyDomain>& parts) {
    for (size_t i = 0; i < parts.size(); ++i) {
        std::cout << i << ": " << parts[i].describe()
                  << " size=" << parts[i].total_size().str() << "\n";
    }
}

int main(int argc, char* argv[]) {
    int a_deg = 2;
    int b_deg = 2;
    fr_search::CoefRange a_range{-2, 2};
    fr_search::CoefRange b_range{-2, 2};
    bool an_leading_coef_positive = true;
    std::string checkpoint_dir;
    std::string checkpoint_prefix;
    size_t workers = 1;
    std::optional<size_t> worker_index;
    bool split_only = false;
    std::vector<std::string> constants;
    fr_search::SearchConfig config;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--a-deg") == 0 && i + 1 < argc) {
            a_deg = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--a-range") == 0 && i + 2 < argc) {
            a_range.lo = std::atoll(argv[++i]);
            a_range.hi = std::atoll(argv[++i]);
        } else if (std::strcmp(argv[i], "--b-deg") == 0 && i + 1 < argc) {
            b_deg = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--b-range") == 0 && i + 2 < argc) {
            b_range.lo = std::atoll(argv[++i]);
            b_range.hi = std::atoll(argv[++i]);
        } else if (std::strcmp(argv[i], "--allow-negative-lead") == 0) {
            an_leading_coef_positive = false;
        } else if (std::strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            constants.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            config.first_enumeration_max_depth = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--burst") == 0 && i + 1 < argc) {
            config.burst_number = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--digits") == 0 && i + 1 < argc) {
            config.refine_target_digits = static_cast<unsigned>(std::atoi(argv[++i]));
        } else if (std::strcmp(argv[i], "--checkpoint-dir") == 0 && i + 1 < argc) {
            checkpoint_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--checkpoint-prefix") == 0 && i + 1 < argc) {
            checkpoint_prefix = argv[++i];
        } else if (std::strcmp(argv[i], "--checkpoint-every") == 0 && i + 1 < argc) {
            config.checkpoint_dump_size = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            workers = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--worker-index") == 0 && i + 1 < argc) {
            worker_index = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--split-only") == 0) {
            split_only = true;
        } else if (std::strcmp(argv[i], "--primary") == 0 && i + 1 < argc) {
            ++i;
            if (std::strcmp(argv[i], "a") == 0) {
                config.primary = fr_search::SeriesId::A;
            } else if (std::strcmp(argv[i], "b") == 0) {
                config.primary = fr_search::SeriesId::B;
            } else {
                std::cerr << "Unknown series: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } else if (std::strcmp(argv[i], "--json") == 0) {
            g_json = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!constants.empty()) {
        config.constants = constants;
    }
    for (const auto& name : config.constants) {
        if (!fr_search::ConstantRegistry::contains(name)) {
            std::cerr << "Unknown constant: " << name << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    if (workers == 0 || config.checkpoint_dump_size == 0 || config.burst_number == 0) {
        std::cerr << "--workers, --checkpoint-every and --burst must be positive\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        fr_search::PolyDomain domain(a_deg, a_range, b_deg, b_range,
                                     an_leading_coef_positive, checkpoint_prefix);

        std::vector<fr_search::PolyDomain> parts = fr_search::split_domain(domain, workers);
        if (g_verbose) {
            std::cerr << "% [split] " << domain.describe() << " size="
                      << domain.total_size().str() << " into " << parts.size() << " parts\n";
        }
        if (split_only) {
            print_split(parts);
            return 0;
        }

        size_t index = worker_index.value_or(0);
        if (index >= parts.size()) {
            std::cerr << "Error: worker index " << index << " out of range (only "
                      << parts.size() << " parts)\n";
            return 1;
        }
        if (!worker_index && parts.size() > 1) {
            std::cerr << "% [split] WARNING: --worker-index not given, searching part 0 only\n";
        }

        fr_search::CheckpointStore store(checkpoint_dir);
        store.set_verbose(g_verbose);

        fr_search::FrSearch search(parts[index], config, store);
        search.set_verbose(g_verbose);
        search.set_match_callback(print_match);

        auto results = search.run();
        for (const auto& result : results) {
            print_result(result);
        }
        print_stats(search);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
