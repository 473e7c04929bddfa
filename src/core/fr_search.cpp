#include "fr_search/fr_search.hpp"
#include "fr_search/constants.hpp"
#include "fr_search/series.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace fr_search {

bool MatchStore::add(const Match& match) {
    if (!seen_.insert(match).second) {
        return false;
    }
    matches_.push_back(match);
    return true;
}

FrSearch::FrSearch(PolyDomain domain, SearchConfig config, const CheckpointStore& store)
    : domain_(std::move(domain))
    , config_(std::move(config))
    , store_(store)
    , evaluator_(std::make_unique<ConvergentEvaluator>(
          config_.refine_min_depth, config_.refine_max_depth, config_.refine_target_digits)) {
    if (config_.constants.empty()) {
        throw std::invalid_argument("At least one target constant is required");
    }
    for (const auto& name : config_.constants) {
        if (!ConstantRegistry::contains(name)) {
            throw std::invalid_argument("Unknown constant: " + name);
        }
    }
}

void FrSearch::set_evaluator(std::unique_ptr<ValueEvaluator> evaluator) {
    evaluator_ = std::move(evaluator);
}

std::vector<Match> FrSearch::first_enumeration() {
    ScopedDigits digits(config_.fr_digits);

    MatchStore results;
    size_t restored = 0;
    for (const auto& saved : store_.load_matches(domain_)) {
        if (results.add(Match{saved.first, saved.second})) {
            ++restored;
        }
    }
    stats_.restored_matches += restored;
    if (verbose_ && restored > 0) {
        std::cerr << "% [fr] restored " << restored << " matches from an interrupted run\n";
    }

    DomainEnumerator enumerator(domain_, store_, config_.primary, config_.checkpoint_dump_size);
    enumerator.set_verbose(verbose_);

    // 外側の系列は内側ループの間キャッシュから返る
    SeriesCache an_cache(config_.first_enumeration_max_depth);
    SeriesCache bn_cache(config_.first_enumeration_max_depth);

    while (auto pair = enumerator.next()) {
        ++stats_.candidates;
        const Terms& an = an_cache.get(pair->a);
        const Terms& bn = bn_cache.get(pair->b);

        FrResult result = check_for_fr(an, bn, PolyDomain::compact_degree(pair->a),
                                       config_.burst_number, config_.min_iters,
                                       config_.convergence_threshold);
        switch (result.outcome) {
            case FrOutcome::Degenerate: ++stats_.degenerate; break;
            case FrOutcome::Diverging: ++stats_.diverging; break;
            case FrOutcome::Exhausted: ++stats_.exhausted; break;
            case FrOutcome::Converged: break;
        }
        if (!result.has_fr) {
            continue;
        }

        Match match{pair->a, pair->b};
        if (!results.add(match)) {
            ++stats_.duplicate_matches;
            continue;
        }
        ++stats_.fr_matches;
        save_matches(results);
        if (verbose_) {
            std::cerr << "% [fr] found a GCF with FR: an=" << format_tuple(match.an_coef)
                      << " bn=" << format_tuple(match.bn_coef)
                      << " (step " << result.step << ")\n";
        }
        if (on_match_) {
            on_match_(match);
        }
    }

    return results.matches();
}

void FrSearch::save_matches(const MatchStore& results) const {
    CoefPairList pairs;
    for (const auto& m : results.matches()) {
        pairs.emplace_back(m.an_coef, m.bn_coef);
    }
    store_.save_matches(store_.key_for(domain_), pairs);
}

std::vector<RefinedMatch> FrSearch::improve_results_precision(const std::vector<Match>& matches) {
    ScopedDigits digits(config_.refine_target_digits);

    std::vector<RefinedMatch> refined;
    for (const auto& match : matches) {
        refine_one(match, refined);
    }
    return refined;
}

void FrSearch::refine_one(const Match& match, std::vector<RefinedMatch>& out) {
    std::optional<EvaluatedValue> evaluated;
    try {
        evaluated = evaluator_->evaluate(match.an_coef, match.bn_coef);
    } catch (const std::exception& e) {
        ++stats_.refine_failures;
        std::cerr << "% [pslq] WARNING: evaluating an=" << format_tuple(match.an_coef)
                  << " bn=" << format_tuple(match.bn_coef) << " failed: " << e.what() << "\n";
        return;
    }

    if (verbose_) {
        std::cerr << "% [pslq] an=" << format_tuple(match.an_coef)
                  << " bn=" << format_tuple(match.bn_coef)
                  << " value=" << evaluated->value.str(30)
                  << " precision=" << evaluated->precision
                  << " depth=" << evaluated->depth << "\n";
    }

    for (const auto& name : config_.constants) {
        BigFloat constant = *ConstantRegistry::value(name);
        std::optional<RelationFraction> relation;
        try {
            relation = find_relation(evaluated->value, constant, evaluated->precision,
                                     config_.pslq_max_coeff, config_.pslq_max_steps);
        } catch (const std::exception& e) {
            ++stats_.refine_failures;
            std::cerr << "% [pslq] WARNING: exception when using PSLQ on an="
                      << format_tuple(match.an_coef) << " bn=" << format_tuple(match.bn_coef)
                      << ", " << evaluated->value.str(30) << " with constant " << name
                      << ": " << e.what() << "\n";
            continue;
        }

        if (relation) {
            ++stats_.relations_found;
            if (verbose_) {
                std::cerr << "% [pslq] " << format_relation(*relation, name) << "\n";
            }
        } else {
            ++stats_.relations_missing;
        }
        out.push_back(RefinedMatch{match, evaluated->value, name, std::move(relation),
                                   evaluated->precision});
    }
}

std::vector<RefinedMatch> FrSearch::run() {
    auto matches = first_enumeration();
    if (verbose_) {
        std::cerr << "% [fr] " << matches.size() << " matches out of "
                  << stats_.candidates << " candidates\n";
    }
    auto results = refine_results(improve_results_precision(matches));
    store_.remove_matches(store_.key_for(domain_));
    return results;
}

} // namespace fr_search
