#include "fr_search/enumerator.hpp"
#include <iostream>
#include <stdexcept>

namespace fr_search {

TupleCursor::TupleCursor(std::vector<CoefRange> ranges)
    : ranges_(std::move(ranges)) {
    reset();
}

void TupleCursor::reset() {
    current_.clear();
    for (const auto& r : ranges_) {
        current_.push_back(r.lo);
    }
}

void TupleCursor::seek(const CoefTuple& coefs) {
    if (coefs.size() != ranges_.size()) {
        throw std::invalid_argument("Tuple arity does not match the axis count");
    }
    for (size_t i = 0; i < ranges_.size(); ++i) {
        if (!ranges_[i].contains(coefs[i])) {
            throw std::invalid_argument("Tuple value outside its axis range");
        }
    }
    current_ = coefs;
}

bool TupleCursor::advance() {
    for (size_t i = ranges_.size(); i > 0; --i) {
        auto& v = current_[i - 1];
        if (v < ranges_[i - 1].hi) {
            ++v;
            return true;
        }
        v = ranges_[i - 1].lo;  // 桁上がり
    }
    return false;
}

DomainEnumerator::DomainEnumerator(PolyDomain domain, const CheckpointStore& store,
                                   SeriesId primary, size_t checkpoint_interval)
    : domain_(std::move(domain))
    , store_(store)
    , primary_(primary)
    , checkpoint_interval_(checkpoint_interval)
    , checkpoint_key_(store.key_for(domain_))
    , primary_cursor_(domain_.axis_ranges(primary))
    , secondary_cursor_(domain_.axis_ranges(primary == SeriesId::A ? SeriesId::B : SeriesId::A)) {
    if (checkpoint_interval_ == 0) {
        throw std::invalid_argument("Checkpoint interval must be positive");
    }
}

CoefPair DomainEnumerator::current_pair() const {
    if (primary_ == SeriesId::A) {
        return CoefPair{primary_cursor_.current(), secondary_cursor_.current()};
    }
    return CoefPair{secondary_cursor_.current(), primary_cursor_.current()};
}

std::optional<CoefPair> DomainEnumerator::next() {
    switch (state_) {
        case State::Done:
            return std::nullopt;

        case State::Fresh: {
            resumed_from_ = store_.load(domain_);
            primary_cursor_.seek(resumed_from_.of(primary_));
            secondary_cursor_.seek(resumed_from_.of(secondary()));
            if (verbose_) {
                std::cerr << "% [enumerate] " << domain_.describe() << " primary="
                          << series_name(primary_) << " size=" << domain_.total_size() << "\n";
            }
            state_ = State::Running;
            items_passed_ = 1;
            // チェックポイントの座標はもう一度返す
            return current_pair();
        }

        case State::Running:
            break;
    }

    if (!secondary_cursor_.advance()) {
        // secondary が一巡したら primary を進め、secondary は起点から
        if (!primary_cursor_.advance()) {
            state_ = State::Done;
            store_.remove(checkpoint_key_);
            if (verbose_) {
                std::cerr << "% [enumerate] done after " << items_passed_ << " items\n";
            }
            return std::nullopt;
        }
    }

    CoefPair pair = current_pair();
    if (items_passed_ % checkpoint_interval_ == 0) {
        store_.save(checkpoint_key_, pair.a, pair.b);
    }
    ++items_passed_;
    return pair;
}

} // namespace fr_search
