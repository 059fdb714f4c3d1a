#pragma once

#include "numdict/errors.hpp"
#include "numdict/keys.hpp"

#include <cmath>
#include <initializer_list>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace workmem {

namespace detail {

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename K>
std::string describeKey(const K& key) {
    std::ostringstream oss;
    oss << key;
    return oss.str();
}

inline double checkedDefault(double c) {
    if (!std::isfinite(c)) {
        throw DomainError("WeightedMap default must be finite");
    }
    return c;
}

} // namespace detail

// ─── WeightedMap ───────────────────────────────────────────────
// Sparse map K → weight with an explicit default c for every key not
// stored. It stands for a total function over an unbounded key space:
//   w(k) = entries[k] if k is stored, else c.
// Entries are ordered by key so that iteration, grouping and tie
// breaking are deterministic.
//
// Every operation returns a new map. How each one treats the default
// is part of its contract and is stated on the declaration.

template <typename K>
class WeightedMap {
public:
    using key_type = K;
    using Entries = std::map<K, double>;
    using const_iterator = typename Entries::const_iterator;

    WeightedMap() = default;
    explicit WeightedMap(double c) : c_(detail::checkedDefault(c)) {}
    WeightedMap(Entries entries, double c = 0.0)
        : c_(detail::checkedDefault(c)), entries_(std::move(entries)) {}
    WeightedMap(std::initializer_list<std::pair<const K, double>> entries, double c = 0.0)
        : c_(detail::checkedDefault(c)), entries_(entries) {}

    // ── Access ──

    double c() const { return c_; }

    /// Weight of key, or the default if key is not stored.
    double get(const K& key) const {
        auto it = entries_.find(key);
        return it != entries_.end() ? it->second : c_;
    }
    double operator[](const K& key) const { return get(key); }

    bool contains(const K& key) const { return entries_.count(key) > 0; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const Entries& entries() const { return entries_; }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    /// Builder for maps the caller owns.
    void set(const K& key, double w) { entries_[key] = w; }

    // ── Filtering and key remapping ──

    /// Entries whose key satisfies pred. Default unchanged.
    template <typename Pred>
    WeightedMap keep(Pred pred) const;

    /// Remap every key through f. Colliding weights are summed.
    /// f may return K2 or std::optional<K2>; an empty optional raises
    /// KeyMappingError. Default unchanged.
    template <typename F>
    auto transformKeys(F f) const;

    /// Add every key of ks that is not stored, valued at the default.
    template <typename Range>
    WeightedMap withKeys(const Range& ks) const;

    /// Same entries, new default.
    WeightedMap withDefault(double c) const { return WeightedMap(entries_, c); }

    // ── Elementwise ──

    /// Every stored weight becomes 1. Default unchanged.
    WeightedMap mask() const;

    /// Drop stored entries equal to the default.
    WeightedMap squeeze() const;

    /// Pointwise product over the union of keys; default c * other.c.
    WeightedMap mul(const WeightedMap& other) const;
    WeightedMap mul(double s) const;

    /// Pointwise sum over the union of keys; default c + other.c.
    WeightedMap add(const WeightedMap& other) const;

    /// Union where other's stored entries win. Default stays ours.
    WeightedMap merge(const WeightedMap& other) const;

    WeightedMap sub(double s) const;   // w - s, including the default
    WeightedMap rsub(double s) const;  // s - w, including the default
    WeightedMap abs() const;

    /// 1 where w > threshold, else 0, including the default.
    WeightedMap greater(double threshold) const;

    // ── Grouped reductions ──
    // Partition stored entries by g(key) and reduce each partition.
    // Results are keyed by group and keep our default.

    template <typename G>
    auto sumBy(G g) const;

    template <typename G>
    auto maxBy(G g) const;

    template <typename G>
    auto minBy(G g) const;

    /// Winning key of each group under maxBy. On equal weights the
    /// lowest key wins.
    template <typename G>
    auto argmaxBy(G g) const;

    /// Competitive activation per group: the largest positive weight
    /// plus the most negative weight. A side with no entries adds 0.
    template <typename G>
    auto camBy(G g) const;

    /// Per-entry weight minus the maximum of its group. Keys unchanged,
    /// each group's winner maps to 0. Default 0.
    template <typename G>
    WeightedMap competeBy(G g) const;

    // ── Cross-map ──

    /// Gated lookup: our stored keys, each valued w(k) * other(kf(k)).
    /// Default c * other.c.
    template <typename K2, typename KF>
    WeightedMap put(const WeightedMap<K2>& other, KF kf) const;

    /// Pair every stored key with every stored key of other, weight
    /// is the product. Default c * other.c.
    template <typename K2>
    WeightedMap<std::pair<K, K2>> outer(const WeightedMap<K2>& other) const;

    // ── Comparison ──

    /// Equal defaults and equal entries once squeezed.
    bool operator==(const WeightedMap& other) const {
        return c_ == other.c_ && squeeze().entries_ == other.squeeze().entries_;
    }
    bool operator!=(const WeightedMap& other) const { return !(*this == other); }

    WeightedMap operator+(const WeightedMap& other) const { return add(other); }
    WeightedMap operator*(const WeightedMap& other) const { return mul(other); }

private:
    template <typename G, typename Reduce>
    auto reduceBy(G g, Reduce reduce) const;

    template <typename Op>
    WeightedMap mapWeights(Op op) const;

    template <typename Op>
    WeightedMap zipWith(const WeightedMap& other, Op op) const;

    double c_ = 0.0;
    Entries entries_;
};

using FeatureMap = WeightedMap<Feature>;
using ChunkMap = WeightedMap<Chunk>;
using SlotMap = WeightedMap<SlotKey>;
using IndexMap = WeightedMap<int>;

// ─── Implementation ────────────────────────────────────────────

template <typename K>
template <typename Pred>
WeightedMap<K> WeightedMap<K>::keep(Pred pred) const {
    Entries out;
    for (const auto& [k, w] : entries_) {
        if (pred(k)) out.emplace_hint(out.end(), k, w);
    }
    return WeightedMap(std::move(out), c_);
}

template <typename K>
template <typename F>
auto WeightedMap<K>::transformKeys(F f) const {
    using R = std::decay_t<std::invoke_result_t<F, const K&>>;
    if constexpr (detail::is_optional<R>::value) {
        using K2 = typename R::value_type;
        std::map<K2, double> out;
        for (const auto& [k, w] : entries_) {
            std::optional<K2> mapped = f(k);
            if (!mapped) {
                throw KeyMappingError("No key mapping for " + detail::describeKey(k));
            }
            out[*mapped] += w;
        }
        return WeightedMap<K2>(std::move(out), c_);
    } else {
        std::map<R, double> out;
        for (const auto& [k, w] : entries_) {
            out[f(k)] += w;
        }
        return WeightedMap<R>(std::move(out), c_);
    }
}

template <typename K>
template <typename Range>
WeightedMap<K> WeightedMap<K>::withKeys(const Range& ks) const {
    Entries out = entries_;
    for (const auto& k : ks) {
        out.emplace(K(k), c_);  // no-op for stored keys
    }
    return WeightedMap(std::move(out), c_);
}

template <typename K>
template <typename Op>
WeightedMap<K> WeightedMap<K>::mapWeights(Op op) const {
    Entries out;
    for (const auto& [k, w] : entries_) {
        out.emplace_hint(out.end(), k, op(w));
    }
    return WeightedMap(std::move(out), op(c_));
}

template <typename K>
template <typename Op>
WeightedMap<K> WeightedMap<K>::zipWith(const WeightedMap& other, Op op) const {
    Entries out;
    for (const auto& [k, w] : entries_) {
        out.emplace_hint(out.end(), k, op(w, other.get(k)));
    }
    for (const auto& [k, w] : other.entries_) {
        if (!entries_.count(k)) out.emplace(k, op(c_, w));
    }
    return WeightedMap(std::move(out), op(c_, other.c_));
}

template <typename K>
WeightedMap<K> WeightedMap<K>::mask() const {
    Entries out;
    for (const auto& kv : entries_) {
        out.emplace_hint(out.end(), kv.first, 1.0);
    }
    return WeightedMap(std::move(out), c_);
}

template <typename K>
WeightedMap<K> WeightedMap<K>::squeeze() const {
    Entries out;
    for (const auto& [k, w] : entries_) {
        if (w != c_) out.emplace_hint(out.end(), k, w);
    }
    return WeightedMap(std::move(out), c_);
}

template <typename K>
WeightedMap<K> WeightedMap<K>::mul(const WeightedMap& other) const {
    return zipWith(other, [](double a, double b) { return a * b; });
}

template <typename K>
WeightedMap<K> WeightedMap<K>::mul(double s) const {
    return mapWeights([s](double w) { return w * s; });
}

template <typename K>
WeightedMap<K> WeightedMap<K>::add(const WeightedMap& other) const {
    return zipWith(other, [](double a, double b) { return a + b; });
}

template <typename K>
WeightedMap<K> WeightedMap<K>::merge(const WeightedMap& other) const {
    Entries out = entries_;
    for (const auto& [k, w] : other.entries_) {
        out[k] = w;
    }
    return WeightedMap(std::move(out), c_);
}

template <typename K>
WeightedMap<K> WeightedMap<K>::sub(double s) const {
    return mapWeights([s](double w) { return w - s; });
}

template <typename K>
WeightedMap<K> WeightedMap<K>::rsub(double s) const {
    return mapWeights([s](double w) { return s - w; });
}

template <typename K>
WeightedMap<K> WeightedMap<K>::abs() const {
    return mapWeights([](double w) { return std::fabs(w); });
}

template <typename K>
WeightedMap<K> WeightedMap<K>::greater(double threshold) const {
    return mapWeights([threshold](double w) { return w > threshold ? 1.0 : 0.0; });
}

template <typename K>
template <typename G, typename Reduce>
auto WeightedMap<K>::reduceBy(G g, Reduce reduce) const {
    using GK = std::decay_t<std::invoke_result_t<G, const K&>>;
    std::map<GK, double> out;
    for (const auto& [k, w] : entries_) {
        GK group = g(k);
        auto it = out.find(group);
        if (it == out.end()) {
            out.emplace(std::move(group), w);
        } else {
            it->second = reduce(it->second, w);
        }
    }
    return WeightedMap<GK>(std::move(out), c_);
}

template <typename K>
template <typename G>
auto WeightedMap<K>::sumBy(G g) const {
    return reduceBy(g, [](double a, double b) { return a + b; });
}

template <typename K>
template <typename G>
auto WeightedMap<K>::maxBy(G g) const {
    return reduceBy(g, [](double a, double b) { return b > a ? b : a; });
}

template <typename K>
template <typename G>
auto WeightedMap<K>::minBy(G g) const {
    return reduceBy(g, [](double a, double b) { return b < a ? b : a; });
}

template <typename K>
template <typename G>
auto WeightedMap<K>::argmaxBy(G g) const {
    using GK = std::decay_t<std::invoke_result_t<G, const K&>>;
    std::map<GK, std::pair<K, double>> best;
    // Keys arrive in ascending order, so a strict comparison keeps
    // the lowest key among equal weights.
    for (const auto& [k, w] : entries_) {
        GK group = g(k);
        auto it = best.find(group);
        if (it == best.end()) {
            best.emplace(std::move(group), std::make_pair(k, w));
        } else if (w > it->second.second) {
            it->second = std::make_pair(k, w);
        }
    }
    std::map<GK, K> out;
    for (auto& [group, kw] : best) {
        out.emplace(group, kw.first);
    }
    return out;
}

template <typename K>
template <typename G>
auto WeightedMap<K>::camBy(G g) const {
    using GK = std::decay_t<std::invoke_result_t<G, const K&>>;
    std::map<GK, std::pair<double, double>> extremes;  // (max positive, min negative)
    for (const auto& [k, w] : entries_) {
        auto& e = extremes[g(k)];
        if (w > e.first) e.first = w;
        if (w < e.second) e.second = w;
    }
    std::map<GK, double> out;
    for (const auto& [group, e] : extremes) {
        out.emplace_hint(out.end(), group, e.first + e.second);
    }
    return WeightedMap<GK>(std::move(out), c_);
}

template <typename K>
template <typename G>
WeightedMap<K> WeightedMap<K>::competeBy(G g) const {
    auto group_max = maxBy(g);
    Entries out;
    for (const auto& [k, w] : entries_) {
        out.emplace_hint(out.end(), k, w - group_max.get(g(k)));
    }
    return WeightedMap(std::move(out), 0.0);
}

template <typename K>
template <typename K2, typename KF>
WeightedMap<K> WeightedMap<K>::put(const WeightedMap<K2>& other, KF kf) const {
    Entries out;
    for (const auto& [k, w] : entries_) {
        out.emplace_hint(out.end(), k, w * other.get(kf(k)));
    }
    return WeightedMap(std::move(out), c_ * other.c());
}

template <typename K>
template <typename K2>
WeightedMap<std::pair<K, K2>> WeightedMap<K>::outer(const WeightedMap<K2>& other) const {
    std::map<std::pair<K, K2>, double> out;
    for (const auto& [k1, w1] : entries_) {
        for (const auto& [k2, w2] : other) {
            out.emplace_hint(out.end(), std::make_pair(k1, k2), w1 * w2);
        }
    }
    return WeightedMap<std::pair<K, K2>>(std::move(out), c_ * other.c());
}

} // namespace workmem
