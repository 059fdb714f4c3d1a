#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace workmem {

// ─── Feature ───────────────────────────────────────────────────
// A (dimension, value) signal key. An empty value is the wildcard
// marker: it never carries data, it addresses the whole dimension.

using FeatureValue = std::variant<int, std::string>;

struct Feature {
    std::string dim;
    std::optional<FeatureValue> value;

    Feature() = default;
    explicit Feature(std::string dim) : dim(std::move(dim)) {}
    Feature(std::string dim, int v) : dim(std::move(dim)), value(v) {}
    Feature(std::string dim, std::string v) : dim(std::move(dim)), value(std::move(v)) {}
    Feature(std::string dim, std::optional<FeatureValue> v)
        : dim(std::move(dim)), value(std::move(v)) {}

    bool isWildcard() const { return !value.has_value(); }

    /// True if the value is the integer v.
    bool hasInt(int v) const {
        if (!value) return false;
        const int* i = std::get_if<int>(&*value);
        return i && *i == v;
    }

    bool operator==(const Feature& o) const { return dim == o.dim && value == o.value; }
    bool operator!=(const Feature& o) const { return !(*this == o); }
    bool operator<(const Feature& o) const {
        if (dim != o.dim) return dim < o.dim;
        return value < o.value;  // wildcard sorts first
    }
};

// ─── Chunk ─────────────────────────────────────────────────────
// Opaque identifier of a stored concept instance.

struct Chunk {
    std::string id;

    Chunk() = default;
    explicit Chunk(std::string id) : id(std::move(id)) {}

    bool operator==(const Chunk& o) const { return id == o.id; }
    bool operator!=(const Chunk& o) const { return id != o.id; }
    bool operator<(const Chunk& o) const { return id < o.id; }
};

/// (slot index, chunk); slot indices start at 1.
using SlotKey = std::pair<int, Chunk>;

/// Key functions for pair-shaped keys.
struct First {
    template <typename A, typename B>
    const A& operator()(const std::pair<A, B>& k) const { return k.first; }
};

struct Second {
    template <typename A, typename B>
    const B& operator()(const std::pair<A, B>& k) const { return k.second; }
};

std::ostream& operator<<(std::ostream& os, const Feature& f);
std::ostream& operator<<(std::ostream& os, const Chunk& c);

template <typename A, typename B>
std::ostream& operator<<(std::ostream& os, const std::pair<A, B>& k) {
    return os << "(" << k.first << ", " << k.second << ")";
}

std::string toString(const Feature& f);

// ─── Dimension paths ───────────────────────────────────────────
// Dimensions are '/'-separated paths. Each segment is a non-empty run
// of [A-Za-z0-9_-].

constexpr char PATH_SEP = '/';

bool isPath(const std::string& s);

/// Compose "prefix/dim"; returns dim unchanged when prefix is empty.
std::string withPrefix(const std::string& prefix, const std::string& dim);

} // namespace workmem
