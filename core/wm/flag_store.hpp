#pragma once

#include "numdict/weighted_map.hpp"

#include <map>
#include <string>
#include <vector>

namespace workmem {

// ─── Flag Store Config ─────────────────────────────────────────

struct FlagStoreConfig {
    std::vector<std::string> flags;    // flag names, each a path
    std::vector<int> values = {-1, 0, 1};  // accepted command values besides reset
    std::string prefix;                // namespaces every dimension as prefix/dim
};

// ─── Flag Store ────────────────────────────────────────────────
// Persistent ternary flags driven by weighted commands.
//
// The command for flag f has dimension "set-f":
//   set-f : none  → f = 0
//   set-f : 1     → f = +1
//   set-f : -1    → f = -1
//   set-f : 0     → no change
// Commands in one step apply as reset, then +1, then -1. A reset
// together with a set yields the set value; +1 together with -1
// yields -1.
//
// Commands that do not decode against the declared flags raise
// CommandError and leave the state untouched.

class FlagStore {
public:
    static constexpr const char* SET_PREFIX = "set";

    explicit FlagStore(FlagStoreConfig config);
    FlagStore(std::vector<std::string> flags,
              std::vector<int> values = {-1, 0, 1},
              std::string prefix = "");

    /// Apply one step of commands and return the current flags.
    FeatureMap step(const FeatureMap& commands);

    /// Apply commands without producing output.
    void update(const FeatureMap& commands);

    /// Current flags; keys are the flag features, default 0.
    const FeatureMap& state() const { return store_; }

    /// Output before the first step.
    FeatureMap initial() const { return FeatureMap(0.0); }

    /// Current sign of a flag given by its undecorated name.
    int get(const std::string& flag) const;

    /// Return every flag to 0.
    void reset() { store_ = FeatureMap(0.0); }

    /// Flag features, one per flag, in declaration order.
    std::vector<Feature> flags() const;

    /// Every accepted command: none plus each configured value, per flag.
    std::vector<Feature> cmds() const;

    /// Commands that leave the state unchanged (value 0 per flag).
    std::vector<Feature> nops() const;

    const std::string& prefix() const { return prefix_; }
    size_t flagCount() const { return flag_names_.size(); }

private:
    void validate(const FeatureMap& commands) const;
    std::optional<Feature> commandToFlag(const Feature& command) const;
    std::string commandDim(const std::string& flag) const;

    std::vector<std::string> flag_names_;
    std::vector<int> values_;
    std::string prefix_;

    // command dimension → flag feature, built once at construction
    std::map<std::string, Feature> decoder_;

    FeatureMap store_{0.0};
};

} // namespace workmem
