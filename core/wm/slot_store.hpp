#pragma once

#include "numdict/weighted_map.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace workmem {

// ─── Slot Store Config ─────────────────────────────────────────

struct SlotStoreConfig {
    int slots = 1;        // number of slots, indexed from 1
    std::string prefix;   // namespaces every dimension as prefix/dim
};

/// Output of one SlotStore step.
struct SlotOutput {
    ChunkMap chunks{0.0};     // chunks read this step, strongest occurrence each
    FeatureMap flags{0.0};    // full-i and match-i status per slot
};

// ─── Slot Store ────────────────────────────────────────────────
// A bank of N working-memory slots, each empty or holding a chunk.
//
// Commands per slot i:
//   read-i  : 1   → include slot i's contents in this step's output
//   write-i : +1  → clear slot i, then write the selected chunk(s)
//   write-i : -1  → clear slot i
//   write-i : 0   → leave slot i alone
//
// A step applies writes first and then reads, so the output reflects
// the commands of the same step. Commands that name no declared slot
// dimension are ignored.

class SlotStore {
public:
    explicit SlotStore(SlotStoreConfig config);
    explicit SlotStore(int slots, std::string prefix = "");

    /// Apply commands, writing `selected` where requested, then report
    /// the read selection and status flags. `match` scores candidate
    /// chunks against slot contents.
    SlotOutput step(const FeatureMap& commands, const ChunkMap& selected, const ChunkMap& match);

    /// Apply write commands only.
    void update(const FeatureMap& commands, const ChunkMap& selected);

    /// Chunks held by the slots with read-i = 1; each chunk keeps its
    /// maximum weight across those slots. Does not modify the store.
    ChunkMap select(const FeatureMap& commands) const;

    /// full-i for every slot and match-i for every occupied slot.
    FeatureMap status(const ChunkMap& match) const;

    /// Raw store: (slot, chunk) → weight, default 0.
    const SlotMap& contents() const { return store_; }

    /// Strongest chunk held by slot i, if any.
    std::optional<Chunk> chunkAt(int slot) const;

    bool isFull(int slot) const;

    /// Output before the first step.
    SlotOutput initial() const { return SlotOutput{}; }

    /// Empty every slot.
    void reset() { store_ = SlotMap(0.0); }

    /// full-1..N, then match-1..N.
    std::vector<Feature> flags() const;

    /// read-i ∈ {0, 1} and write-i ∈ {-1, 0, 1} for every slot.
    std::vector<Feature> cmds() const;

    /// read-i = 0 and write-i = 0 for every slot.
    std::vector<Feature> nops() const;

    int slots() const { return slots_; }
    const std::string& prefix() const { return prefix_; }

private:
    enum class CommandKind { Read, Write };

    struct SlotCommand {
        CommandKind kind;
        int slot;
    };

    /// Slots addressed by commands of the given kind whose value
    /// satisfies accept, masked to 1. Unknown commands are dropped.
    IndexMap decode(const FeatureMap& commands, CommandKind kind,
                    const std::function<bool(int)>& accept) const;

    void logIgnored(const FeatureMap& commands) const;

    Feature statusFlag(const std::string& name, int slot) const;

    int slots_;
    std::string prefix_;

    // command dimension → (kind, slot), built once at construction
    std::map<std::string, SlotCommand> decoder_;

    SlotMap store_{0.0};
};

} // namespace workmem
