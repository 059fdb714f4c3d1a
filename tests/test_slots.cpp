#include <gtest/gtest.h>
#include "wm/slot_store.hpp"

#include <string>
#include <vector>

using namespace workmem;

namespace {

FeatureMap commands(const std::vector<Feature>& cmds) {
    FeatureMap m(0.0);
    for (const auto& f : cmds) m.set(f, 1.0);
    return m;
}

Feature readCmd(int slot) { return Feature("read-" + std::to_string(slot), 1); }
Feature writeCmd(int slot, int v) { return Feature("write-" + std::to_string(slot), v); }
Feature full(int slot) { return Feature("full-" + std::to_string(slot)); }
Feature match(int slot) { return Feature("match-" + std::to_string(slot)); }

Chunk ch(const std::string& id) { return Chunk(id); }

const ChunkMap NONE(0.0);

} // namespace

// ─── Construction ──────────────────────────────────────────────

TEST(SlotStoreTest, NonPositiveSlotCountIsRejected) {
    EXPECT_THROW(SlotStore(0), ConfigurationError);
    EXPECT_THROW(SlotStore(-3), ConfigurationError);
    EXPECT_THROW(SlotStore(SlotStoreConfig{2, "bad//prefix"}), ConfigurationError);
}

TEST(SlotStoreTest, StartsEmpty) {
    SlotStore store(3);
    EXPECT_EQ(store.slots(), 3);
    EXPECT_TRUE(store.contents().empty());

    FeatureMap status = store.status(NONE);
    for (int i = 1; i <= 3; i++) {
        EXPECT_DOUBLE_EQ(status.get(full(i)), -1.0);
        EXPECT_FALSE(store.chunkAt(i).has_value());
    }
    EXPECT_TRUE(store.initial().chunks.empty());
    EXPECT_TRUE(store.initial().flags.empty());
}

// ─── Writing ───────────────────────────────────────────────────

TEST(SlotStoreTest, WriteThenClear) {
    SlotStore store(3);

    SlotOutput out = store.step(commands({writeCmd(2, 1)}), ChunkMap{{ch("X"), 1.0}}, NONE);
    EXPECT_DOUBLE_EQ(out.flags.get(full(2)), 1.0);
    ASSERT_TRUE(store.chunkAt(2).has_value());
    EXPECT_EQ(*store.chunkAt(2), ch("X"));

    out = store.step(commands({writeCmd(2, -1)}), ChunkMap{{ch("Y"), 1.0}}, NONE);
    EXPECT_FALSE(store.chunkAt(2).has_value());
    EXPECT_FALSE(store.isFull(2));
    EXPECT_DOUBLE_EQ(out.flags.get(full(2)), -1.0);
    EXPECT_TRUE(store.contents().empty());
}

TEST(SlotStoreTest, OverwriteReplacesContents) {
    SlotStore store(2);
    store.step(commands({writeCmd(1, 1)}), ChunkMap{{ch("X"), 1.0}}, NONE);
    store.step(commands({writeCmd(1, 1)}), ChunkMap{{ch("Y"), 1.0}}, NONE);

    EXPECT_EQ(store.contents().size(), 1);
    EXPECT_FALSE(store.contents().contains({1, ch("X")}));
    EXPECT_DOUBLE_EQ(store.contents().get({1, ch("Y")}), 1.0);
}

TEST(SlotStoreTest, ZeroWriteLeavesSlotAlone) {
    SlotStore store(2);
    store.step(commands({writeCmd(1, 1)}), ChunkMap{{ch("X"), 1.0}}, NONE);
    store.step(commands({writeCmd(1, 0), writeCmd(2, 0)}), ChunkMap{{ch("Y"), 1.0}}, NONE);

    EXPECT_EQ(*store.chunkAt(1), ch("X"));
    EXPECT_FALSE(store.chunkAt(2).has_value());
}

TEST(SlotStoreTest, WritesOnlyTouchAddressedSlots) {
    SlotStore store(3);
    store.step(commands({writeCmd(1, 1)}), ChunkMap{{ch("A"), 1.0}}, NONE);
    store.step(commands({writeCmd(3, 1)}), ChunkMap{{ch("B"), 1.0}}, NONE);
    store.step(commands({writeCmd(1, -1)}), NONE, NONE);

    EXPECT_FALSE(store.chunkAt(1).has_value());
    EXPECT_EQ(*store.chunkAt(3), ch("B"));
}

TEST(SlotStoreTest, WriteKeepsSelectedWeight) {
    SlotStore store(1);
    store.step(commands({writeCmd(1, 1)}), ChunkMap{{ch("A"), 0.5}}, NONE);
    EXPECT_DOUBLE_EQ(store.contents().get({1, ch("A")}), 0.5);
}

TEST(SlotStoreTest, WriteWithEmptySelectionClears) {
    SlotStore store(1);
    store.step(commands({writeCmd(1, 1)}), ChunkMap{{ch("A"), 1.0}}, NONE);
    store.step(commands({writeCmd(1, 1)}), NONE, NONE);
    EXPECT_FALSE(store.isFull(1));
}

// ─── Reading ───────────────────────────────────────────────────

TEST(SlotStoreTest, ReadReturnsRequestedSlotsOnly) {
    SlotStore store(3);
    store.step(commands({writeCmd(1, 1)}), ChunkMap{{ch("A"), 1.0}}, NONE);
    store.step(commands({writeCmd(2, 1)}), ChunkMap{{ch("B"), 1.0}}, NONE);

    SlotOutput out = store.step(commands({readCmd(2)}), NONE, NONE);
    EXPECT_EQ(out.chunks.size(), 1);
    EXPECT_DOUBLE_EQ(out.chunks.get(ch("B")), 1.0);
    EXPECT_FALSE(out.chunks.contains(ch("A")));

    // Reads are not destructive.
    EXPECT_EQ(store.contents().size(), 2);
}

TEST(SlotStoreTest, MultiSlotReadKeepsStrongestOccurrence) {
    SlotStore store(3);
    store.step(commands({writeCmd(1, 1)}), ChunkMap{{ch("A"), 1.0}}, NONE);
    store.step(commands({writeCmd(3, 1)}), ChunkMap{{ch("A"), 0.5}}, NONE);

    ChunkMap chunks = store.select(commands({readCmd(1), readCmd(3)}));
    EXPECT_EQ(chunks.size(), 1);
    EXPECT_DOUBLE_EQ(chunks.get(ch("A")), 1.0);

    chunks = store.select(commands({readCmd(3)}));
    EXPECT_DOUBLE_EQ(chunks.get(ch("A")), 0.5);
}

TEST(SlotStoreTest, ReadSeesWriteFromSameStep) {
    SlotStore store(1);
    SlotOutput out = store.step(commands({writeCmd(1, 1), readCmd(1)}), ChunkMap{{ch("A"), 1.0}}, NONE);
    EXPECT_DOUBLE_EQ(out.chunks.get(ch("A")), 1.0);
}

TEST(SlotStoreTest, ReadZeroSelectsNothing) {
    SlotStore store(1);
    store.step(commands({writeCmd(1, 1)}), ChunkMap{{ch("A"), 1.0}}, NONE);
    SlotOutput out = store.step(commands(store.nops()), NONE, NONE);
    EXPECT_TRUE(out.chunks.empty());
    EXPECT_TRUE(store.isFull(1));
}

// ─── Status flags ──────────────────────────────────────────────

TEST(SlotStoreTest, FullnessIsAlwaysDecided) {
    SlotStore store(4);
    std::vector<FeatureMap> steps = {
        FeatureMap(0.0),
        commands({writeCmd(2, 1)}),
        commands({writeCmd(4, 1), readCmd(2)}),
        commands({writeCmd(2, -1), Feature("write-9", 1), Feature("noise")}),
        commands({writeCmd(1, 1), writeCmd(1, -1)}),
    };
    for (const auto& cmds : steps) {
        SlotOutput out = store.step(cmds, ChunkMap{{ch("A"), 1.0}}, NONE);
        for (int i = 1; i <= 4; i++) {
            ASSERT_TRUE(out.flags.contains(full(i)));
            double f = out.flags.get(full(i));
            EXPECT_TRUE(f == 1.0 || f == -1.0) << "full-" << i << " = " << f;
        }
    }
}

TEST(SlotStoreTest, MatchReflectsHeldChunk) {
    SlotStore store(3);
    store.step(commands({writeCmd(1, 1)}), ChunkMap{{ch("A"), 1.0}}, NONE);
    store.step(commands({writeCmd(2, 1)}), ChunkMap{{ch("B"), 1.0}}, NONE);

    ChunkMap scores{{ch("A"), 0.75}, {ch("B"), -0.5}, {ch("C"), 1.0}};
    FeatureMap status = store.status(scores);

    EXPECT_DOUBLE_EQ(status.get(match(1)), 0.75);
    EXPECT_DOUBLE_EQ(status.get(match(2)), -0.5);
    EXPECT_FALSE(status.contains(match(3)));  // empty slot has no match
    EXPECT_DOUBLE_EQ(status.get(full(3)), -1.0);
}

TEST(SlotStoreTest, StatusCoversEverySlot) {
    SlotStore store(2);
    SlotOutput out = store.step(FeatureMap(0.0), NONE, NONE);
    EXPECT_EQ(out.flags.size(), 2);
    EXPECT_DOUBLE_EQ(out.flags.c(), 0.0);
}

// ─── Permissive commands ───────────────────────────────────────

TEST(SlotStoreTest, UnknownCommandsAreIgnored) {
    SlotStore store(2);
    FeatureMap cmds = commands({
        writeCmd(1, 1),
        Feature("write-3", 1),               // no such slot
        Feature("erase-1", 1),               // no such command
        Feature("read-1", std::string("x")), // non-integer value
        Feature("write-2"),                  // wildcard
    });

    EXPECT_NO_THROW(store.step(cmds, ChunkMap{{ch("A"), 1.0}}, NONE));
    EXPECT_EQ(*store.chunkAt(1), ch("A"));
    EXPECT_FALSE(store.chunkAt(2).has_value());
    EXPECT_EQ(store.contents().size(), 1);
}

TEST(SlotStoreTest, ResetEmptiesEverySlot) {
    SlotStore store(2);
    store.step(commands({writeCmd(1, 1), writeCmd(2, 1)}), ChunkMap{{ch("A"), 1.0}}, NONE);
    EXPECT_EQ(store.contents().size(), 2);

    store.reset();
    EXPECT_TRUE(store.contents().empty());
}

// ─── Vocabulary and prefix ─────────────────────────────────────

TEST(SlotStoreTest, CommandVocabulary) {
    SlotStore store(2);

    std::vector<Feature> expected = {
        Feature("read-1", 0), Feature("read-1", 1),
        Feature("write-1", -1), Feature("write-1", 0), Feature("write-1", 1),
        Feature("read-2", 0), Feature("read-2", 1),
        Feature("write-2", -1), Feature("write-2", 0), Feature("write-2", 1),
    };
    EXPECT_EQ(store.cmds(), expected);

    std::vector<Feature> nops = {
        Feature("read-1", 0), Feature("write-1", 0),
        Feature("read-2", 0), Feature("write-2", 0),
    };
    EXPECT_EQ(store.nops(), nops);

    std::vector<Feature> flags = {full(1), full(2), match(1), match(2)};
    EXPECT_EQ(store.flags(), flags);
}

TEST(SlotStoreTest, PrefixNamespacesDimensions) {
    SlotStore store(SlotStoreConfig{2, "wm"});

    SlotOutput out = store.step(
        commands({Feature("wm/write-1", 1), Feature("wm/read-1", 1)}),
        ChunkMap{{ch("A"), 1.0}}, NONE);
    EXPECT_DOUBLE_EQ(out.chunks.get(ch("A")), 1.0);
    EXPECT_DOUBLE_EQ(out.flags.get(Feature("wm/full-1")), 1.0);
    EXPECT_DOUBLE_EQ(out.flags.get(Feature("wm/full-2")), -1.0);

    // Unprefixed commands are ignored, not rejected.
    store.step(commands({writeCmd(1, -1)}), NONE, NONE);
    EXPECT_TRUE(store.isFull(1));
}
