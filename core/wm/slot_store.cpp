#include "wm/slot_store.hpp"
#include "util/logger.hpp"

namespace workmem {

namespace {

constexpr const char* COMPONENT = "SlotStore";

} // namespace

SlotStore::SlotStore(SlotStoreConfig config)
    : SlotStore(config.slots, std::move(config.prefix)) {}

SlotStore::SlotStore(int slots, std::string prefix)
    : slots_(slots), prefix_(std::move(prefix)) {
    if (slots_ <= 0) {
        logAndThrow<ConfigurationError>(
            COMPONENT, "Slot count must be positive, got " + std::to_string(slots_));
    }
    if (!prefix_.empty() && !isPath(prefix_)) {
        logAndThrow<ConfigurationError>(COMPONENT, "Prefix '" + prefix_ + "' is not a valid path");
    }

    for (int i = 1; i <= slots_; i++) {
        decoder_.emplace(withPrefix(prefix_, "read-" + std::to_string(i)),
                         SlotCommand{CommandKind::Read, i});
        decoder_.emplace(withPrefix(prefix_, "write-" + std::to_string(i)),
                         SlotCommand{CommandKind::Write, i});
    }

    Logger::info(COMPONENT, "Created with " + std::to_string(slots_) +
                            " slots" + (prefix_.empty() ? "" : " under '" + prefix_ + "'"));
}

SlotOutput SlotStore::step(const FeatureMap& commands, const ChunkMap& selected,
                           const ChunkMap& match) {
    update(commands, selected);

    SlotOutput out;
    out.chunks = select(commands);
    out.flags = status(match);
    return out;
}

void SlotStore::update(const FeatureMap& commands, const ChunkMap& selected) {
    FeatureMap cmds = commands.withDefault(0.0).squeeze();
    logIgnored(cmds);

    // Slots about to change lose their contents; slots written with +1
    // then receive the selected chunks.
    IndexMap changed = decode(cmds, CommandKind::Write, [](int v) { return v != 0; });
    IndexMap written = decode(cmds, CommandKind::Write, [](int v) { return v == 1; });

    store_ = written
        .outer(selected)
        .merge(store_
            .put(changed.rsub(1.0), First{})
            .squeeze())
        .squeeze();
}

ChunkMap SlotStore::select(const FeatureMap& commands) const {
    FeatureMap cmds = commands.withDefault(0.0).squeeze();
    IndexMap read = decode(cmds, CommandKind::Read, [](int v) { return v == 1; });

    return store_
        .put(read, First{})
        .squeeze()
        .maxBy(Second{});
}

FeatureMap SlotStore::status(const ChunkMap& match) const {
    std::vector<int> all_slots;
    all_slots.reserve(slots_);
    for (int i = 1; i <= slots_; i++) all_slots.push_back(i);

    // +1 for occupied slots, -1 for the rest.
    FeatureMap full = store_
        .abs()
        .sumBy(First{})
        .greater(0.0)
        .mul(2.0)
        .sub(1.0)
        .withKeys(all_slots)
        .withDefault(0.0)
        .transformKeys([this](int i) { return statusFlag("full", i); });

    FeatureMap matched = store_
        .put(match, Second{})
        .camBy(First{})
        .squeeze()
        .transformKeys([this](int i) { return statusFlag("match", i); });

    return full + matched;
}

std::optional<Chunk> SlotStore::chunkAt(int slot) const {
    auto winners = store_
        .keep([slot](const SlotKey& k) { return k.first == slot; })
        .squeeze()
        .argmaxBy(First{});
    auto it = winners.find(slot);
    if (it == winners.end()) return std::nullopt;
    return it->second.second;
}

bool SlotStore::isFull(int slot) const {
    for (const auto& [k, w] : store_) {
        if (k.first == slot && w != 0.0) return true;
    }
    return false;
}

IndexMap SlotStore::decode(const FeatureMap& commands, CommandKind kind,
                           const std::function<bool(int)>& accept) const {
    return commands
        .keep([&](const Feature& f) {
            auto it = decoder_.find(f.dim);
            if (it == decoder_.end() || it->second.kind != kind || !f.value) return false;
            const int* v = std::get_if<int>(&*f.value);
            return v && accept(*v);
        })
        .transformKeys([this](const Feature& f) { return decoder_.at(f.dim).slot; })
        .mask();
}

void SlotStore::logIgnored(const FeatureMap& commands) const {
    if (!Logger::enabled(Logger::Level::Debug)) return;
    for (const auto& [f, w] : commands) {
        if (!decoder_.count(f.dim)) {
            Logger::debug(COMPONENT, "Ignoring unrecognized command '" + toString(f) + "'");
        }
    }
}

Feature SlotStore::statusFlag(const std::string& name, int slot) const {
    return Feature(withPrefix(prefix_, name + "-" + std::to_string(slot)));
}

std::vector<Feature> SlotStore::flags() const {
    std::vector<Feature> out;
    out.reserve(2 * slots_);
    for (const char* name : {"full", "match"}) {
        for (int i = 1; i <= slots_; i++) {
            out.push_back(statusFlag(name, i));
        }
    }
    return out;
}

std::vector<Feature> SlotStore::cmds() const {
    std::vector<Feature> out;
    for (int i = 1; i <= slots_; i++) {
        std::string read = withPrefix(prefix_, "read-" + std::to_string(i));
        std::string write = withPrefix(prefix_, "write-" + std::to_string(i));
        out.emplace_back(read, 0);
        out.emplace_back(read, 1);
        out.emplace_back(write, -1);
        out.emplace_back(write, 0);
        out.emplace_back(write, 1);
    }
    return out;
}

std::vector<Feature> SlotStore::nops() const {
    std::vector<Feature> out;
    for (int i = 1; i <= slots_; i++) {
        out.emplace_back(withPrefix(prefix_, "read-" + std::to_string(i)), 0);
        out.emplace_back(withPrefix(prefix_, "write-" + std::to_string(i)), 0);
    }
    return out;
}

} // namespace workmem
