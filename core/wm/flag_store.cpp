#include "wm/flag_store.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <set>

namespace workmem {

namespace {

constexpr const char* COMPONENT = "FlagStore";

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

FlagStore::FlagStore(FlagStoreConfig config)
    : FlagStore(std::move(config.flags), std::move(config.values), std::move(config.prefix)) {}

FlagStore::FlagStore(std::vector<std::string> flags, std::vector<int> values, std::string prefix)
    : flag_names_(std::move(flags)), values_(std::move(values)), prefix_(std::move(prefix)) {
    if (!prefix_.empty() && !isPath(prefix_)) {
        logAndThrow<ConfigurationError>(COMPONENT, "Prefix '" + prefix_ + "' is not a valid path");
    }

    std::set<std::string> seen;
    for (const auto& f : flag_names_) {
        if (!isPath(f)) {
            logAndThrow<ConfigurationError>(COMPONENT, "Flag name '" + f + "' is not a valid path");
        }
        if (startsWith(f, SET_PREFIX)) {
            logAndThrow<ConfigurationError>(
                COMPONENT, "Flag name '" + f + "' starts with reserved prefix '" + SET_PREFIX + "'");
        }
        if (!seen.insert(f).second) {
            logAndThrow<ConfigurationError>(COMPONENT, "Duplicate flag name '" + f + "'");
        }
    }

    for (int v : values_) {
        if (v < -1 || v > 1) {
            logAndThrow<ConfigurationError>(
                COMPONENT, "Flag value " + std::to_string(v) + " is outside {-1, 0, 1}");
        }
    }
    std::sort(values_.begin(), values_.end());
    values_.erase(std::unique(values_.begin(), values_.end()), values_.end());

    for (const auto& f : flag_names_) {
        decoder_.emplace(commandDim(f), Feature(withPrefix(prefix_, f)));
    }

    Logger::info(COMPONENT, "Created with " + std::to_string(flag_names_.size()) +
                            " flags" + (prefix_.empty() ? "" : " under '" + prefix_ + "'"));
}

FeatureMap FlagStore::step(const FeatureMap& commands) {
    update(commands);
    return store_;
}

void FlagStore::update(const FeatureMap& commands) {
    // Zero-weight entries are commands that were not issued.
    FeatureMap cmds = commands.withDefault(0.0).squeeze();
    validate(cmds);

    auto to_flag = [this](const Feature& f) { return commandToFlag(f); };

    FeatureMap resets = cmds
        .keep([](const Feature& f) { return f.isWildcard(); })
        .transformKeys(to_flag)
        .mask();
    FeatureMap positive = cmds
        .keep([](const Feature& f) { return f.hasInt(1); })
        .transformKeys(to_flag)
        .mask();
    FeatureMap negative = cmds
        .keep([](const Feature& f) { return f.hasInt(-1); })
        .transformKeys(to_flag)
        .mask()
        .mul(-1.0);

    store_ = store_
        .mul(resets.rsub(1.0))
        .squeeze()
        .merge(positive)
        .merge(negative);

    if (Logger::enabled(Logger::Level::Debug)) {
        Logger::debug(COMPONENT, "step: " + std::to_string(resets.size()) + " reset, " +
                                 std::to_string(positive.size()) + " raised, " +
                                 std::to_string(negative.size()) + " lowered");
    }
}

void FlagStore::validate(const FeatureMap& commands) const {
    for (const auto& [f, w] : commands) {
        if (!decoder_.count(f.dim)) {
            logAndThrow<CommandError>(COMPONENT, "Unknown flag command '" + toString(f) + "'");
        }
        if (f.isWildcard()) continue;
        const int* v = std::get_if<int>(&*f.value);
        // 0 is always accepted as a no-op
        if (!v || (*v != 0 && std::find(values_.begin(), values_.end(), *v) == values_.end())) {
            logAndThrow<CommandError>(COMPONENT, "Unsupported value in flag command '" + toString(f) + "'");
        }
    }
}

std::optional<Feature> FlagStore::commandToFlag(const Feature& command) const {
    auto it = decoder_.find(command.dim);
    if (it == decoder_.end()) return std::nullopt;
    return it->second;
}

std::string FlagStore::commandDim(const std::string& flag) const {
    return withPrefix(prefix_, std::string(SET_PREFIX) + "-" + flag);
}

int FlagStore::get(const std::string& flag) const {
    if (std::find(flag_names_.begin(), flag_names_.end(), flag) == flag_names_.end()) {
        throw CommandError("Unknown flag '" + flag + "'");
    }
    double w = store_.get(Feature(withPrefix(prefix_, flag)));
    return (w > 0.0) - (w < 0.0);
}

std::vector<Feature> FlagStore::flags() const {
    std::vector<Feature> out;
    out.reserve(flag_names_.size());
    for (const auto& f : flag_names_) {
        out.emplace_back(withPrefix(prefix_, f));
    }
    return out;
}

std::vector<Feature> FlagStore::cmds() const {
    std::vector<Feature> out;
    for (const auto& f : flag_names_) {
        std::string dim = commandDim(f);
        out.emplace_back(dim);
        for (int v : values_) {
            out.emplace_back(dim, v);
        }
    }
    return out;
}

std::vector<Feature> FlagStore::nops() const {
    std::vector<Feature> out;
    out.reserve(flag_names_.size());
    for (const auto& f : flag_names_) {
        out.emplace_back(commandDim(f), 0);
    }
    return out;
}

} // namespace workmem
