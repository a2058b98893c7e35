#include <devscore/config/config_helpers.h>
#include <devscore/config/state_category.h>

#include <spdlog/spdlog.h>

#include <array>
#include <utility>

namespace devscore::config {

namespace {

using LabelList = std::pair<StateCategory, const std::vector<std::string>*>;

std::array<LabelList, 5> labelLists(const StateCategoryConfig& config) {
    return {LabelList{StateCategory::Assigned, &config.assignedStates},
            LabelList{StateCategory::Productive, &config.productiveStates},
            LabelList{StateCategory::Paused, &config.pausedStates},
            LabelList{StateCategory::Completion, &config.completionStates},
            LabelList{StateCategory::Ignored, &config.ignoredStates}};
}

} // namespace

std::optional<StateCategory> stateCategoryFromString(std::string_view name) {
    const std::string n = normalize_label(name);
    if (n == "assigned")
        return StateCategory::Assigned;
    if (n == "productive")
        return StateCategory::Productive;
    if (n == "paused")
        return StateCategory::Paused;
    if (n == "completion")
        return StateCategory::Completion;
    if (n == "ignored")
        return StateCategory::Ignored;
    return std::nullopt;
}

Result<void> StateCategoryConfig::validate() const {
    std::unordered_map<std::string, StateCategory> seen;
    for (const auto& [category, labels] : labelLists(*this)) {
        for (const auto& raw : *labels) {
            const std::string label = normalize_label(raw);
            if (label.empty()) {
                return Error{ErrorCode::InvalidConfiguration,
                             std::string("Empty state label in ") +
                                 stateCategoryToString(category) + " states"};
            }
            auto [it, inserted] = seen.emplace(label, category);
            if (!inserted && it->second != category) {
                return Error{ErrorCode::InvalidConfiguration,
                             "State '" + raw + "' is mapped to both " +
                                 stateCategoryToString(it->second) + " and " +
                                 stateCategoryToString(category)};
            }
        }
    }
    return {};
}

Result<StateCategoryMap> StateCategoryMap::build(const StateCategoryConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }

    StateCategoryMap map;
    map.fallback_ = config.unmappedCategory;
    for (const auto& [category, labels] : labelLists(config)) {
        for (const auto& raw : *labels) {
            map.table_.emplace(normalize_label(raw), category);
        }
    }

    spdlog::debug("StateCategoryMap built: {} labels, fallback={}", map.table_.size(),
                  map.fallback_ ? stateCategoryToString(*map.fallback_) : "none");
    return map;
}

std::optional<StateCategory> StateCategoryMap::resolve(std::string_view label) const {
    auto it = table_.find(normalize_label(label));
    if (it != table_.end())
        return it->second;
    return fallback_;
}

bool StateCategoryMap::contains(std::string_view label) const {
    return table_.find(normalize_label(label)) != table_.end();
}

} // namespace devscore::config
