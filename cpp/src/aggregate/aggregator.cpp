// ==============================================================================
// aggregator.cpp - Дедупликация и сортировка правил группы
// ==============================================================================

#include <ruleforge/aggregator.hpp>

#include <utility>

namespace ruleforge::aggregate {

bool Aggregator::add(rule::RuleEntry entry) {
    bool inserted = entries_.insert(std::move(entry)).second;
    if (!inserted) {
        ++duplicates_;
    }
    return inserted;
}

rule::RuleGroup Aggregator::finish(std::string name) {
    rule::RuleGroup group;
    group.name = std::move(name);
    group.entries.reserve(entries_.size());

    // std::set уже упорядочен по RuleEntry::operator<
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto node = entries_.extract(it++);
        group.entries.push_back(std::move(node.value()));
    }

    entries_.clear();
    duplicates_ = 0;
    return group;
}

}  // namespace ruleforge::aggregate
