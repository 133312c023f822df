// ==============================================================================
// ruleforge/aggregator.hpp - Дедупликация и сортировка правил группы
// ==============================================================================
//
// Aggregator собирает RuleEntry всех источников группы:
// - дубликаты по (kind, value) отбрасываются, первое вхождение побеждает
// - finish() возвращает RuleGroup в каноническом порядке: тип, затем value
//
// Результат не зависит от порядка источников и строк.
//
// ==============================================================================

#ifndef RULEFORGE_AGGREGATOR_HPP
#define RULEFORGE_AGGREGATOR_HPP

#include <ruleforge/rule.hpp>

#include <cstddef>
#include <set>
#include <string>

namespace ruleforge::aggregate {

class Aggregator {
public:
    /// Добавить правило
    /// @return true если правило новое, false если дубликат
    bool add(rule::RuleEntry entry);

    /// Количество уникальных правил
    std::size_t size() const { return entries_.size(); }

    /// Количество отброшенных дубликатов
    std::size_t duplicates() const { return duplicates_; }

    /// Сформировать группу; Aggregator после вызова пуст
    rule::RuleGroup finish(std::string name);

private:
    std::set<rule::RuleEntry> entries_;
    std::size_t duplicates_ = 0;
};

}  // namespace ruleforge::aggregate

#endif  // RULEFORGE_AGGREGATOR_HPP
