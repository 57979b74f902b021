// change.cpp - Change entry record form and sizing

#include <tree_diff/change.h>
#include <tree_diff/serialization.h>

#include <iostream>

namespace tree_diff {

char ChangeEntry::opcode() const noexcept
{
    switch (op) {
        case Op::Add:    return '+';
        case Op::Remove: return '-';
        case Op::Modify: return '~';
    }
    return '?';
}

ChangeEntry ChangeEntry::inverted() const
{
    switch (op) {
        case Op::Add:    return remove(path, new_value);
        case Op::Remove: return add(path, old_value);
        case Op::Modify: return modify(path, new_value, old_value);
    }
    return *this;
}

Value to_value(const DiffPath& path)
{
    if (auto* text = std::get_if<std::string>(&path)) {
        return Value{*text};
    }
    auto t = ValueVector{}.transient();
    for (const auto& elem : std::get<PathTokens>(path)) {
        if (auto* key = std::get_if<std::string>(&elem)) {
            t.push_back(ValueBox{Value{*key}});
        } else {
            t.push_back(ValueBox{Value{static_cast<int64_t>(std::get<std::size_t>(elem))}});
        }
    }
    return Value{t.persistent()};
}

Value to_value(const ChangeEntry& entry)
{
    auto t = ValueVector{}.transient();
    t.push_back(ValueBox{Value{std::string(1, entry.opcode())}});
    t.push_back(ValueBox{to_value(entry.path)});
    if (entry.op == ChangeEntry::Op::Modify) {
        t.push_back(ValueBox{entry.old_value});
        t.push_back(ValueBox{entry.new_value});
    } else {
        t.push_back(ValueBox{entry.value()});
    }
    return Value{t.persistent()};
}

Value to_value(const ChangeList& changes)
{
    auto t = ValueVector{}.transient();
    for (const auto& entry : changes) {
        t.push_back(ValueBox{to_value(entry)});
    }
    return Value{t.persistent()};
}

std::string to_json(const ChangeList& changes, bool compact)
{
    return to_json(to_value(changes), compact);
}

std::string change_to_string(const ChangeEntry& entry)
{
    std::string result(1, entry.opcode());
    result += ' ';
    result += is_root(entry.path) ? "(root)" : path_to_string(entry.path);
    result += ": ";
    if (entry.op == ChangeEntry::Op::Modify) {
        result += value_to_string(entry.old_value) + " -> " + value_to_string(entry.new_value);
    } else {
        result += value_to_string(entry.value());
    }
    return result;
}

void print_changes(const ChangeList& changes)
{
    if (changes.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& entry : changes) {
        std::cout << "  " << change_to_string(entry) << "\n";
    }
}

std::size_t count_nodes(const Value& val)
{
    if (auto* m = val.get_if<ValueMap>()) {
        std::size_t count = 0;
        for (const auto& [k, v] : *m) {
            count += count_nodes(*v);
        }
        return count;
    }
    if (auto* vec = val.get_if<ValueVector>()) {
        std::size_t count = 0;
        for (const auto& v : *vec) {
            count += count_nodes(*v);
        }
        return count;
    }
    return val.is_null() ? 0 : 1;
}

std::size_t weighted_change_count(const ChangeList& changes)
{
    std::size_t total = 0;
    for (const auto& entry : changes) {
        total += entry.op == ChangeEntry::Op::Modify ? 2 : count_nodes(entry.value());
    }
    return total;
}

} // namespace tree_diff
