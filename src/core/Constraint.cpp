#include "Constraint.h"
#include "Errors.h"
#include "Utils.h"
#include <algorithm>

namespace hostdiag {

ConstraintValue ConstraintValue::sequence(std::vector<ConstraintValue> items) {
    ConstraintValue v; v.kind_ = Kind::Sequence; v.items_ = std::move(items);
    return v;
}

ConstraintValue ConstraintValue::mapping(std::vector<Entry> entries) {
    ConstraintValue v; v.kind_ = Kind::Mapping; v.entries_ = std::move(entries);
    return v;
}

void ConstraintValue::push_back(ConstraintValue v) {
    if(kind_ == Kind::Null) kind_ = Kind::Sequence;
    if(kind_ != Kind::Sequence) throw ConstraintError("push_back on a non-sequence value");
    items_.push_back(std::move(v));
}

void ConstraintValue::add(std::string key, ConstraintValue v) {
    if(kind_ == Kind::Null) kind_ = Kind::Mapping;
    if(kind_ != Kind::Mapping) throw ConstraintError("add on a non-mapping value");
    entries_.emplace_back(std::move(key), std::move(v));
}

static void append_unique(StringList& out, const std::string& s) {
    if(std::find(out.begin(), out.end(), s) == out.end()) out.push_back(s);
}

static void flatten_into(const ConstraintValue& v, StringList& out) {
    switch(v.kind()) {
        case ConstraintValue::Kind::Null: break;
        case ConstraintValue::Kind::Scalar: append_unique(out, v.scalar()); break;
        case ConstraintValue::Kind::Sequence:
            for(const auto& item : v.items()) flatten_into(item, out);
            break;
        case ConstraintValue::Kind::Mapping:
            // a mapping inside a list contributes its values
            for(const auto& entry : v.entries()) flatten_into(entry.second, out);
            break;
    }
}

StringList to_string_list(const ConstraintValue& v) {
    StringList out;
    if(v.is_scalar()) {
        const std::string& s = v.scalar();
        if(s.empty()) return out;
        if(s.find(' ') != std::string::npos) {
            for(const auto& tok : utils::split_ws(s)) append_unique(out, tok);
        } else {
            out.push_back(s);
        }
        return out;
    }
    if(v.is_mapping()) throw ConstraintError("mapping value cannot be folded into a list");
    flatten_into(v, out);
    return out;
}

Constraint::Constraint(const ConstraintValue& init) {
    if(init.is_mapping()) update(init);
}

StringList* Constraint::find(const std::string& key) {
    for(auto& e : entries_) if(e.first == key) return &e.second;
    return nullptr;
}

const StringList* Constraint::find(const std::string& key) const {
    for(const auto& e : entries_) if(e.first == key) return &e.second;
    return nullptr;
}

void Constraint::merge(const std::string& key, const StringList& values) {
    if(StringList* existing = find(key)) {
        for(const auto& v : values) append_unique(*existing, v);
        return;
    }
    StringList copy;
    for(const auto& v : values) append_unique(copy, v);
    entries_.emplace_back(key, std::move(copy));
}

void Constraint::set(const std::string& key, const ConstraintValue& value) {
    StringList values = to_string_list(value);
    if(StringList* existing = find(key)) { *existing = std::move(values); return; }
    entries_.emplace_back(key, std::move(values));
}

void Constraint::update(const ConstraintValue& other) {
    if(other.is_null()) return;
    if(!other.is_mapping()) throw ConstraintError("Constraint update requires a mapping");
    for(const auto& [key, value] : other.entries()) {
        // nested mapping keys are merged at the root
        if(value.is_mapping()) { update(value); continue; }
        merge(key, to_string_list(value));
    }
}

void Constraint::update(const Constraint& other) {
    for(const auto& [key, values] : other.entries_) merge(key, values);
}

Constraint Constraint::with_keys(const StringList& keys) const {
    Constraint out;
    for(const auto& e : entries_)
        if(std::find(keys.begin(), keys.end(), e.first) != keys.end()) out.entries_.push_back(e);
    return out;
}

Constraint Constraint::without_keys(const StringList& keys) const {
    Constraint out;
    for(const auto& e : entries_)
        if(std::find(keys.begin(), keys.end(), e.first) == keys.end()) out.entries_.push_back(e);
    return out;
}

// false if any element is false, otherwise true only for a non-empty list
static bool all_of_nonempty(const std::vector<bool>& results) {
    if(results.empty()) return false;
    return std::find(results.begin(), results.end(), false) == results.end();
}

bool Constraint::contains(const ConstraintValue& query) const {
    switch(query.kind()) {
        case ConstraintValue::Kind::Null:
            return false;
        case ConstraintValue::Kind::Scalar:
            return has(query.scalar());
        case ConstraintValue::Kind::Sequence: {
            std::vector<bool> results;
            for(const auto& item : query.items()) results.push_back(contains(item));
            return all_of_nonempty(results);
        }
        case ConstraintValue::Kind::Mapping: {
            bool result = false;
            for(const auto& [key, value] : query.entries()) {
                if(value.is_sequence()) {
                    std::vector<bool> results;
                    for(const auto& item : value.items())
                        results.push_back(contains(ConstraintValue::mapping({{key, item}})));
                    result = all_of_nonempty(results);
                } else if(const StringList* values = find(key)) {
                    result = value.is_scalar()
                        && std::find(values->begin(), values->end(), value.scalar()) != values->end();
                } else {
                    result = false;
                }
            }
            return result;
        }
    }
    return false;
}

bool Constraint::has(const std::string& key) const { return find(key) != nullptr; }

const StringList& Constraint::get(const std::string& key) const {
    static const StringList empty;
    const StringList* v = find(key);
    return v ? *v : empty;
}

std::string Constraint::first(const std::string& key) const {
    const StringList* v = find(key);
    if(!v || v->empty()) return "";
    return v->front();
}

StringList Constraint::keys() const {
    StringList out;
    for(const auto& e : entries_) out.push_back(e.first);
    return out;
}

}
