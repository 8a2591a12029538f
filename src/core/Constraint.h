#pragma once
#include <string>
#include <vector>
#include <utility>

namespace hostdiag {

using StringList = std::vector<std::string>;

// Heterogeneous input accepted by Constraint::update/set/contains. Mirrors the
// shapes a YAML document can take: null, scalar, sequence, mapping (ordered).
class ConstraintValue {
public:
    enum class Kind { Null, Scalar, Sequence, Mapping };
    using Entry = std::pair<std::string, ConstraintValue>;

    ConstraintValue() = default;
    ConstraintValue(const char* s) : kind_(Kind::Scalar), scalar_(s ? s : "") {}
    ConstraintValue(std::string s) : kind_(Kind::Scalar), scalar_(std::move(s)) {}

    static ConstraintValue sequence(std::vector<ConstraintValue> items);
    static ConstraintValue mapping(std::vector<Entry> entries);

    Kind kind() const { return kind_; }
    bool is_null() const { return kind_ == Kind::Null; }
    bool is_scalar() const { return kind_ == Kind::Scalar; }
    bool is_sequence() const { return kind_ == Kind::Sequence; }
    bool is_mapping() const { return kind_ == Kind::Mapping; }

    const std::string& scalar() const { return scalar_; }
    const std::vector<ConstraintValue>& items() const { return items_; }
    const std::vector<Entry>& entries() const { return entries_; }

    void push_back(ConstraintValue v);
    void add(std::string key, ConstraintValue v);

private:
    Kind kind_ = Kind::Null;
    std::string scalar_;
    std::vector<ConstraintValue> items_;
    std::vector<Entry> entries_;
};

// Folds any non-mapping value into a de-duplicated list of strings:
//   null -> [], "" -> [], "a b" -> [a, b], "a" -> [a], sequence -> flattened elements.
// Throws ConstraintError for a mapping.
StringList to_string_list(const ConstraintValue& v);

// Axis name -> ordered list of distinct string values. Keys keep insertion order.
class Constraint {
public:
    Constraint() = default;
    explicit Constraint(const ConstraintValue& init);

    void set(const std::string& key, const ConstraintValue& value);
    void update(const ConstraintValue& other);
    void update(const Constraint& other);

    Constraint with_keys(const StringList& keys) const;
    Constraint without_keys(const StringList& keys) const;

    bool contains(const ConstraintValue& query) const;

    bool has(const std::string& key) const;
    // Empty list for an absent key.
    const StringList& get(const std::string& key) const;
    // First value of an axis, "" when absent or empty.
    std::string first(const std::string& key) const;
    StringList keys() const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool operator==(const Constraint& o) const { return entries_ == o.entries_; }
    bool operator!=(const Constraint& o) const { return !(*this == o); }

private:
    StringList* find(const std::string& key);
    const StringList* find(const std::string& key) const;
    void merge(const std::string& key, const StringList& values);

    std::vector<std::pair<std::string, StringList>> entries_;
};

}
