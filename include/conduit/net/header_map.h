#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace conduit::net {

// Header fields in arrival order. Names keep their original spelling for
// the wire; lookups ignore case.
class HeaderMap {
public:
    using Field = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void append(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    size_t size() const;
    bool empty() const;
    void clear() { fields_.clear(); }

    // Iteration
    using iterator = std::vector<Field>::const_iterator;
    iterator begin() const;
    iterator end() const;

    static bool name_equals(const std::string& a, const std::string& b);

private:
    std::vector<Field> fields_;
};

} // namespace conduit::net
