#include <conduit/net/header_map.h>
#include <algorithm>
#include <cctype>

namespace conduit::net {

bool HeaderMap::name_equals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const Field& f) { return name_equals(f.first, name); });
    if (it == fields_.end()) {
        fields_.emplace_back(name, value);
        return;
    }
    // Replace the first occurrence in place, drop the rest
    it->second = value;
    fields_.erase(std::remove_if(std::next(it), fields_.end(),
                                 [&](const Field& f) { return name_equals(f.first, name); }),
                  fields_.end());
}

void HeaderMap::append(const std::string& name, const std::string& value) {
    fields_.emplace_back(name, value);
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    for (const auto& field : fields_) {
        if (name_equals(field.first, name)) {
            return field.second;
        }
    }
    return std::nullopt;
}

std::vector<std::string> HeaderMap::get_all(const std::string& name) const {
    std::vector<std::string> result;
    for (const auto& field : fields_) {
        if (name_equals(field.first, name)) {
            result.push_back(field.second);
        }
    }
    return result;
}

bool HeaderMap::has(const std::string& name) const {
    return get(name).has_value();
}

void HeaderMap::remove(const std::string& name) {
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                 [&](const Field& f) { return name_equals(f.first, name); }),
                  fields_.end());
}

size_t HeaderMap::size() const {
    return fields_.size();
}

bool HeaderMap::empty() const {
    return fields_.empty();
}

HeaderMap::iterator HeaderMap::begin() const {
    return fields_.begin();
}

HeaderMap::iterator HeaderMap::end() const {
    return fields_.end();
}

} // namespace conduit::net
