#include <reqmatch/http/header_map.h>

namespace reqmatch::http {

void HeaderMap::set(const std::string& name, const std::string& value) {
    headers_[name] = value;
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    auto it = headers_.find(name);
    if (it != headers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool HeaderMap::has(const std::string& name) const {
    return headers_.find(name) != headers_.end();
}

void HeaderMap::remove(const std::string& name) {
    headers_.erase(name);
}

size_t HeaderMap::size() const {
    return headers_.size();
}

bool HeaderMap::empty() const {
    return headers_.empty();
}

HeaderMap::iterator HeaderMap::begin() const {
    return headers_.begin();
}

HeaderMap::iterator HeaderMap::end() const {
    return headers_.end();
}

HeaderMap::iterator HeaderMap::find(const std::string& name) const {
    return headers_.find(name);
}

bool HeaderMap::operator==(const HeaderMap& other) const {
    return headers_ == other.headers_;
}

bool HeaderMap::operator!=(const HeaderMap& other) const {
    return !(*this == other);
}

} // namespace reqmatch::http
