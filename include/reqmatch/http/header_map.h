#pragma once
#include <map>
#include <optional>
#include <string>

namespace reqmatch::http {

// Single-valued header storage. Names and values are matched exactly:
// "Content-Type" and "content-type" are different headers.
class HeaderMap {
public:
    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    size_t size() const;
    bool empty() const;

    // Iteration in ascending name order
    using iterator = std::map<std::string, std::string>::const_iterator;
    iterator begin() const;
    iterator end() const;
    iterator find(const std::string& name) const;

    bool operator==(const HeaderMap& other) const;
    bool operator!=(const HeaderMap& other) const;

private:
    std::map<std::string, std::string> headers_;
};

} // namespace reqmatch::http
