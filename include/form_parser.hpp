#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace keypub {

// Malformed application/x-www-form-urlencoded payload.
class FormDecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Decoded form fields. When a name repeats, the first occurrence wins.
class FormData {
public:
    std::optional<std::string> get(const std::string& name) const {
        auto it = fields_.find(name);
        if (it == fields_.end()) return std::nullopt;
        return it->second;
    }

    size_t size() const { return fields_.size(); }

    void add(std::string name, std::string value) {
        fields_.emplace(std::move(name), std::move(value));
    }

private:
    std::unordered_map<std::string, std::string> fields_;
};

class FormParser {
public:
    /**
     * Parses an urlencoded body ("a=1&b=two+words").
     * @throws FormDecodeError on a bad percent escape or non-UTF-8 content.
     */
    static FormData parse(std::string_view body);

    // Percent-decodes one component; '+' becomes a space.
    static std::string url_decode(std::string_view in);

    // Compares the media type of a Content-Type header, ignoring parameters and case.
    static bool is_urlencoded(std::string_view content_type);
};

}
