#pragma once

#include <string>
#include <string_view>
#include "key_storage.hpp"

namespace keypub {

// Builds the HTML pages. Every interpolated value passes through escape().
class HtmlRenderer {
public:
    // Escapes & < > " ' for use in element content and quoted attributes.
    static std::string escape(std::string_view text);

    // Submission form served at "/".
    static const std::string& form_page();

    // Page for a published key, including the absolute shareable link.
    static std::string record_page(const KeyRecord& record, const std::string& share_url);

    static std::string share_url(const std::string& site_host, const std::string& id) {
        return "https://" + site_host + "/k/" + id;
    }
};

}
