#include "form_parser.hpp"
#include "input_validator.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace keypub {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

std::string FormParser::url_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%') {
            if (i + 2 >= in.size()) {
                throw FormDecodeError("truncated percent escape");
            }
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) {
                throw FormDecodeError("invalid percent escape");
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

FormData FormParser::parse(std::string_view body) {
    FormData form;
    size_t pos = 0;
    while (pos <= body.size()) {
        size_t amp = body.find('&', pos);
        if (amp == std::string_view::npos) amp = body.size();
        std::string_view pair = body.substr(pos, amp - pos);
        pos = amp + 1;

        if (pair.empty()) continue;

        size_t eq = pair.find('=');
        std::string name = url_decode(pair.substr(0, eq));
        std::string value = (eq == std::string_view::npos) ? std::string() : url_decode(pair.substr(eq + 1));

        if (!InputValidator::is_valid_utf8(name) || !InputValidator::is_valid_utf8(value)) {
            throw FormDecodeError("form data is not valid UTF-8");
        }
        form.add(std::move(name), std::move(value));
    }
    return form;
}

bool FormParser::is_urlencoded(std::string_view content_type) {
    std::string media(content_type.substr(0, content_type.find(';')));
    boost::algorithm::trim(media);
    return boost::algorithm::iequals(media, "application/x-www-form-urlencoded");
}

}
