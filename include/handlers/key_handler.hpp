#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include "server_config.hpp"
#include "key_storage.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace keypub {

// The three public routes: the submission form, publishing, and the
// per-key page. Each call is independent; the only shared state is the store.
class KeyHandler {
public:
    KeyHandler(const ServerConfig& config, KeyStorage& key_storage)
        : config_(config)
        , key_storage_(key_storage) {}

    // GET /
    http::response<http::string_body> handle_form(const http::request<http::string_body>& req);

    // POST /publish
    http::response<http::string_body> handle_publish(const http::request<http::string_body>& req,
                                                     const std::string& remote_addr);

    // GET /k/{id}
    http::response<http::string_body> handle_show_record(const http::request<http::string_body>& req,
                                                         const std::string& raw_id,
                                                         const std::string& remote_addr);

private:
    const ServerConfig& config_;
    KeyStorage& key_storage_;

    http::response<http::string_body> finish(http::response<http::string_body> res,
                                             const http::request<http::string_body>& req);
};

}
