#include "handlers/key_handler.hpp"
#include "handlers/response_util.hpp"
#include "event_logger.hpp"
#include "form_parser.hpp"
#include "html_renderer.hpp"
#include "id_generator.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include <boost/uuid/uuid_io.hpp>

namespace keypub {

http::response<http::string_body> KeyHandler::finish(http::response<http::string_body> res,
                                                     const http::request<http::string_body>& req) {
    res.keep_alive(req.keep_alive());
    add_security_headers(res, config_.enable_tls);
    return res;
}

http::response<http::string_body> KeyHandler::handle_form(const http::request<http::string_body>& req) {
    return finish(html_response(http::status::ok, req.version(), HtmlRenderer::form_page()), req);
}

// Validates the key, then the note, then stores the record under a fresh id
// and redirects the browser to its page.
http::response<http::string_body> KeyHandler::handle_publish(const http::request<http::string_body>& req,
                                                             const std::string& remote_addr) {
    auto& metrics = MetricsRegistry::instance();

    if (!FormParser::is_urlencoded(std::string(req[http::field::content_type]))) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::INVALID_INPUT,
                         remote_addr, "Publish rejected: unsupported content type");
        metrics.increment_counter(metric::validation_failures);
        return finish(text_response(http::status::unsupported_media_type, req.version(),
                                    "Expected request with `Content-Type: application/x-www-form-urlencoded`"), req);
    }

    KeyRecord record;
    try {
        FormData form = FormParser::parse(req.body());
        record.public_key = InputValidator::validate_public_key(form.get("public_key").value_or(""));
        record.note = InputValidator::validate_note(form.get("note"));
    } catch (const FormDecodeError& e) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::INVALID_INPUT,
                         remote_addr, std::string("Publish rejected: ") + e.what());
        metrics.increment_counter(metric::validation_failures);
        return finish(text_response(http::status::bad_request, req.version(),
                                    "Failed to deserialize form body"), req);
    } catch (const ValidationError& e) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::INVALID_INPUT,
                         remote_addr, std::string("Publish rejected: ") + e.what());
        metrics.increment_counter(metric::validation_failures);
        return finish(text_response(http::status::bad_request, req.version(), e.what()), req);
    }

    record.id = IdGenerator::generate_id();

    try {
        key_storage_.create(record);
    } catch (const StoreError& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORE_FAILURE,
                         remote_addr, std::string("Insert failed: ") + e.what());
        metrics.increment_counter(metric::store_errors);
        return finish(text_response(http::status::internal_server_error, req.version(), "database error"), req);
    }

    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::KEY_PUBLISHED,
                     remote_addr, "id=" + record.id);
    metrics.increment_counter(metric::keys_published);

    http::response<http::string_body> res{http::status::see_other, req.version()};
    res.set(http::field::location, "/k/" + record.id);
    res.prepare_payload();
    return finish(std::move(res), req);
}

http::response<http::string_body> KeyHandler::handle_show_record(const http::request<http::string_body>& req,
                                                                 const std::string& raw_id,
                                                                 const std::string& remote_addr) {
    auto& metrics = MetricsRegistry::instance();

    std::string id;
    try {
        id = boost::uuids::to_string(InputValidator::validate_record_id(raw_id));
    } catch (const ValidationError& e) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::INVALID_INPUT,
                         remote_addr, "Lookup rejected: malformed id");
        metrics.increment_counter(metric::validation_failures);
        return finish(text_response(http::status::bad_request, req.version(), e.what()), req);
    }

    std::optional<KeyRecord> record;
    try {
        record = key_storage_.get(id);
    } catch (const StoreError& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORE_FAILURE,
                         remote_addr, std::string("Lookup failed: ") + e.what());
        metrics.increment_counter(metric::store_errors);
        return finish(text_response(http::status::internal_server_error, req.version(), "database error"), req);
    }

    if (!record) {
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::NOT_FOUND,
                         remote_addr, "id=" + id);
        metrics.increment_counter(metric::lookups_not_found);
        return finish(text_response(http::status::not_found, req.version(), "Key not found"), req);
    }

    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::KEY_SERVED,
                     remote_addr, "id=" + id);
    metrics.increment_counter(metric::keys_served);
    const std::string url = HtmlRenderer::share_url(config_.site_host, record->id);
    return finish(html_response(http::status::ok, req.version(), HtmlRenderer::record_page(*record, url)), req);
}

}
