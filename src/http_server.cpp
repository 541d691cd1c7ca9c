#include "http_server.hpp"
#include "language_detector.hpp"
#include "logging.hpp"
#include "outline_extractor.hpp"
#include "pdf_utils.hpp"
#include "section_extractor.hpp"
#include "tesseract_ocr.hpp"

#include <algorithm>
#include <memory>
#include <regex>
#include <sstream>

#include <nlohmann/json.hpp>

namespace {

Http_Reply error_reply(boost::beast::http::status status, const std::string& message) {
    Http_Reply reply;
    reply.status = status;
    reply.body = nlohmann::json{{"error", message}}.dump();
    return reply;
}

std::optional<std::string> query_value(const std::map<std::string, std::string>& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) {
        return std::nullopt;
    }
    std::string value;
    if (!url_decode(it->second, value)) {
        return std::nullopt;
    }
    return value;
}

Http_Reply outline_reply(const std::string& path, const Batch_Options& options) {
    std::unique_ptr<Tesseract_Ocr_Engine> ocr_engine;
    if (options.enable_ocr) {
        ocr_engine = std::make_unique<Tesseract_Ocr_Engine>(options.tessdata_path);
    }
    Stopword_Language_Detector language_detector;

    std::optional<Document_Outline> outline = extract_outline(path, ocr_engine.get(), &language_detector, options.config);
    if (!outline) {
        return error_reply(boost::beast::http::status::unprocessable_entity, "cannot open document " + path);
    }

    Http_Reply reply;
    reply.body = format_document_outline(*outline, -1);
    return reply;
}

Http_Reply section_reply(const std::string& path, const std::string& text,
                         const std::optional<std::string>& page, const Batch_Options& options) {
    unsigned int page_number = 0;
    if (page) {
        try {
            page_number = static_cast<unsigned int>(std::stoul(*page));
        } catch (const std::exception&) {
            return error_reply(boost::beast::http::status::bad_request, "invalid page '" + *page + "'");
        }
    }

    std::unique_ptr<Mupdf_Document> document = open_pdf_document(path);
    if (!document) {
        return error_reply(boost::beast::http::status::unprocessable_entity, "cannot open document " + path);
    }

    std::unique_ptr<Tesseract_Ocr_Engine> ocr_engine;
    if (options.enable_ocr) {
        ocr_engine = std::make_unique<Tesseract_Ocr_Engine>(options.tessdata_path);
    }
    Stopword_Language_Detector language_detector;
    Document_Outline outline = extract_outline(*document, ocr_engine.get(), &language_detector, options.config);

    auto it = std::find_if(outline.outline.begin(), outline.outline.end(),
                           [&text, page_number](const Outline_Item& item) {
                               return item.text == text && (page_number == 0 || item.page == page_number);
                           });

    Outline_Item heading;
    if (it != outline.outline.end()) {
        heading = *it;
    } else {
        // not a detected heading, the extractor falls back to page excerpts
        heading.text = text;
        heading.page = page_number == 0 ? 1 : page_number;
    }

    Http_Reply reply;
    reply.body = nlohmann::json{{"text", extract_section_content(*document, heading, outline.outline)}}
                     .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return reply;
}

}

bool url_decode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%') {
            if (i + 3 <= in.size()) {
                int value = 0;
                std::istringstream is(in.substr(i + 1, 2));
                if (is >> std::hex >> value) {
                    out += static_cast<char>(value);
                    i += 2;
                } else {
                    return false;
                }
            } else {
                return false;
            }
        } else if (in[i] == '+') {
            out += ' ';
        } else {
            out += in[i];
        }
    }
    return true;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> data;
    std::regex pattern("([\\w+%]+)=([^&]*)");
    auto words_begin = std::sregex_iterator(query.begin(), query.end(), pattern);
    auto words_end = std::sregex_iterator();

    for (std::sregex_iterator i = words_begin; i != words_end; i++) {
        data[(*i)[1].str()] = (*i)[2].str();
    }

    return data;
}

Http_Reply route_request(boost::beast::http::verb method, const std::string& target, const Batch_Options& options) {
    if (method != boost::beast::http::verb::get) {
        return error_reply(boost::beast::http::status::bad_request, "invalid request method");
    }

    const size_t query_start = target.find('?');
    const std::string resource = target.substr(0, query_start);
    const std::map<std::string, std::string> params =
        parse_query(query_start == std::string::npos ? std::string() : target.substr(query_start + 1));

    if (resource != "/outline" && resource != "/section") {
        return error_reply(boost::beast::http::status::not_found, "unknown target " + resource);
    }

    std::optional<std::string> path = query_value(params, "path");
    if (!path || path->empty()) {
        return error_reply(boost::beast::http::status::bad_request, "missing path parameter");
    }

    if (resource == "/outline") {
        return outline_reply(*path, options);
    }

    std::optional<std::string> text = query_value(params, "text");
    if (!text || text->empty()) {
        return error_reply(boost::beast::http::status::bad_request, "missing text parameter");
    }
    return section_reply(*path, *text, query_value(params, "page"), options);
}

http_worker::http_worker(boost::asio::ip::tcp::acceptor& acceptor, const Batch_Options& options) :
    acceptor_(acceptor),
    options_(options) {
}

void http_worker::start() {
    accept();
    check_deadline();
}

void http_worker::accept() {
    // Clean up any previous connection.
    boost::beast::error_code ec;
    socket_.close(ec);
    buffer_.consume(buffer_.size());

    acceptor_.async_accept(
        socket_,
    [this](boost::beast::error_code ec) {
        if (ec) {
            LOG_CHANNEL_ERROR("http") << "Error code: " << ec.value() << " " << ec.message();
            accept();
        } else {
            // Request must be fully processed within the deadline.
            request_deadline_.expires_after(std::chrono::seconds(HTTP_REQUEST_TIMEOUT_SECONDS));

            read_request();
        }
    });
}

void http_worker::read_request() {
    // On each read the parser needs to be destroyed and
    // recreated. We store it in a boost::optional to
    // achieve that.
    parser_.emplace();

    boost::beast::http::async_read(socket_,
                                   buffer_,
                                   *parser_,
    [this](boost::beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_CHANNEL_ERROR("http") << "Error code: " << ec.value() << " " << ec.message();
            accept();
        } else {
            process_request(parser_->get());
        }
    });
}

void http_worker::process_request(boost::beast::http::request<request_body_t> const& req) {
    const std::string target(req.target().data(), req.target().size());

    boost::beast::error_code ec;
    const auto remote = socket_.remote_endpoint(ec);
    if (!ec) {
        LOG_CHANNEL_INFO("http") << "Processing request from " << remote.address() << ":" << remote.port() << " " << target;
    }

    Http_Reply reply;
    try {
        reply = route_request(req.method(), target, options_);
    } catch (const std::exception& e) {
        LOG_CHANNEL_ERROR("http") << target << ": " << e.what();
        reply = error_reply(boost::beast::http::status::internal_server_error, e.what());
    }
    send_response(reply);
}

void http_worker::send_response(const Http_Reply& reply) {
    string_response_.emplace();
    string_response_->result(reply.status);
    string_response_->keep_alive(false);
    string_response_->set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
    string_response_->set(boost::beast::http::field::content_type, reply.content_type);
    string_response_->body() = reply.body;
    string_response_->prepare_payload();

    string_serializer_.emplace(*string_response_);

    boost::beast::http::async_write(
        socket_,
        *string_serializer_,
    [this](boost::beast::error_code ec, std::size_t) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        string_serializer_.reset();
        string_response_.reset();
        accept();
    });
}

void http_worker::check_deadline() {
    // The deadline may have moved, so check it has really passed.
    if (request_deadline_.expiry() <= std::chrono::steady_clock::now()) {
        // Close socket to cancel any outstanding operation.
        boost::beast::error_code ec;
        socket_.close(ec);

        // Sleep indefinitely until we're given a new deadline.
        request_deadline_.expires_at(
            std::chrono::steady_clock::time_point::max());
    }

    request_deadline_.async_wait(
    [this](boost::beast::error_code) {
        check_deadline();
    });
}
