#pragma once

#include <chrono>
#include <map>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/optional.hpp>

#include "batch_driver.hpp"

#ifndef HTTP_READ_HEADER_BUFFER
#define HTTP_READ_HEADER_BUFFER 8192
#endif

#ifndef HTTP_READ_BODY_BUFFER
#define HTTP_READ_BODY_BUFFER 64*1024
#endif

#ifndef HTTP_REQUEST_TIMEOUT_SECONDS
#define HTTP_REQUEST_TIMEOUT_SECONDS 60
#endif

struct Http_Reply {
    boost::beast::http::status status = boost::beast::http::status::ok;
    std::string content_type = "application/json";
    std::string body;
};

bool url_decode(const std::string& in, std::string& out);

// key=value pairs of a query string, values still url encoded
std::map<std::string, std::string> parse_query(const std::string& query);

/* GET /outline?path=<pdf>
 * GET /section?path=<pdf>&text=<heading>[&page=<n>]
 */
Http_Reply route_request(boost::beast::http::verb method, const std::string& target, const Batch_Options& options);

class http_worker {
  public:
    // disable copy constructor and copy assignment (non-copyable)
    http_worker(http_worker const&) = delete;
    http_worker& operator=(http_worker const&) = delete;

    http_worker(boost::asio::ip::tcp::acceptor& acceptor, const Batch_Options& options);

    void start();

  private:
    using request_body_t = boost::beast::http::basic_dynamic_body<boost::beast::flat_static_buffer<HTTP_READ_BODY_BUFFER>>;

    // The acceptor used to listen for incoming connections.
    boost::asio::ip::tcp::acceptor& acceptor_;

    const Batch_Options& options_;

    // The socket for the currently connected client.
    boost::asio::ip::tcp::socket socket_{acceptor_.get_executor()};

    // The buffer for performing reads
    boost::beast::flat_static_buffer<HTTP_READ_HEADER_BUFFER> buffer_;

    // The parser for reading the requests
    boost::optional<boost::beast::http::request_parser<request_body_t>> parser_;

    // The timer putting a time limit on requests.
    boost::asio::steady_timer request_deadline_{acceptor_.get_executor(), (std::chrono::steady_clock::time_point::max)()};

    // The string-based response message.
    boost::optional<boost::beast::http::response<boost::beast::http::string_body>> string_response_;

    // The string-based response serializer.
    boost::optional<boost::beast::http::response_serializer<boost::beast::http::string_body>> string_serializer_;

    void accept();

    void read_request();

    void process_request(boost::beast::http::request<request_body_t> const& req);

    void send_response(const Http_Reply& reply);

    void check_deadline();
};
