#include "../handlers.hpp"
#include "utils.hpp"

namespace comserver {
namespace http {

namespace {

const RequestParser &receive_parser() {
    static const RequestParser parser = [] {
        RequestParser p;
        p.add_argument("num_before", ArgType::INT)
            .default_value(0)
            .min_value(0)
            .help("Which receive data to return");
        add_receive_arguments(p);
        return p;
    }();
    return parser;
}

const RequestParser &receive_all_parser() {
    static const RequestParser parser = [] {
        RequestParser p;
        add_receive_arguments(p);
        return p;
    }();
    return parser;
}

// GET variants: whole string, stripped
connection::ReceiveOptions stripped_options() {
    connection::ReceiveOptions options;
    options.strip = true;
    return options;
}

// {"message": "OK", "timestamps": [...], "data": [...]}, oldest first
nlohmann::json make_records_response(const std::vector<connection::ReceiveRecord> &records) {
    nlohmann::json timestamps = nlohmann::json::array();
    nlohmann::json data = nlohmann::json::array();
    for (const auto &record : records) {
        timestamps.push_back(record.timestamp);
        data.push_back(record.data);
    }

    nlohmann::json response = make_ok_response();
    response["timestamps"] = timestamps;
    response["data"] = data;
    return response;
}

}  // namespace

//=============================================================================
// GET /receive
//=============================================================================
void handle_get_receive(connection::IConnection &conn, const httplib::Request &, httplib::Response &res) {
    send_json(res, StatusCode::OK, make_record_response(conn.receive_str(0, stripped_options())));
}

//=============================================================================
// POST /receive
//=============================================================================
void handle_post_receive(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res) {
    nlohmann::json args;
    if (!parse_or_reject(receive_parser(), req, res, args)) {
        return;
    }

    const auto num_before = args.at("num_before").get<std::size_t>();
    send_json(res, StatusCode::OK, make_record_response(conn.receive_str(num_before, receive_options(args))));
}

//=============================================================================
// GET|POST /receive/all
//=============================================================================
void handle_get_receive_all(connection::IConnection &conn, const httplib::Request &, httplib::Response &res) {
    send_json(res, StatusCode::OK, make_records_response(conn.get_all_rcv_str(stripped_options())));
}

void handle_post_receive_all(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res) {
    nlohmann::json args;
    if (!parse_or_reject(receive_all_parser(), req, res, args)) {
        return;
    }

    send_json(res, StatusCode::OK, make_records_response(conn.get_all_rcv_str(receive_options(args))));
}

}  // namespace http
}  // namespace comserver
