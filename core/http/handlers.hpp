#pragma once

/**
 * @brief REST builtin resource handlers
 *
 * Each handler validates its arguments, makes exactly one call on the
 * connection and shapes the result. Handlers hold no state; the server
 * passes the shared connection in on every request.
 *
 * Endpoints:
 * - POST /send                 -> handle_post_send            (send)
 * - GET  /receive              -> handle_get_receive          (receive_str)
 * - POST /receive              -> handle_post_receive         (receive_str)
 * - GET  /receive/all          -> handle_get_receive_all      (get_all_rcv_str)
 * - POST /receive/all          -> handle_post_receive_all     (get_all_rcv_str)
 * - GET  /get                  -> handle_get_get              (get)
 * - POST /get                  -> handle_post_get             (get)
 * - POST /send/get_first       -> handle_post_send_get_first  (get_first_response)
 * - POST /get/wait             -> handle_post_get_wait        (wait_for_response)
 * - POST /send/get             -> handle_post_send_get        (send_for_response)
 */

#include <httplib.h>

#include "connection/i_connection.hpp"

namespace comserver {
namespace http {

// handlers/send_handlers.cpp
void handle_post_send(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res);
void handle_post_send_get_first(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res);
void handle_post_send_get(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res);

// handlers/receive_handlers.cpp
void handle_get_receive(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res);
void handle_post_receive(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res);
void handle_get_receive_all(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res);
void handle_post_receive_all(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res);

// handlers/get_handlers.cpp
void handle_get_get(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res);
void handle_post_get(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res);
void handle_post_get_wait(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res);

}  // namespace http
}  // namespace comserver
