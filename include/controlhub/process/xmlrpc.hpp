#pragma once

#include "controlhub/utils/error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace scoreboard::controlhub::xmlrpc {

/**
 * @brief Minimal XML-RPC codec for the supervisor interface.
 *
 * Values map onto nlohmann::json: int/i4/i8 -> integer, boolean -> bool,
 * double -> float, string/dateTime/base64 -> string, nil -> null,
 * array -> array, struct -> object.
 */
struct Response {
    bool is_fault = false;
    nlohmann::json value;     // result when !is_fault
    int fault_code = 0;
    std::string fault_string;
};

std::string build_request(const std::string& method, const std::vector<nlohmann::json>& params);

// PROTOCOL_ERROR when the body is not a well-formed methodResponse.
Result<Response> parse_response(const std::string& body);

std::string escape(const std::string& text);

}  // namespace scoreboard::controlhub::xmlrpc
