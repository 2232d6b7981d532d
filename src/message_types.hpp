#pragma once

// Message vocabulary shared by the client and the server.
// The codec treats Envelope::type() as opaque; nothing here is enforced.

namespace framelink {
namespace msg {

constexpr const char* kRegister = "REGISTER";
constexpr const char* kLogin = "LOGIN";
constexpr const char* kLogout = "LOGOUT";
constexpr const char* kQuery = "QUERY";
constexpr const char* kQueryResult = "QUERY_RESULT";
constexpr const char* kServerMessage = "SERVER_MESSAGE";
constexpr const char* kClientList = "CLIENT_LIST";
constexpr const char* kClientInfo = "CLIENT_INFO";
constexpr const char* kClientHistory = "CLIENT_HISTORY";
constexpr const char* kQueryStats = "QUERY_STATS";
constexpr const char* kGetMetadata = "GET_METADATA";

} // namespace msg

namespace status {

constexpr const char* kOk = "OK";
constexpr const char* kError = "ERROR";

} // namespace status

constexpr const char* kDefaultHost = "localhost";
constexpr int kDefaultPort = 8888;

} // namespace framelink
