#include <gtest/gtest.h>
#include "controlhub/process/xmlrpc.hpp"

#include <string>

namespace scoreboard::controlhub::test {

using json = nlohmann::json;

TEST(XmlRpcTest, BuildRequestEncodesParams) {
    const std::string body = xmlrpc::build_request("supervisor.startProcess", {"score<board>", true, 3});

    EXPECT_NE(body.find("<methodName>supervisor.startProcess</methodName>"), std::string::npos);
    EXPECT_NE(body.find("<value><string>score&lt;board&gt;</string></value>"), std::string::npos);
    EXPECT_NE(body.find("<value><boolean>1</boolean></value>"), std::string::npos);
    EXPECT_NE(body.find("<value><int>3</int></value>"), std::string::npos);
}

TEST(XmlRpcTest, BuildRequestEncodesNestedValues) {
    const std::string body = xmlrpc::build_request("x", {json{{"a", json::array({1, 2})}}});
    EXPECT_NE(body.find("<struct><member><name>a</name><value><array><data>"
                        "<value><int>1</int></value><value><int>2</int></value>"
                        "</data></array></value></member></struct>"), std::string::npos);
}

TEST(XmlRpcTest, EscapeHandlesSpecialCharacters) {
    EXPECT_EQ(xmlrpc::escape("a&b<c>\"d\""), "a&amp;b&lt;c&gt;&quot;d&quot;");
    EXPECT_EQ(xmlrpc::escape("plain"), "plain");
}

TEST(XmlRpcTest, ParsesProcessInfoStruct) {
    const std::string body = R"(<?xml version="1.0"?>
<methodResponse>
  <params>
    <param>
      <value><struct>
        <member><name>name</name><value><string>scoreboard</string></value></member>
        <member><name>statename</name><value><string>RUNNING</string></value></member>
        <member><name>pid</name><value><int>1234</int></value></member>
        <member><name>description</name><value>pid 1234, uptime 0:01:02</value></member>
        <member><name>exitstatus</name><value><i4>0</i4></value></member>
      </struct></value>
    </param>
  </params>
</methodResponse>)";

    auto response = xmlrpc::parse_response(body);
    ASSERT_TRUE(response.has_value()) << response.error().to_string();
    EXPECT_FALSE(response->is_fault);
    EXPECT_EQ(response->value["name"], "scoreboard");
    EXPECT_EQ(response->value["statename"], "RUNNING");
    EXPECT_EQ(response->value["pid"], 1234);
    EXPECT_EQ(response->value["description"], "pid 1234, uptime 0:01:02");
    EXPECT_EQ(response->value["exitstatus"], 0);
}

TEST(XmlRpcTest, ParsesScalarsAndArrays) {
    const std::string body =
        "<methodResponse><params><param><value><array><data>"
        "<value><boolean>1</boolean></value>"
        "<value><double>2.5</double></value>"
        "<value><string>a &amp; b &#233;</string></value>"
        "<value><nil/></value>"
        "<value/>"
        "</data></array></value></param></params></methodResponse>";

    auto response = xmlrpc::parse_response(body);
    ASSERT_TRUE(response.has_value()) << response.error().to_string();
    ASSERT_TRUE(response->value.is_array());
    ASSERT_EQ(response->value.size(), 5u);
    EXPECT_EQ(response->value[0], true);
    EXPECT_DOUBLE_EQ(response->value[1].get<double>(), 2.5);
    EXPECT_EQ(response->value[2], "a & b \xC3\xA9");
    EXPECT_TRUE(response->value[3].is_null());
    EXPECT_EQ(response->value[4], "");
}

TEST(XmlRpcTest, ParsesFault) {
    const std::string body =
        "<?xml version='1.0'?><methodResponse><fault><value><struct>"
        "<member><name>faultCode</name><value><int>10</int></value></member>"
        "<member><name>faultString</name><value><string>BAD_NAME: ghost</string></value></member>"
        "</struct></value></fault></methodResponse>";

    auto response = xmlrpc::parse_response(body);
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(response->is_fault);
    EXPECT_EQ(response->fault_code, 10);
    EXPECT_EQ(response->fault_string, "BAD_NAME: ghost");
}

TEST(XmlRpcTest, MalformedBodiesAreProtocolErrors) {
    const char* bodies[] = {
        "",
        "<html><body>502 Bad Gateway</body></html>",
        "<methodResponse><params><param><value><int>x</int></value></param></params></methodResponse>",
        "<methodResponse><params><param><value><int>1</int></value></param></params>",
        "<methodResponse><fault><value><struct></struct></value></fault></methodResponse>",
        "<methodResponse><params><param><value><string>&bogus;</string></value></param></params></methodResponse>",
        "<methodResponse><params><param><value><date>1</date></value></param></params></methodResponse>",
    };

    for (const char* body : bodies) {
        auto response = xmlrpc::parse_response(body);
        ASSERT_FALSE(response.has_value()) << "accepted: " << body;
        EXPECT_EQ(response.error().code(), ErrorCode::PROTOCOL_ERROR);
    }
}

namespace {

// <methodResponse> carrying `levels` arrays, each wrapping the next, around one int.
std::string nested_arrays(int levels) {
    std::string body = "<methodResponse><params><param>";
    for (int i = 0; i < levels; ++i) {
        body += "<value><array><data>";
    }
    body += "<value><int>1</int></value>";
    for (int i = 0; i < levels; ++i) {
        body += "</data></array></value>";
    }
    return body + "</param></params></methodResponse>";
}

}  // namespace

TEST(XmlRpcTest, ModerateNestingParses) {
    auto response = xmlrpc::parse_response(nested_arrays(8));
    ASSERT_TRUE(response.has_value()) << response.error().to_string();
    json value = response->value;
    for (int i = 0; i < 8; ++i) {
        ASSERT_TRUE(value.is_array());
        ASSERT_EQ(value.size(), 1u);
        value = value[0];
    }
    EXPECT_EQ(value, 1);
}

TEST(XmlRpcTest, DeepNestingRejected) {
    auto response = xmlrpc::parse_response(nested_arrays(100000));
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code(), ErrorCode::PROTOCOL_ERROR);
    EXPECT_NE(response.error().message().find("nested"), std::string::npos);
}

}  // namespace scoreboard::controlhub::test
