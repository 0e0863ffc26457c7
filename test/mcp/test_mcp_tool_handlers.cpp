#include <catch2/catch_test_macros.hpp>

#include <ea_mcp/mcp/mcp_server.hpp>
#include <ea_mcp/mcp/mcp_tool_handlers.hpp>
#include <ea_mcp/mcp/tool_registry.hpp>
#include "../../test/mocks/mock_ea_session.hpp"

#include <map>
#include <set>
#include <sstream>
#include <string>

using namespace ea_mcp;
using namespace ea_mcp::testing;

namespace {

const char* kPackageGuid = "{6A1C2D3E-4F50-4A6B-8C7D-9E0F1A2B3C4D}";
const char* kDiagramGuid = "{11111111-2222-3333-4444-555555555555}";

// Helper: make a registry with all tools registered against a mock session.
ToolRegistry MakeRegistry(MockEaSession& mock) {
    ToolRegistry registry;
    RegisterEaTools(registry, mock);
    return registry;
}

// Helper: parse the text content from a successful ToolResult.
nlohmann::json ParseContent(const ToolResult& result) {
    REQUIRE_FALSE(result.is_error);
    REQUIRE(result.content.size() == 1);
    return nlohmann::json::parse(result.content[0]["text"].get<std::string>());
}

// Helper: parse the text content from an error ToolResult.
nlohmann::json ParseError(const ToolResult& result) {
    REQUIRE(result.is_error);
    REQUIRE(result.content.size() == 1);
    return nlohmann::json::parse(result.content[0]["text"].get<std::string>());
}

} // anonymous namespace

// ===========================================================================
// Registration
// ===========================================================================

TEST_CASE("RegisterEaTools: registers 10 tools", "[mcp][handlers]") {
    MockEaSession mock;
    auto registry = MakeRegistry(mock);

    REQUIRE(registry.Tools().size() == 10);

    std::set<std::string> names;
    for (const auto& tool : registry.Tools()) {
        names.insert(tool.name);
        CHECK_FALSE(tool.description.empty());
        CHECK(tool.input_schema["type"] == "object");
    }
    const std::set<std::string> expected = {
        "create_sequence_diagram", "create_class_diagram",
        "create_use_case_diagram", "create_activity_diagram",
        "create_actor_lifeline",   "create_boundary_lifeline",
        "create_control_lifeline", "create_entity_lifeline",
        "create_database_lifeline", "create_use_case_lifeline"};
    CHECK(names == expected);

    // Registration alone touches nothing.
    CHECK(mock.TotalCallCount() == 0);
}

TEST_CASE("RegisterEaTools: lifeline descriptions read as prose", "[mcp][handlers]") {
    MockEaSession mock;
    auto registry = MakeRegistry(mock);

    std::map<std::string, std::string> descriptions;
    for (const auto& tool : registry.Tools()) {
        descriptions[tool.name] = tool.description;
    }
    CHECK(descriptions["create_use_case_lifeline"] ==
          "Creates a use case lifeline on a sequence diagram.");
    CHECK(descriptions["create_actor_lifeline"] ==
          "Creates an actor lifeline on a sequence diagram.");
    CHECK(descriptions["create_database_lifeline"] ==
          "Creates a database lifeline on a sequence diagram.");
    for (const auto& entry : descriptions) {
        CHECK(entry.second.find('_') == std::string::npos);
    }
}

TEST_CASE("RegisterEaTools: tools/list exposes the schemas", "[mcp][handlers]") {
    MockEaSession mock;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRegistry(mock), in, out);

    auto response = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    REQUIRE(response.has_value());

    const auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == 10);
    bool found = false;
    for (const auto& tool : tools) {
        if (tool["name"] == "create_class_diagram") {
            found = true;
            CHECK(tool["inputSchema"]["required"] ==
                  nlohmann::json::array({"package_guid", "name", "classes"}));
        }
    }
    CHECK(found);
}

// ===========================================================================
// Diagram tools
// ===========================================================================

TEST_CASE("create_sequence_diagram: success payload", "[mcp][handlers]") {
    MockEaSession mock;
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("create_sequence_diagram", {
        {"package_guid", kPackageGuid},
        {"name", "Login flow"},
        {"elements", nlohmann::json::array({
            {{"name", "User"}, {"type", "Actor"}},
            {{"name", "UserStore"}, {"type", "Database"}},
        })},
    });

    auto payload = ParseContent(result);
    CHECK(payload["status"] == "success");
    CHECK(payload["diagram"]["name"] == "Login flow");
    CHECK(payload["diagram"]["type"] == "Sequence");
    CHECK(payload["diagram_guid"] == payload["diagram"]["guid"]);

    const auto& elements = payload["elements"];
    REQUIRE(elements.size() == 2);
    CHECK(elements[0]["name"] == "User");
    CHECK(elements[0]["type"] == "Actor");
    CHECK(elements[0]["ea_type"] == "Object");
    CHECK(elements[0]["stereotype"] == "actor");
    CHECK(elements[1]["left"] == 300);
    CHECK(elements[1]["top"] == 100);
    CHECK_FALSE(elements[0].contains("attributes"));

    CHECK(mock.CreateDiagramCallCount() == 1);
    CHECK(mock.AddElementCallCount() == 2);
}

TEST_CASE("create_class_diagram: features in the payload", "[mcp][handlers]") {
    MockEaSession mock;
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("create_class_diagram", {
        {"package_guid", kPackageGuid},
        {"name", "Domain"},
        {"classes", nlohmann::json::array({
            {{"name", "User"},
             {"attributes", nlohmann::json::array({"username", "password"})},
             {"methods", nlohmann::json::array({"login()"})}},
        })},
    });

    auto payload = ParseContent(result);
    const auto& user = payload["elements"][0];
    CHECK(user["type"] == "Class");
    REQUIRE(user["attributes"].size() == 2);
    CHECK(user["attributes"][0]["name"] == "username");
    CHECK(user["attributes"][0]["kind"] == "attribute");
    REQUIRE(user["methods"].size() == 1);
    CHECK(user["methods"][0]["name"] == "login()");
    CHECK(user["methods"][0]["kind"] == "method");
}

TEST_CASE("create_use_case_diagram: actors then use cases", "[mcp][handlers]") {
    MockEaSession mock;
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("create_use_case_diagram", {
        {"package_guid", kPackageGuid},
        {"name", "Accounts"},
        {"actors", nlohmann::json::array({"User", "Admin"})},
        {"use_cases", nlohmann::json::array({"Login", "Logout"})},
    });

    auto payload = ParseContent(result);
    const auto& elements = payload["elements"];
    REQUIRE(elements.size() == 4);
    CHECK(elements[0]["type"] == "Actor");
    CHECK(elements[1]["name"] == "Admin");
    CHECK(elements[2]["type"] == "UseCase");
    CHECK(elements[3]["name"] == "Logout");
    CHECK(mock.AttachFeatureCallCount() == 0);
}

TEST_CASE("create_activity_diagram: activities then decisions", "[mcp][handlers]") {
    MockEaSession mock;
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("create_activity_diagram", {
        {"package_guid", kPackageGuid},
        {"name", "Checkout"},
        {"activities", nlohmann::json::array({"Pay"})},
        {"decisions", nlohmann::json::array({"In stock?"})},
    });

    auto payload = ParseContent(result);
    REQUIRE(payload["elements"].size() == 2);
    CHECK(payload["elements"][0]["type"] == "Activity");
    CHECK(payload["elements"][1]["type"] == "Decision");
    CHECK(payload["elements"][1]["top"] == 200);
}

TEST_CASE("Diagram tools: validation errors never reach the repository", "[mcp][handlers]") {
    MockEaSession mock;
    auto registry = MakeRegistry(mock);

    SECTION("missing package_guid") {
        auto result = registry.Execute("create_use_case_diagram", {
            {"name", "Accounts"},
            {"actors", nlohmann::json::array()},
            {"use_cases", nlohmann::json::array()},
        });
        auto payload = ParseError(result);
        CHECK(payload["status"] == "error");
        CHECK(payload["error"]["kind"] == "missing_parameter");
        CHECK(payload["error"]["field"] == "package_guid");
        CHECK(payload["error"]["operation"] == "create_use_case_diagram");
    }
    SECTION("unknown element type") {
        auto result = registry.Execute("create_sequence_diagram", {
            {"package_guid", kPackageGuid},
            {"name", "Login flow"},
            {"elements", nlohmann::json::array({{{"name", "X"}, {"type", "Widget"}}})},
        });
        auto payload = ParseError(result);
        CHECK(payload["error"]["kind"] == "unknown_element_type");
        CHECK(payload["error"]["value"] == "Widget");
        CHECK(payload["error"]["allowed"].size() == 6);
    }
    SECTION("malformed GUID") {
        auto result = registry.Execute("create_class_diagram", {
            {"package_guid", "pkg-1"},
            {"name", "Domain"},
            {"classes", nlohmann::json::array()},
        });
        auto payload = ParseError(result);
        CHECK(payload["error"]["kind"] == "invalid_guid");
    }

    CHECK(mock.TotalCallCount() == 0);
}

TEST_CASE("Diagram tools: partial outcome is reported", "[mcp][handlers]") {
    MockEaSession mock;
    mock.FailAddElementAfter(1, Error::NotFound("AddElement", "rejected"));
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("create_sequence_diagram", {
        {"package_guid", kPackageGuid},
        {"name", "Login flow"},
        {"elements", nlohmann::json::array({
            {{"name", "User"}, {"type", "Actor"}},
            {{"name", "LoginForm"}, {"type", "Boundary"}},
            {{"name", "AuthService"}, {"type", "Control"}},
        })},
    });

    auto payload = ParseError(result);
    CHECK(payload["error"]["kind"] == "element_creation_failed");
    CHECK(payload["error"]["index"] == 1);
    CHECK(payload["error"]["field"] == "elements");
    REQUIRE(payload.contains("diagram_guid"));
    CHECK_FALSE(payload["diagram_guid"].get<std::string>().empty());
    REQUIRE(payload["elements"].size() == 1);
    CHECK(payload["elements"][0]["name"] == "User");
}

TEST_CASE("Diagram tools: diagram failure has no partial outcome", "[mcp][handlers]") {
    MockEaSession mock;
    mock.EnqueueCreateDiagram(Result<DiagramInfo, Error>::Err(
        Error::NotFound("CreateDiagram", "package does not exist")));
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("create_activity_diagram", {
        {"package_guid", kPackageGuid},
        {"name", "Checkout"},
        {"activities", nlohmann::json::array({"Pay"})},
        {"decisions", nlohmann::json::array()},
    });

    auto payload = ParseError(result);
    CHECK(payload["error"]["kind"] == "diagram_creation_failed");
    CHECK_FALSE(payload.contains("diagram_guid"));
    CHECK_FALSE(payload.contains("elements"));
}

// ===========================================================================
// Lifeline tools
// ===========================================================================

TEST_CASE("create_*_lifeline: success payload", "[mcp][handlers]") {
    MockEaSession mock;
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("create_control_lifeline",
                                   {{"diagram_guid", kDiagramGuid},
                                    {"name", "AuthService"}});

    auto payload = ParseContent(result);
    CHECK(payload["status"] == "success");
    CHECK(payload["element_guid"] == payload["element"]["guid"]);
    CHECK(payload["element"]["type"] == "Control");
    CHECK(payload["element"]["stereotype"] == "control");

    REQUIRE(mock.AddElementCallCount() == 1);
    CHECK(mock.AddElementCalls()[0].diagram_guid == kDiagramGuid);
    CHECK(mock.CreateDiagramCallCount() == 0);
}

TEST_CASE("create_*_lifeline: explicit stereotype wins", "[mcp][handlers]") {
    MockEaSession mock;
    auto registry = MakeRegistry(mock);

    auto result = registry.Execute("create_entity_lifeline",
                                   {{"diagram_guid", kDiagramGuid},
                                    {"name", "Order"},
                                    {"stereotype", "aggregate"}});

    auto payload = ParseContent(result);
    CHECK(payload["element"]["stereotype"] == "aggregate");
    CHECK(payload["element"]["type"] == "Entity");
}

TEST_CASE("create_*_lifeline: errors", "[mcp][handlers]") {
    MockEaSession mock;
    auto registry = MakeRegistry(mock);

    SECTION("missing diagram_guid") {
        auto payload = ParseError(registry.Execute("create_actor_lifeline",
                                                   {{"name", "User"}}));
        CHECK(payload["error"]["kind"] == "missing_parameter");
        CHECK(payload["error"]["field"] == "diagram_guid");
        CHECK(mock.TotalCallCount() == 0);
    }
    SECTION("unknown diagram") {
        mock.EnqueueAddElement(Result<ElementInfo, Error>::Err(
            Error::NotFound("AddElement", "diagram does not exist")));
        auto payload = ParseError(registry.Execute("create_database_lifeline",
                                                   {{"diagram_guid", kDiagramGuid},
                                                    {"name", "Orders"}}));
        CHECK(payload["error"]["kind"] == "element_creation_failed");
        CHECK(payload["error"]["operation"] == "create_database_lifeline");
    }
}

// ===========================================================================
// End to end through McpServer
// ===========================================================================

TEST_CASE("tools/call: diagram tool through the JSON-RPC layer", "[mcp][handlers]") {
    MockEaSession mock;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRegistry(mock), in, out);

    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"id", 42},
        {"method", "tools/call"},
        {"params", {
            {"name", "create_use_case_diagram"},
            {"arguments", {
                {"package_guid", kPackageGuid},
                {"name", "Accounts"},
                {"actors", nlohmann::json::array({"User"})},
                {"use_cases", nlohmann::json::array({"Login"})},
            }},
        }},
    };

    auto response = server.HandleMessage(msg);
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 42);
    const auto& result = (*response)["result"];
    CHECK_FALSE(result.contains("isError"));
    auto payload =
        nlohmann::json::parse(result["content"][0]["text"].get<std::string>());
    CHECK(payload["elements"].size() == 2);
}
