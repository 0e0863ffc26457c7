#include <catch2/catch_test_macros.hpp>

#include <ea_mcp/diagram/validation.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

using namespace ea_mcp;
using json = nlohmann::json;

namespace {

const char* kPackageGuid = "{6A1C2D3E-4F50-4A6B-8C7D-9E0F1A2B3C4D}";
const char* kDiagramGuid = "{11111111-2222-3333-4444-555555555555}";

json SequenceParams() {
    return {
        {"package_guid", kPackageGuid},
        {"name", "Login flow"},
        {"elements", json::array({
            {{"name", "User"}, {"type", "Actor"}},
            {{"name", "LoginForm"}, {"type", "Boundary"}},
            {{"name", "AuthService"}, {"type", "Control"}, {"stereotype", "service"}},
            {{"name", "UserStore"}, {"type", "Database"}},
        })},
    };
}

} // anonymous namespace

// ===========================================================================
// Valid input mirrors the request
// ===========================================================================

TEST_CASE("ValidateDiagramRequest: sequence request mirrors input", "[diagram][validation]") {
    auto result = ValidateDiagramRequest(DiagramKind::Sequence, SequenceParams());
    REQUIRE(result.IsOk());
    const auto& request = result.Value();

    CHECK(request.kind == DiagramKind::Sequence);
    CHECK(request.package_guid.Value() == kPackageGuid);
    CHECK(request.name == "Login flow");

    const auto* payload = std::get_if<SequencePayload>(&request.payload);
    REQUIRE(payload != nullptr);
    REQUIRE(payload->elements.size() == 4);
    CHECK(payload->elements[0].name == "User");
    CHECK(payload->elements[0].type == ElementType::Actor);
    CHECK_FALSE(payload->elements[0].stereotype.has_value());
    CHECK(payload->elements[1].type == ElementType::Boundary);
    CHECK(payload->elements[2].name == "AuthService");
    REQUIRE(payload->elements[2].stereotype.has_value());
    CHECK(*payload->elements[2].stereotype == "service");
    CHECK(payload->elements[3].type == ElementType::Database);
}

TEST_CASE("ValidateDiagramRequest: class request keeps feature order", "[diagram][validation]") {
    json params = {
        {"package_guid", kPackageGuid},
        {"name", "Domain"},
        {"classes", json::array({
            {{"name", "User"},
             {"attributes", json::array({"username", "password"})},
             {"methods", json::array({"login()"})}},
            {{"name", "Session"}, {"type", "Class"}},
        })},
    };

    auto result = ValidateDiagramRequest(DiagramKind::Class, params);
    REQUIRE(result.IsOk());
    const auto& classes = std::get<ClassPayload>(result.Value().payload).classes;
    REQUIRE(classes.size() == 2);
    CHECK(classes[0].type == ElementType::Class);
    REQUIRE(classes[0].attributes.size() == 2);
    CHECK(classes[0].attributes[0] == "username");
    CHECK(classes[0].attributes[1] == "password");
    REQUIRE(classes[0].methods.size() == 1);
    CHECK(classes[0].methods[0] == "login()");
    CHECK(classes[1].attributes.empty());
    CHECK(classes[1].methods.empty());
}

TEST_CASE("ValidateDiagramRequest: use case and activity name lists", "[diagram][validation]") {
    SECTION("use case") {
        json params = {
            {"package_guid", kPackageGuid},
            {"name", "Accounts"},
            {"actors", json::array({"User", "Admin"})},
            {"use_cases", json::array({"Login", "Logout"})},
        };
        auto result = ValidateDiagramRequest(DiagramKind::UseCase, params);
        REQUIRE(result.IsOk());
        const auto& payload = std::get<UseCasePayload>(result.Value().payload);
        CHECK(payload.actors == std::vector<std::string>({"User", "Admin"}));
        CHECK(payload.use_cases == std::vector<std::string>({"Login", "Logout"}));
    }
    SECTION("activity") {
        json params = {
            {"package_guid", kPackageGuid},
            {"name", "Checkout"},
            {"activities", json::array({"Pay", "Ship"})},
            {"decisions", json::array({"In stock?"})},
        };
        auto result = ValidateDiagramRequest(DiagramKind::Activity, params);
        REQUIRE(result.IsOk());
        const auto& payload = std::get<ActivityPayload>(result.Value().payload);
        CHECK(payload.activities.size() == 2);
        REQUIRE(payload.decisions.size() == 1);
        CHECK(payload.decisions[0] == "In stock?");
    }
}

TEST_CASE("ValidateDiagramRequest: empty arrays are accepted", "[diagram][validation]") {
    json params = {
        {"package_guid", kPackageGuid},
        {"name", "Empty"},
        {"actors", json::array()},
        {"use_cases", json::array()},
    };
    auto result = ValidateDiagramRequest(DiagramKind::UseCase, params);
    REQUIRE(result.IsOk());
    const auto& payload = std::get<UseCasePayload>(result.Value().payload);
    CHECK(payload.actors.empty());
    CHECK(payload.use_cases.empty());
}

TEST_CASE("ValidateDiagramRequest: unbraced GUID is kept as given", "[diagram][validation]") {
    auto params = SequenceParams();
    params["package_guid"] = "6a1c2d3e-4f50-4a6b-8c7d-9e0f1a2b3c4d";
    auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
    REQUIRE(result.IsOk());
    CHECK(result.Value().package_guid.Value() == "6a1c2d3e-4f50-4a6b-8c7d-9e0f1a2b3c4d");
}

// ===========================================================================
// Missing fields
// ===========================================================================

TEST_CASE("ValidateDiagramRequest: missing required fields", "[diagram][validation]") {
    SECTION("package_guid") {
        auto params = SequenceParams();
        params.erase("package_guid");
        auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::MissingParameter);
        CHECK(*result.Error().field == "package_guid");
        CHECK(result.Error().operation == "create_sequence_diagram");
    }
    SECTION("name") {
        auto params = SequenceParams();
        params.erase("name");
        auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::MissingParameter);
        CHECK(*result.Error().field == "name");
    }
    SECTION("elements") {
        auto params = SequenceParams();
        params.erase("elements");
        auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::MissingParameter);
        CHECK(*result.Error().field == "elements");
    }
    SECTION("use_cases") {
        json params = {
            {"package_guid", kPackageGuid},
            {"name", "Accounts"},
            {"actors", json::array({"User"})},
        };
        auto result = ValidateDiagramRequest(DiagramKind::UseCase, params);
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::MissingParameter);
        CHECK(*result.Error().field == "use_cases");
    }
    SECTION("decisions") {
        json params = {
            {"package_guid", kPackageGuid},
            {"name", "Checkout"},
            {"activities", json::array({"Pay"})},
        };
        auto result = ValidateDiagramRequest(DiagramKind::Activity, params);
        REQUIRE(result.IsErr());
        CHECK(*result.Error().field == "decisions");
    }
}

TEST_CASE("ValidateDiagramRequest: sequence element without type", "[diagram][validation]") {
    auto params = SequenceParams();
    params["elements"][1].erase("type");
    auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::MissingParameter);
    CHECK(*result.Error().field == "elements[1].type");
}

// ===========================================================================
// Malformed values
// ===========================================================================

TEST_CASE("ValidateDiagramRequest: malformed GUID", "[diagram][validation]") {
    auto params = SequenceParams();
    params["package_guid"] = "not-a-guid";
    auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::InvalidGuid);
    REQUIRE(result.Error().value.has_value());
    CHECK(*result.Error().value == "not-a-guid");
}

TEST_CASE("ValidateDiagramRequest: non-string GUID", "[diagram][validation]") {
    auto params = SequenceParams();
    params["package_guid"] = 42;
    auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::InvalidGuid);
    CHECK(*result.Error().value == "42");
}

TEST_CASE("ValidateDiagramRequest: empty name is invalid", "[diagram][validation]") {
    auto params = SequenceParams();
    params["name"] = "";
    auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::InvalidParameter);
    CHECK(*result.Error().field == "name");
}

TEST_CASE("ValidateDiagramRequest: wrong JSON types", "[diagram][validation]") {
    SECTION("arguments not an object") {
        auto result = ValidateDiagramRequest(DiagramKind::Class, json::array());
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::InvalidParameter);
        CHECK(*result.Error().field == "arguments");
    }
    SECTION("elements not an array") {
        auto params = SequenceParams();
        params["elements"] = "User";
        auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::InvalidParameter);
        CHECK(*result.Error().field == "elements");
    }
    SECTION("element entry not an object") {
        auto params = SequenceParams();
        params["elements"][0] = "User";
        auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
        REQUIRE(result.IsErr());
        CHECK(*result.Error().field == "elements[0]");
    }
    SECTION("actor entry not a string") {
        json params = {
            {"package_guid", kPackageGuid},
            {"name", "Accounts"},
            {"actors", json::array({"User", 7})},
            {"use_cases", json::array()},
        };
        auto result = ValidateDiagramRequest(DiagramKind::UseCase, params);
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::InvalidParameter);
        CHECK(*result.Error().field == "actors[1]");
    }
    SECTION("empty attribute name") {
        json params = {
            {"package_guid", kPackageGuid},
            {"name", "Domain"},
            {"classes", json::array({
                {{"name", "User"}, {"attributes", json::array({"username", ""})}},
            })},
        };
        auto result = ValidateDiagramRequest(DiagramKind::Class, params);
        REQUIRE(result.IsErr());
        CHECK(*result.Error().field == "classes[0].attributes[1]");
    }
}

// ===========================================================================
// Vocabulary
// ===========================================================================

TEST_CASE("ValidateDiagramRequest: type outside the vocabulary", "[diagram][validation]") {
    auto params = SequenceParams();
    params["elements"][2]["type"] = "Widget";
    auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
    REQUIRE(result.IsErr());
    const auto& error = result.Error();
    CHECK(error.kind == ErrorKind::UnknownElementType);
    CHECK(*error.field == "elements[2].type");
    CHECK(*error.value == "Widget");
    const std::vector<std::string> expected = {"Actor", "Boundary", "Control",
                                               "Entity", "Database", "UseCase"};
    CHECK(error.allowed == expected);
}

TEST_CASE("ValidateDiagramRequest: type valid elsewhere but not for the kind", "[diagram][validation]") {
    SECTION("Class on a sequence diagram") {
        auto params = SequenceParams();
        params["elements"][0]["type"] = "Class";
        auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::UnknownElementType);
    }
    SECTION("Actor on a class diagram") {
        json params = {
            {"package_guid", kPackageGuid},
            {"name", "Domain"},
            {"classes", json::array({{{"name", "User"}, {"type", "Actor"}}})},
        };
        auto result = ValidateDiagramRequest(DiagramKind::Class, params);
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::UnknownElementType);
        CHECK(result.Error().allowed == std::vector<std::string>({"Class"}));
    }
    SECTION("lower-case spelling") {
        auto params = SequenceParams();
        params["elements"][0]["type"] = "actor";
        auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::UnknownElementType);
    }
}

TEST_CASE("ValidateDiagramRequest: first error wins", "[diagram][validation]") {
    json params = {
        {"package_guid", "bad"},
        {"elements", json::array({{{"name", "X"}, {"type", "Widget"}}})},
    };
    auto result = ValidateDiagramRequest(DiagramKind::Sequence, params);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::InvalidGuid);
}

// ===========================================================================
// Lifeline requests
// ===========================================================================

TEST_CASE("ValidateLifelineRequest: valid request", "[diagram][validation]") {
    json params = {{"diagram_guid", kDiagramGuid}, {"name", "Customer"}};
    auto result = ValidateLifelineRequest(ElementType::Entity, params);
    REQUIRE(result.IsOk());
    CHECK(result.Value().diagram_guid.Value() == kDiagramGuid);
    CHECK(result.Value().element.name == "Customer");
    CHECK(result.Value().element.type == ElementType::Entity);
    CHECK_FALSE(result.Value().element.stereotype.has_value());
}

TEST_CASE("ValidateLifelineRequest: errors", "[diagram][validation]") {
    SECTION("missing diagram_guid") {
        auto result = ValidateLifelineRequest(ElementType::Actor, {{"name", "User"}});
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::MissingParameter);
        CHECK(*result.Error().field == "diagram_guid");
        CHECK(result.Error().operation == "create_actor_lifeline");
    }
    SECTION("missing name") {
        auto result = ValidateLifelineRequest(ElementType::Actor,
                                              {{"diagram_guid", kDiagramGuid}});
        REQUIRE(result.IsErr());
        CHECK(*result.Error().field == "name");
    }
    SECTION("non-lifeline type") {
        auto result = ValidateLifelineRequest(
            ElementType::Class, {{"diagram_guid", kDiagramGuid}, {"name", "User"}});
        REQUIRE(result.IsErr());
        CHECK(result.Error().kind == ErrorKind::UnknownElementType);
    }
}

// ===========================================================================
// Tool names and schemas
// ===========================================================================

TEST_CASE("Tool names", "[diagram][validation]") {
    CHECK(DiagramToolName(DiagramKind::UseCase) == "create_use_case_diagram");
    CHECK(LifelineToolName(ElementType::Database) == "create_database_lifeline");
    CHECK(LifelineToolName(ElementType::UseCase) == "create_use_case_lifeline");
}

TEST_CASE("DiagramToolSchema: required fields", "[diagram][validation]") {
    auto schema = DiagramToolSchema(DiagramKind::UseCase);
    CHECK(schema["type"] == "object");
    CHECK(schema["required"] ==
          json::array({"package_guid", "name", "actors", "use_cases"}));

    auto sequence = DiagramToolSchema(DiagramKind::Sequence);
    const auto& type_enum =
        sequence["properties"]["elements"]["items"]["properties"]["type"]["enum"];
    CHECK(type_enum.size() == 6);

    auto lifeline = LifelineToolSchema();
    CHECK(lifeline["required"] == json::array({"diagram_guid", "name"}));
}
