#include <ea_mcp/diagram/validation.hpp>

#include <string>
#include <vector>

namespace ea_mcp {

namespace {

std::string IndexedField(const std::string& field, size_t index) {
    return field + "[" + std::to_string(index) + "]";
}

std::vector<std::string> AllowedTypeNames(DiagramKind kind) {
    std::vector<std::string> names;
    for (auto type : AllowedElementTypes(kind)) {
        names.emplace_back(ElementTypeName(type));
    }
    return names;
}

// A non-empty string member of `obj`. `field` is the path used in errors.
Result<std::string, Error> RequireString(const std::string& op,
                                         const nlohmann::json& obj,
                                         const std::string& key,
                                         const std::string& field) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return Result<std::string, Error>::Err(Error::MissingParameter(op, field));
    }
    if (!obj[key].is_string()) {
        return Result<std::string, Error>::Err(
            Error::InvalidParameter(op, field, "must be a string"));
    }
    auto value = obj[key].get<std::string>();
    if (value.empty()) {
        return Result<std::string, Error>::Err(
            Error::InvalidParameter(op, field, "must not be empty"));
    }
    return Result<std::string, Error>::Ok(std::move(value));
}

Result<Guid, Error> RequireGuid(const std::string& op,
                                const nlohmann::json& params,
                                const std::string& key) {
    if (!params.contains(key) || params[key].is_null()) {
        return Result<Guid, Error>::Err(Error::MissingParameter(op, key));
    }
    if (!params[key].is_string()) {
        return Result<Guid, Error>::Err(Error::InvalidGuid(op, key, params[key].dump()));
    }
    auto raw = params[key].get<std::string>();
    auto guid = Guid::Create(raw);
    if (guid.IsErr()) {
        return Result<Guid, Error>::Err(Error::InvalidGuid(op, key, raw));
    }
    return Result<Guid, Error>::Ok(std::move(guid).Value());
}

// Validates that `params[key]` is present and an array. Absent arrays are
// missing parameters even when an empty array would be accepted.
Result<void, Error> RequireArray(const std::string& op,
                                 const nlohmann::json& params,
                                 const std::string& key) {
    if (!params.contains(key) || params[key].is_null()) {
        return Result<void, Error>::Err(Error::MissingParameter(op, key));
    }
    if (!params[key].is_array()) {
        return Result<void, Error>::Err(
            Error::InvalidParameter(op, key, "must be an array"));
    }
    return Result<void, Error>::Ok();
}

// An array of non-empty strings. `required` controls whether absence is an
// error or yields an empty list.
Result<std::vector<std::string>, Error> NameList(const std::string& op,
                                                 const nlohmann::json& obj,
                                                 const std::string& key,
                                                 const std::string& field,
                                                 bool required) {
    using R = Result<std::vector<std::string>, Error>;
    if (!obj.contains(key) || obj[key].is_null()) {
        if (required) return R::Err(Error::MissingParameter(op, field));
        return R::Ok(std::vector<std::string>{});
    }
    if (!obj[key].is_array()) {
        return R::Err(Error::InvalidParameter(op, field, "must be an array"));
    }

    std::vector<std::string> names;
    const auto& arr = obj[key];
    names.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        const auto& entry = arr[i];
        if (!entry.is_string()) {
            return R::Err(Error::InvalidParameter(op, IndexedField(field, i),
                                                  "must be a string"));
        }
        auto name = entry.get<std::string>();
        if (name.empty()) {
            return R::Err(Error::InvalidParameter(op, IndexedField(field, i),
                                                  "must not be empty"));
        }
        names.push_back(std::move(name));
    }
    return R::Ok(std::move(names));
}

Result<ElementType, Error> ParseTypeFor(const std::string& op,
                                        DiagramKind kind,
                                        const nlohmann::json& type_value,
                                        const std::string& field) {
    if (!type_value.is_string()) {
        return Result<ElementType, Error>::Err(
            Error::InvalidParameter(op, field, "must be a string"));
    }
    auto raw = type_value.get<std::string>();
    auto type = ParseElementType(raw);
    if (!type || !IsAllowedOn(kind, *type)) {
        return Result<ElementType, Error>::Err(
            Error::UnknownElementType(op, field, raw, AllowedTypeNames(kind)));
    }
    return Result<ElementType, Error>::Ok(*type);
}

Result<std::optional<std::string>, Error> OptStereotype(const std::string& op,
                                                        const nlohmann::json& obj,
                                                        const std::string& field) {
    using R = Result<std::optional<std::string>, Error>;
    if (!obj.contains("stereotype") || obj["stereotype"].is_null()) {
        return R::Ok(std::nullopt);
    }
    if (!obj["stereotype"].is_string()) {
        return R::Err(Error::InvalidParameter(op, field, "must be a string"));
    }
    return R::Ok(obj["stereotype"].get<std::string>());
}

// One entry of `elements` (sequence) or `classes` (class).
Result<ElementSpec, Error> ParseElementSpec(const std::string& op,
                                            DiagramKind kind,
                                            const nlohmann::json& entry,
                                            const std::string& field) {
    using R = Result<ElementSpec, Error>;
    if (!entry.is_object()) {
        return R::Err(Error::InvalidParameter(op, field, "must be an object"));
    }

    ElementSpec spec;

    auto name = RequireString(op, entry, "name", field + ".name");
    if (name.IsErr()) return R::Err(name.Error());
    spec.name = std::move(name).Value();

    const auto type_field = field + ".type";
    if (entry.contains("type") && !entry["type"].is_null()) {
        auto type = ParseTypeFor(op, kind, entry["type"], type_field);
        if (type.IsErr()) return R::Err(type.Error());
        spec.type = type.Value();
    } else if (kind == DiagramKind::Class) {
        spec.type = ElementType::Class;
    } else {
        return R::Err(Error::MissingParameter(op, type_field));
    }

    auto stereotype = OptStereotype(op, entry, field + ".stereotype");
    if (stereotype.IsErr()) return R::Err(stereotype.Error());
    spec.stereotype = std::move(stereotype).Value();

    if (kind == DiagramKind::Class) {
        auto attributes = NameList(op, entry, "attributes", field + ".attributes", false);
        if (attributes.IsErr()) return R::Err(attributes.Error());
        spec.attributes = std::move(attributes).Value();

        auto methods = NameList(op, entry, "methods", field + ".methods", false);
        if (methods.IsErr()) return R::Err(methods.Error());
        spec.methods = std::move(methods).Value();
    }

    return R::Ok(std::move(spec));
}

Result<std::vector<ElementSpec>, Error> ParseElementSpecs(const std::string& op,
                                                          DiagramKind kind,
                                                          const nlohmann::json& params,
                                                          const std::string& key) {
    using R = Result<std::vector<ElementSpec>, Error>;
    auto arr = RequireArray(op, params, key);
    if (arr.IsErr()) return R::Err(arr.Error());

    std::vector<ElementSpec> specs;
    const auto& entries = params[key];
    specs.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        auto spec = ParseElementSpec(op, kind, entries[i], IndexedField(key, i));
        if (spec.IsErr()) return R::Err(spec.Error());
        specs.push_back(std::move(spec).Value());
    }
    return R::Ok(std::move(specs));
}

Result<DiagramPayload, Error> ParsePayload(const std::string& op,
                                           DiagramKind kind,
                                           const nlohmann::json& params) {
    using R = Result<DiagramPayload, Error>;
    switch (kind) {
        case DiagramKind::Sequence: {
            auto elements = ParseElementSpecs(op, kind, params, "elements");
            if (elements.IsErr()) return R::Err(elements.Error());
            return R::Ok(SequencePayload{std::move(elements).Value()});
        }
        case DiagramKind::Class: {
            auto classes = ParseElementSpecs(op, kind, params, "classes");
            if (classes.IsErr()) return R::Err(classes.Error());
            return R::Ok(ClassPayload{std::move(classes).Value()});
        }
        case DiagramKind::UseCase: {
            auto actors = NameList(op, params, "actors", "actors", true);
            if (actors.IsErr()) return R::Err(actors.Error());
            auto use_cases = NameList(op, params, "use_cases", "use_cases", true);
            if (use_cases.IsErr()) return R::Err(use_cases.Error());
            return R::Ok(UseCasePayload{std::move(actors).Value(),
                                        std::move(use_cases).Value()});
        }
        case DiagramKind::Activity: {
            auto activities = NameList(op, params, "activities", "activities", true);
            if (activities.IsErr()) return R::Err(activities.Error());
            auto decisions = NameList(op, params, "decisions", "decisions", true);
            if (decisions.IsErr()) return R::Err(decisions.Error());
            return R::Ok(ActivityPayload{std::move(activities).Value(),
                                         std::move(decisions).Value()});
        }
    }
    return R::Err(Error::Internal(op, "unhandled diagram kind"));
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json NameArrayProp(const std::string& desc) {
    return {{"type", "array"},
            {"description", desc},
            {"items", {{"type", "string"}}}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json ElementItemSchema(DiagramKind kind) {
    nlohmann::json properties = {
        {"name", StringProp("Element name")},
        {"type", {{"type", "string"},
                  {"enum", AllowedTypeNames(kind)},
                  {"description", "Element type"}}},
        {"stereotype", StringProp("Optional stereotype")},
    };
    nlohmann::json required = nlohmann::json::array({"name"});
    if (kind == DiagramKind::Class) {
        properties["attributes"] = NameArrayProp("Attributes, in order");
        properties["methods"] = NameArrayProp("Methods, in order");
    } else {
        required.push_back("type");
    }
    return MakeSchema(properties, required);
}

} // anonymous namespace

std::string DiagramToolName(DiagramKind kind) {
    switch (kind) {
        case DiagramKind::Sequence: return "create_sequence_diagram";
        case DiagramKind::Class:    return "create_class_diagram";
        case DiagramKind::UseCase:  return "create_use_case_diagram";
        case DiagramKind::Activity: return "create_activity_diagram";
    }
    return "create_class_diagram";
}

std::string LifelineToolName(ElementType type) {
    return "create_" + LifelineStereotype(type) + "_lifeline";
}

Result<DiagramRequest, Error> ValidateDiagramRequest(
    DiagramKind kind, const nlohmann::json& params) {
    using R = Result<DiagramRequest, Error>;
    const auto op = DiagramToolName(kind);

    if (!params.is_object()) {
        return R::Err(Error::InvalidParameter(op, "arguments", "must be an object"));
    }

    auto package_guid = RequireGuid(op, params, "package_guid");
    if (package_guid.IsErr()) return R::Err(package_guid.Error());

    auto name = RequireString(op, params, "name", "name");
    if (name.IsErr()) return R::Err(name.Error());

    auto payload = ParsePayload(op, kind, params);
    if (payload.IsErr()) return R::Err(payload.Error());

    return R::Ok(DiagramRequest{std::move(package_guid).Value(),
                                std::move(name).Value(),
                                kind,
                                std::move(payload).Value()});
}

Result<LifelineRequest, Error> ValidateLifelineRequest(
    ElementType type, const nlohmann::json& params) {
    using R = Result<LifelineRequest, Error>;
    const auto op = LifelineToolName(type);

    if (!IsLifelineType(type)) {
        return R::Err(Error::UnknownElementType(
            op, "type", std::string(ElementTypeName(type)),
            AllowedTypeNames(DiagramKind::Sequence)));
    }
    if (!params.is_object()) {
        return R::Err(Error::InvalidParameter(op, "arguments", "must be an object"));
    }

    auto diagram_guid = RequireGuid(op, params, "diagram_guid");
    if (diagram_guid.IsErr()) return R::Err(diagram_guid.Error());

    auto name = RequireString(op, params, "name", "name");
    if (name.IsErr()) return R::Err(name.Error());

    auto stereotype = OptStereotype(op, params, "stereotype");
    if (stereotype.IsErr()) return R::Err(stereotype.Error());

    ElementSpec element;
    element.name = std::move(name).Value();
    element.type = type;
    element.stereotype = std::move(stereotype).Value();

    return R::Ok(LifelineRequest{std::move(diagram_guid).Value(), std::move(element)});
}

nlohmann::json DiagramToolSchema(DiagramKind kind) {
    nlohmann::json properties = {
        {"package_guid", StringProp("GUID of the parent package")},
        {"name", StringProp("Diagram name")},
    };
    nlohmann::json required = nlohmann::json::array({"package_guid", "name"});

    switch (kind) {
        case DiagramKind::Sequence:
            properties["elements"] = {{"type", "array"},
                                      {"description", "Lifelines, in creation order"},
                                      {"items", ElementItemSchema(kind)}};
            required.push_back("elements");
            break;
        case DiagramKind::Class:
            properties["classes"] = {{"type", "array"},
                                     {"description", "Classes, in creation order"},
                                     {"items", ElementItemSchema(kind)}};
            required.push_back("classes");
            break;
        case DiagramKind::UseCase:
            properties["actors"] = NameArrayProp("Actor names, created first");
            properties["use_cases"] = NameArrayProp("Use case names, created after actors");
            required.push_back("actors");
            required.push_back("use_cases");
            break;
        case DiagramKind::Activity:
            properties["activities"] = NameArrayProp("Activity names, created first");
            properties["decisions"] = NameArrayProp("Decision names, created after activities");
            required.push_back("activities");
            required.push_back("decisions");
            break;
    }
    return MakeSchema(properties, required);
}

nlohmann::json LifelineToolSchema() {
    return MakeSchema(
        {{"diagram_guid", StringProp("GUID of the sequence diagram")},
         {"name", StringProp("Name of the lifeline element")},
         {"stereotype", StringProp("Stereotype overriding the lifeline default")}},
        nlohmann::json::array({"diagram_guid", "name"}));
}

} // namespace ea_mcp
