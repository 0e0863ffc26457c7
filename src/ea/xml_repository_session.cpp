#include <ea_mcp/ea/xml_repository_session.hpp>

#include <ea_mcp/core/log.hpp>
#include <ea_mcp/diagram/layout.hpp>

#include <tinyxml2.h>

#include <filesystem>
#include <random>
#include <string>
#include <utility>

namespace ea_mcp {

namespace {

constexpr const char* kRootTag = "repository";
constexpr const char* kPackageTag = "package";
constexpr const char* kDiagramTag = "diagram";
constexpr const char* kElementTag = "element";
constexpr const char* kFormatVersion = "1";

std::string Attr(const tinyxml2::XMLElement* element, const char* name) {
    const char* value = element->Attribute(name);
    return value ? value : "";
}

std::string CanonicalOf(const std::string& raw) {
    auto guid = Guid::Create(raw);
    if (guid.IsErr()) {
        return raw;
    }
    return guid.Value().Canonical();
}

// Depth-first search for a `tag` element whose guid matches `canonical`.
tinyxml2::XMLElement* FindByGuid(tinyxml2::XMLElement* parent, const char* tag,
                                 const std::string& canonical) {
    for (auto* child = parent->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
        if (std::string(child->Name()) == tag &&
            CanonicalOf(Attr(child, "guid")) == canonical) {
            return child;
        }
        if (auto* found = FindByGuid(child, tag, canonical)) {
            return found;
        }
    }
    return nullptr;
}

// Lifelines are stored as "Object"; they and any type outside the vocabulary
// share the main lane of their diagram.
ElementType LayoutTypeOf(const tinyxml2::XMLElement* node) {
    return ParseElementType(Attr(node, "type")).value_or(ElementType::Class);
}

ElementInfo ElementInfoOf(const tinyxml2::XMLElement* node) {
    ElementInfo info;
    info.guid = Attr(node, "guid");
    info.name = Attr(node, "name");
    info.type = Attr(node, "type");
    info.stereotype = Attr(node, "stereotype");
    info.position.left = node->IntAttribute("left");
    info.position.top = node->IntAttribute("top");
    return info;
}

void CollectPackages(const tinyxml2::XMLElement* parent,
                     const std::string& parent_guid,
                     std::vector<PackageInfo>& out) {
    for (const auto* pkg = parent->FirstChildElement(kPackageTag); pkg;
         pkg = pkg->NextSiblingElement(kPackageTag)) {
        PackageInfo info;
        info.guid = Attr(pkg, "guid");
        info.name = Attr(pkg, "name");
        info.parent_guid = parent_guid;
        out.push_back(info);
        CollectPackages(pkg, info.guid, out);
    }
}

} // namespace

std::string GenerateGuid() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<unsigned> nibble(0, 15);
    static constexpr const char* kHex = "0123456789ABCDEF";
    static constexpr int kGroups[] = {8, 4, 4, 4, 12};

    std::string out = "{";
    for (std::size_t g = 0; g < 5; ++g) {
        if (g > 0) {
            out += '-';
        }
        for (int i = 0; i < kGroups[g]; ++i) {
            out += kHex[nibble(engine)];
        }
    }
    out += '}';
    return out;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct XmlRepositorySession::Impl {
    std::string path;
    tinyxml2::XMLDocument doc;

    tinyxml2::XMLElement* Root() { return doc.RootElement(); }
    const tinyxml2::XMLElement* Root() const { return doc.RootElement(); }

    tinyxml2::XMLElement* Find(const char* tag, const Guid& guid) {
        return FindByGuid(Root(), tag, guid.Canonical());
    }

    // Writes the document. On failure `inserted` (the node just added) is
    // removed again so memory and disk stay in step.
    Result<void, Error> Save(const std::string& operation,
                             tinyxml2::XMLElement* inserted) {
        if (doc.SaveFile(path.c_str()) != tinyxml2::XML_SUCCESS) {
            std::string reason = doc.ErrorStr();
            if (inserted != nullptr && inserted->Parent() != nullptr) {
                inserted->Parent()->DeleteChild(inserted);
            }
            LogError("repository", "Save failed: " + reason);
            return Result<void, Error>::Err(Error::EaConnection(
                operation, "cannot write repository '" + path + "': " + reason));
        }
        LogDebug("repository", "Saved " + path);
        return Result<void, Error>::Ok();
    }
};

XmlRepositorySession::XmlRepositorySession(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

XmlRepositorySession::~XmlRepositorySession() = default;

Result<std::unique_ptr<XmlRepositorySession>, Error> XmlRepositorySession::Open(
    const std::string& path, const XmlRepositoryOptions& options) {
    using R = Result<std::unique_ptr<XmlRepositorySession>, Error>;
    const std::string op = "XmlRepositorySession::Open";

    auto impl = std::make_unique<Impl>();
    impl->path = path;

    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);

    if (!exists) {
        if (!options.create_if_missing) {
            return R::Err(Error::EaConnection(
                op, "repository file not found: " + path));
        }
        impl->doc.InsertFirstChild(impl->doc.NewDeclaration());
        auto* root = impl->doc.NewElement(kRootTag);
        root->SetAttribute("format", kFormatVersion);
        impl->doc.InsertEndChild(root);

        auto* model = impl->doc.NewElement(kPackageTag);
        model->SetAttribute("guid", GenerateGuid().c_str());
        model->SetAttribute("name", options.root_package_name.c_str());
        root->InsertEndChild(model);

        auto saved = impl->Save(op, nullptr);
        if (saved.IsErr()) {
            return R::Err(saved.Error());
        }
        LogInfo("repository", "Created repository " + path);
        return R::Ok(std::unique_ptr<XmlRepositorySession>(
            new XmlRepositorySession(std::move(impl))));
    }

    if (impl->doc.LoadFile(path.c_str()) != tinyxml2::XML_SUCCESS) {
        return R::Err(Error::EaConnection(
            op, "cannot read repository '" + path + "': " + impl->doc.ErrorStr()));
    }
    const auto* root = impl->doc.RootElement();
    if (root == nullptr || std::string(root->Name()) != kRootTag) {
        return R::Err(Error::EaConnection(
            op, "'" + path + "' is not a model repository (expected <" +
                    std::string(kRootTag) + "> root)"));
    }
    if (root->FirstChildElement(kPackageTag) == nullptr) {
        return R::Err(Error::EaConnection(
            op, "'" + path + "' has no root package"));
    }

    LogInfo("repository", "Opened repository " + path);
    return R::Ok(std::unique_ptr<XmlRepositorySession>(
        new XmlRepositorySession(std::move(impl))));
}

// ---------------------------------------------------------------------------
// IEaSession
// ---------------------------------------------------------------------------

Result<DiagramInfo, Error> XmlRepositorySession::CreateDiagram(
    const Guid& package_guid, std::string_view name, DiagramKind kind) {
    using R = Result<DiagramInfo, Error>;
    const std::string op = "XmlRepositorySession::CreateDiagram";

    auto* package = impl_->Find(kPackageTag, package_guid);
    if (package == nullptr) {
        return R::Err(Error::NotFound(
            op, "package " + package_guid.Value() + " does not exist"));
    }

    DiagramInfo info;
    info.guid = GenerateGuid();
    info.name = std::string(name);
    info.type = std::string(DiagramTypeName(kind));

    auto* diagram = impl_->doc.NewElement(kDiagramTag);
    diagram->SetAttribute("guid", info.guid.c_str());
    diagram->SetAttribute("name", info.name.c_str());
    diagram->SetAttribute("type", info.type.c_str());
    package->InsertEndChild(diagram);

    auto saved = impl_->Save(op, diagram);
    if (saved.IsErr()) {
        return R::Err(saved.Error());
    }
    return R::Ok(std::move(info));
}

Result<ElementInfo, Error> XmlRepositorySession::AddElement(
    const Guid& diagram_guid, const NewElement& element) {
    using R = Result<ElementInfo, Error>;
    const std::string op = "XmlRepositorySession::AddElement";

    auto* diagram = impl_->Find(kDiagramTag, diagram_guid);
    if (diagram == nullptr) {
        return R::Err(Error::NotFound(
            op, "diagram " + diagram_guid.Value() + " does not exist"));
    }
    if (element.type.empty()) {
        return R::Err(Error::Internal(op, "element type is empty"));
    }

    ElementInfo info;
    info.guid = GenerateGuid();
    info.name = element.name;
    info.type = element.type;
    info.stereotype = element.stereotype;
    info.position = element.position;

    auto* node = impl_->doc.NewElement(kElementTag);
    node->SetAttribute("guid", info.guid.c_str());
    node->SetAttribute("name", info.name.c_str());
    node->SetAttribute("type", info.type.c_str());
    if (!info.stereotype.empty()) {
        node->SetAttribute("stereotype", info.stereotype.c_str());
    }
    node->SetAttribute("left", info.position.left);
    node->SetAttribute("top", info.position.top);
    diagram->InsertEndChild(node);

    auto saved = impl_->Save(op, node);
    if (saved.IsErr()) {
        return R::Err(saved.Error());
    }
    return R::Ok(std::move(info));
}

Result<FeatureInfo, Error> XmlRepositorySession::AttachFeature(
    const Guid& element_guid, FeatureKind kind, std::string_view name) {
    using R = Result<FeatureInfo, Error>;
    const std::string op = "XmlRepositorySession::AttachFeature";

    auto* element = impl_->Find(kElementTag, element_guid);
    if (element == nullptr) {
        return R::Err(Error::NotFound(
            op, "element " + element_guid.Value() + " does not exist"));
    }

    FeatureInfo info;
    info.guid = GenerateGuid();
    info.name = std::string(name);
    info.kind = kind;

    const std::string tag(FeatureKindName(kind));
    auto* node = impl_->doc.NewElement(tag.c_str());
    node->SetAttribute("guid", info.guid.c_str());
    node->SetAttribute("name", info.name.c_str());
    element->InsertEndChild(node);

    auto saved = impl_->Save(op, node);
    if (saved.IsErr()) {
        return R::Err(saved.Error());
    }
    return R::Ok(std::move(info));
}

Result<std::vector<ElementInfo>, Error> XmlRepositorySession::LayoutDiagram(
    const Guid& diagram_guid) {
    using R = Result<std::vector<ElementInfo>, Error>;
    const std::string op = "XmlRepositorySession::LayoutDiagram";

    auto* diagram = impl_->Find(kDiagramTag, diagram_guid);
    if (diagram == nullptr) {
        return R::Err(Error::NotFound(
            op, "diagram " + diagram_guid.Value() + " does not exist"));
    }
    const auto kind = ParseDiagramType(Attr(diagram, "type"));
    if (!kind.has_value()) {
        return R::Err(Error::Internal(
            op, "diagram " + diagram_guid.Value() + " has unknown type '" +
                    Attr(diagram, "type") + "'"));
    }

    std::vector<tinyxml2::XMLElement*> nodes;
    std::vector<ElementType> types;
    for (auto* node = diagram->FirstChildElement(kElementTag); node;
         node = node->NextSiblingElement(kElementTag)) {
        nodes.push_back(node);
        types.push_back(LayoutTypeOf(node));
    }

    const auto positions = GridPositions(*kind, types);
    std::vector<Position> previous;
    previous.reserve(nodes.size());
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        previous.push_back(Position{nodes[i]->IntAttribute("left"),
                                    nodes[i]->IntAttribute("top")});
        nodes[i]->SetAttribute("left", positions[i].left);
        nodes[i]->SetAttribute("top", positions[i].top);
    }

    auto saved = impl_->Save(op, nullptr);
    if (saved.IsErr()) {
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            nodes[i]->SetAttribute("left", previous[i].left);
            nodes[i]->SetAttribute("top", previous[i].top);
        }
        return R::Err(saved.Error());
    }

    std::vector<ElementInfo> laid_out;
    laid_out.reserve(nodes.size());
    for (const auto* node : nodes) {
        laid_out.push_back(ElementInfoOf(node));
    }
    LogDebug("repository", "Laid out " + std::to_string(laid_out.size()) +
                               " element(s) on " + diagram_guid.Value());
    return R::Ok(std::move(laid_out));
}

// ---------------------------------------------------------------------------
// Navigation
// ---------------------------------------------------------------------------

const std::string& XmlRepositorySession::Path() const noexcept {
    return impl_->path;
}

std::string XmlRepositorySession::RootPackageGuid() const {
    const auto* root = impl_->Root();
    const auto* model = root ? root->FirstChildElement(kPackageTag) : nullptr;
    return model ? Attr(model, "guid") : "";
}

std::vector<PackageInfo> XmlRepositorySession::ListPackages() const {
    std::vector<PackageInfo> out;
    if (const auto* root = impl_->Root()) {
        CollectPackages(root, "", out);
    }
    return out;
}

Result<PackageInfo, Error> XmlRepositorySession::AddPackage(
    const Guid& parent_guid, std::string_view name) {
    using R = Result<PackageInfo, Error>;
    const std::string op = "XmlRepositorySession::AddPackage";

    auto* parent = impl_->Find(kPackageTag, parent_guid);
    if (parent == nullptr) {
        return R::Err(Error::NotFound(
            op, "package " + parent_guid.Value() + " does not exist"));
    }

    PackageInfo info;
    info.guid = GenerateGuid();
    info.name = std::string(name);
    info.parent_guid = Attr(parent, "guid");

    auto* node = impl_->doc.NewElement(kPackageTag);
    node->SetAttribute("guid", info.guid.c_str());
    node->SetAttribute("name", info.name.c_str());
    parent->InsertEndChild(node);

    auto saved = impl_->Save(op, node);
    if (saved.IsErr()) {
        return R::Err(saved.Error());
    }
    return R::Ok(std::move(info));
}

} // namespace ea_mcp
