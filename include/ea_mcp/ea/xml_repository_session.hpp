#pragma once

#include <ea_mcp/core/result.hpp>
#include <ea_mcp/core/types.hpp>
#include <ea_mcp/ea/i_ea_session.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ea_mcp {

// ---------------------------------------------------------------------------
// XmlRepositoryOptions — how to open a repository file.
// ---------------------------------------------------------------------------
struct XmlRepositoryOptions {
    bool create_if_missing = false;
    std::string root_package_name = "Model";
};

// ---------------------------------------------------------------------------
// PackageInfo — a package in the repository tree. `parent_guid` is empty for
// the root package.
// ---------------------------------------------------------------------------
struct PackageInfo {
    std::string guid;
    std::string name;
    std::string parent_guid;
};

// ---------------------------------------------------------------------------
// XmlRepositorySession — concrete IEaSession over an XML model file.
//
// Uses pimpl to keep tinyxml2 out of the public header.
//
// Layout:
//   <repository>
//     <package guid name>
//       <package .../>                       nested packages
//       <diagram guid name type>
//         <element guid name type stereotype left top>
//           <attribute guid name/>
//           <method guid name/>
//
// Every mutation is written to disk before the call returns. GUIDs are
// looked up by canonical form, so braced and unbraced spellings both match.
// ---------------------------------------------------------------------------
class XmlRepositorySession : public IEaSession {
public:
    // Opens `path`. A missing file is seeded with a single root package when
    // options.create_if_missing is set; otherwise it is an EaConnection
    // error, as is a file that does not parse as a repository.
    [[nodiscard]] static Result<std::unique_ptr<XmlRepositorySession>, Error> Open(
        const std::string& path, const XmlRepositoryOptions& options = {});

    ~XmlRepositorySession() override;

    XmlRepositorySession(const XmlRepositorySession&) = delete;
    XmlRepositorySession& operator=(const XmlRepositorySession&) = delete;
    XmlRepositorySession(XmlRepositorySession&&) = delete;
    XmlRepositorySession& operator=(XmlRepositorySession&&) = delete;

    // -- IEaSession implementation -------------------------------------------

    [[nodiscard]] Result<DiagramInfo, Error> CreateDiagram(
        const Guid& package_guid,
        std::string_view name,
        DiagramKind kind) override;

    [[nodiscard]] Result<ElementInfo, Error> AddElement(
        const Guid& diagram_guid,
        const NewElement& element) override;

    [[nodiscard]] Result<FeatureInfo, Error> AttachFeature(
        const Guid& element_guid,
        FeatureKind kind,
        std::string_view name) override;

    [[nodiscard]] Result<std::vector<ElementInfo>, Error> LayoutDiagram(
        const Guid& diagram_guid) override;

    // -- Repository navigation (concrete class only) -------------------------

    [[nodiscard]] const std::string& Path() const noexcept;

    [[nodiscard]] std::string RootPackageGuid() const;

    // All packages, depth-first in document order.
    [[nodiscard]] std::vector<PackageInfo> ListPackages() const;

    [[nodiscard]] Result<PackageInfo, Error> AddPackage(const Guid& parent_guid,
                                                       std::string_view name);

private:
    struct Impl;
    explicit XmlRepositorySession(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

// Random GUID in braced upper-case 8-4-4-4-12 form.
[[nodiscard]] std::string GenerateGuid();

} // namespace ea_mcp
