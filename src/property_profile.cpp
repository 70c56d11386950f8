#include "property_profile.h"

#include "bacnet_types.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <system_error>

#include <tinyxml2.h>

namespace bacproxy {

namespace {

using PropertyList = std::vector<std::uint32_t>;

struct ProfileTables {
    PropertyList common;
    std::map<std::uint16_t, PropertyList> perType;
};

ProfileTables builtInDefaults() {
    using namespace object_type;
    using namespace property_id;

    ProfileTables tables;
    tables.common = {kObjectName};

    const PropertyList analog{kPresentValue, kUnits, kStatusFlags, kDescription};
    const PropertyList binary{kPresentValue, kStatusFlags, kDescription};
    const PropertyList multiState{kPresentValue, kStatusFlags, kDescription, kNumberOfStates};

    for (const auto type : {kAnalogInput, kAnalogOutput, kAnalogValue}) {
        tables.perType[type] = analog;
    }
    for (const auto type : {kBinaryInput, kBinaryOutput, kBinaryValue}) {
        tables.perType[type] = binary;
    }
    for (const auto type : {kMultiStateInput, kMultiStateOutput, kMultiStateValue}) {
        tables.perType[type] = multiState;
    }
    tables.perType[kDevice] = {kVendorName, kModelName, kFirmwareRevision, kProtocolVersion};
    return tables;
}

void appendUnique(PropertyList &list, std::uint32_t property) {
    if (std::find(list.begin(), list.end(), property) == list.end()) {
        list.push_back(property);
    }
}

std::optional<std::filesystem::path> executableDir() {
    std::error_code ec;
    const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return exe.parent_path();
}

std::optional<std::filesystem::path> resolveXmlPath(const std::string &rawPath) {
    namespace fs = std::filesystem;
    std::vector<fs::path> candidates;
    const fs::path requested(rawPath);

    if (requested.is_absolute()) {
        candidates.push_back(requested);
    } else {
        candidates.push_back(fs::current_path() / requested);
        if (const auto exeDir = executableDir()) {
            candidates.push_back(*exeDir / requested);
            const auto exeParent = exeDir->parent_path();
            if (!exeParent.empty()) {
                candidates.push_back(exeParent / requested);
            }
        }
    }

    for (const auto &candidate : candidates) {
        std::error_code ec;
        if (fs::exists(candidate, ec) && fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace

PropertyProfile &PropertyProfile::instance() {
    static PropertyProfile profile;
    return profile;
}

PropertyProfile::PropertyProfile() {
    auto tables = builtInDefaults();
    common = std::move(tables.common);
    perType = std::move(tables.perType);
}

void PropertyProfile::resetToDefaults() {
    auto tables = builtInDefaults();
    std::unique_lock lock(mtx);
    common = std::move(tables.common);
    perType = std::move(tables.perType);
}

bool PropertyProfile::loadFromXml(const std::string &xmlPath) {
    const auto resolved = resolveXmlPath(xmlPath);
    if (!resolved) {
        std::cerr << "[Profile] Profile not found: " << xmlPath
                  << " (checked current directory and executable locations); keeping current profile" << std::endl;
        return false;
    }

    tinyxml2::XMLDocument doc;
    if (doc.LoadFile(resolved->string().c_str()) != tinyxml2::XML_SUCCESS) {
        std::cerr << "[Profile] Failed to load " << resolved->string() << " (" << doc.ErrorStr() << ")" << std::endl;
        return false;
    }

    const auto *root = doc.RootElement();
    if (root == nullptr || std::string(root->Name()) != "profile") {
        std::cerr << "[Profile] Invalid profile XML: expected a <profile> root element" << std::endl;
        return false;
    }

    ProfileTables tables;
    bool sawWildcard = false;
    for (auto *objectNode = root->FirstChildElement("object"); objectNode != nullptr;
         objectNode = objectNode->NextSiblingElement("object")) {
        const char *typeAttr = objectNode->Attribute("type");
        if (typeAttr == nullptr) {
            std::cerr << "[Profile] Skipping <object> without a type attribute (line " << objectNode->GetLineNum()
                      << ")" << std::endl;
            continue;
        }

        PropertyList *target = nullptr;
        if (std::string(typeAttr) == "*") {
            target = &tables.common;
            sawWildcard = true;
        } else if (const auto type = parseObjectType(typeAttr)) {
            target = &tables.perType[*type];
        } else {
            std::cerr << "[Profile] Skipping unknown object type '" << typeAttr << "'" << std::endl;
            continue;
        }

        for (auto *propertyNode = objectNode->FirstChildElement("property"); propertyNode != nullptr;
             propertyNode = propertyNode->NextSiblingElement("property")) {
            const char *nameAttr = propertyNode->Attribute("name");
            const auto property = nameAttr != nullptr ? parsePropertyId(nameAttr) : std::nullopt;
            if (!property) {
                std::cerr << "[Profile] Skipping unknown property '" << (nameAttr != nullptr ? nameAttr : "")
                          << "' for object type " << typeAttr << std::endl;
                continue;
            }
            appendUnique(*target, *property);
        }
    }
    if (!sawWildcard) {
        tables.common = {property_id::kObjectName};
    }

    std::unique_lock lock(mtx);
    common = std::move(tables.common);
    perType = std::move(tables.perType);
    std::cout << "[Profile] Loaded " << resolved->string() << " (" << perType.size() << " object types)"
              << std::endl;
    return true;
}

std::vector<std::uint32_t> PropertyProfile::propertiesFor(std::uint16_t objectType) const {
    std::shared_lock lock(mtx);
    PropertyList result = common;
    if (const auto it = perType.find(objectType); it != perType.end()) {
        for (const auto property : it->second) {
            appendUnique(result, property);
        }
    }
    return result;
}

} // namespace bacproxy
