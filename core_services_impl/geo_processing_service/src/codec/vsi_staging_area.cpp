#include "codec/vsi_staging_area.h"
#include "core_services/geo_processing/geo_processing_exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <cpl_conv.h>
#include <cpl_string.h>
#include <cpl_vsi.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <utility>

namespace geobridge::core_services::geo_processing::codec {

VsiStagingArea::VsiStagingArea()
    : root_("/vsimem/geobridge_" + boost::uuids::to_string(boost::uuids::random_generator()())) {
    VSIMkdir(root_.c_str(), 0755);
}

VsiStagingArea::~VsiStagingArea() {
    if (VSIRmdirRecursive(root_.c_str()) != 0) {
        GEOBRIDGE_LOG_DEBUG("VsiStagingArea", "Staging directory {} was not removed", root_);
    }
}

std::string VsiStagingArea::path(const std::string& name) const {
    return root_ + "/" + name;
}

void VsiStagingArea::writeFile(const std::string& name, const std::string& bytes) const {
    const std::string target = path(name);
    VSILFILE* fp = VSIFOpenL(target.c_str(), "wb");
    if (!fp) {
        GEOBRIDGE_THROW(OperationFailedException, "staging", "cannot create " + target);
    }
    const size_t written = VSIFWriteL(bytes.data(), 1, bytes.size(), fp);
    VSIFCloseL(fp);
    if (written != bytes.size()) {
        GEOBRIDGE_THROW(OperationFailedException, "staging", "short write to " + target);
    }
}

std::string VsiStagingArea::readFile(const std::string& name) const {
    const std::string source = path(name);
    vsi_l_offset length = 0;
    GByte* buffer = VSIGetMemFileBuffer(source.c_str(), &length, FALSE);
    if (!buffer) {
        GEOBRIDGE_THROW(OperationFailedException, "staging", "cannot read " + source);
    }
    return std::string(reinterpret_cast<const char*>(buffer), static_cast<size_t>(length));
}

std::vector<std::string> VsiStagingArea::listFiles() const {
    std::vector<std::string> names;
    char** entries = VSIReadDir(root_.c_str());
    for (int i = 0; entries && entries[i]; ++i) {
        const std::string entry(entries[i]);
        if (entry != "." && entry != "..") {
            names.push_back(entry);
        }
    }
    CSLDestroy(entries);
    std::sort(names.begin(), names.end());
    return names;
}

void VsiStagingArea::zipFiles(const std::vector<std::string>& names, const std::string& zipName) const {
    std::vector<std::pair<std::string, std::string>> entries;
    for (const auto& name : names) {
        entries.emplace_back(name, readFile(name));
    }

    const std::string zipPath = path(zipName);
    void* zip = CPLCreateZip(zipPath.c_str(), nullptr);
    if (!zip) {
        GEOBRIDGE_THROW(OperationFailedException, "zip", "cannot create " + zipPath);
    }

    for (const auto& [name, content] : entries) {
        if (CPLCreateFileInZip(zip, name.c_str(), nullptr) != CE_None ||
            CPLWriteFileInZip(zip, content.data(), static_cast<int>(content.size())) != CE_None ||
            CPLCloseFileInZip(zip) != CE_None) {
            CPLCloseZip(zip);
            GEOBRIDGE_THROW(OperationFailedException, "zip", "cannot add " + name + " to archive");
        }
    }

    if (CPLCloseZip(zip) != CE_None) {
        GEOBRIDGE_THROW(OperationFailedException, "zip", "cannot finalize " + zipPath);
    }
}

} // namespace geobridge::core_services::geo_processing::codec
