#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ferry::storage {

// One in-flight large transfer. uploadedBytes must equal the size of tempPath
// whenever the record is read back, otherwise the record is discarded.
struct TransferRecord {
    std::string fileId;
    std::filesystem::path sourcePath, targetPath, tempPath;
    uintmax_t totalBytes{}, uploadedBytes{};
    std::string protocol;
    std::chrono::system_clock::time_point createdAt, lastUpdate;
};

void to_json(nlohmann::json& j, const TransferRecord& r);
void from_json(const nlohmann::json& j, TransferRecord& r);

}
