#include "storage/TransferRecord.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

void ferry::storage::to_json(nlohmann::json& j, const TransferRecord& r) {
    j = {
        {"file_id", r.fileId},
        {"source_path", r.sourcePath.string()},
        {"target_path", r.targetPath.string()},
        {"temp_file", r.tempPath.string()},
        {"total_bytes", r.totalBytes},
        {"uploaded_bytes", r.uploadedBytes},
        {"protocol", r.protocol},
        {"created_at", util::timestampToString(r.createdAt)},
        {"last_update", util::timestampToString(r.lastUpdate)}
    };
}

void ferry::storage::from_json(const nlohmann::json& j, TransferRecord& r) {
    r.fileId = j.at("file_id").get<std::string>();
    r.sourcePath = j.at("source_path").get<std::string>();
    r.targetPath = j.at("target_path").get<std::string>();
    r.tempPath = j.at("temp_file").get<std::string>();
    r.totalBytes = j.at("total_bytes").get<uintmax_t>();
    r.uploadedBytes = j.at("uploaded_bytes").get<uintmax_t>();
    r.protocol = j.value("protocol", "smb");
    r.createdAt = util::parseTimestamp(j.value("created_at", ""));
    r.lastUpdate = util::parseTimestamp(j.value("last_update", ""));
}
