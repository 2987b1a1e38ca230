#include "sidecar_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

using json = nlohmann::json;

SidecarManager::SidecarManager(FileOperations& ops) : ops_(ops) {
}

std::string SidecarManager::sidecar_path(const std::string& directory) const {
    return ops_.join(directory, SIDECAR_FILENAME);
}

// ── Encoding ────────────────────────────────────────────────

std::string SidecarManager::to_json(const SidecarDocument& doc) {
    json mappings = json::array();
    for (const auto& e : doc.mappings) {
        json m;
        m["original"] = e.original;
        m["renamed"] = e.renamed;
        // md5 digests keep the field name older sidecars used
        m[e.hash_algorithm == "md5" ? "md5_hash" : "hash"] = e.hash;
        m["hash_algorithm"] = e.hash_algorithm;
        mappings.push_back(std::move(m));
    }

    json root;
    root["timestamp"] = doc.timestamp;
    root["mappings"] = std::move(mappings);
    // Undecodable bytes in a raw filename must not abort the write
    return root.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

Result<SidecarDocument> SidecarManager::parse_sidecar(const std::string& text) {
    using R = Result<SidecarDocument>;
    SidecarDocument doc;
    try {
        json root = json::parse(text);
        if (!root.is_object()) return R::Err("malformed sidecar: top level is not an object");

        if (root.contains("timestamp") && root["timestamp"].is_string()) {
            doc.timestamp = root["timestamp"].get<std::string>();
        }

        if (!root.contains("mappings")) return R::Ok(std::move(doc));
        const auto& mappings = root["mappings"];
        if (!mappings.is_array()) return R::Err("malformed sidecar: mappings is not an array");

        for (const auto& m : mappings) {
            if (!m.is_object() || !m.contains("original") || !m.contains("renamed")) {
                return R::Err("malformed sidecar: mapping without original/renamed");
            }
            SidecarEntry e;
            e.original = m["original"].get<std::string>();
            e.renamed = m["renamed"].get<std::string>();
            if (m.contains("hash")) {
                e.hash = m["hash"].get<std::string>();
                e.hash_algorithm = m.value("hash_algorithm", std::string(""));
            } else if (m.contains("md5_hash")) {
                e.hash = m["md5_hash"].get<std::string>();
                e.hash_algorithm = m.value("hash_algorithm", std::string("md5"));
            } else {
                e.hash_algorithm = m.value("hash_algorithm", std::string(""));
            }
            doc.mappings.push_back(std::move(e));
        }
    } catch (const json::exception& e) {
        return R::Err(fmt::format("malformed sidecar: {}", e.what()));
    }
    return R::Ok(std::move(doc));
}

// ── File protocol ───────────────────────────────────────────

Result<std::optional<SidecarDocument>> SidecarManager::read_sidecar(const std::string& directory) {
    using R = Result<std::optional<SidecarDocument>>;
    std::string path = sidecar_path(directory);
    auto text = ops_.read_text(path);
    if (text.is_err()) return R::Err(text.error);
    if (!text.value) return R::Ok(std::nullopt);

    auto doc = parse_sidecar(*text.value);
    if (doc.is_err()) return R::Err(fmt::format("{}: {}", path, doc.error));
    return R::Ok(std::move(doc.value));
}

Result<SidecarDocument> SidecarManager::append_entries(const std::string& directory,
                                                       const std::vector<SidecarEntry>& entries) {
    using R = Result<SidecarDocument>;
    std::string path = sidecar_path(directory);

    auto existing = read_sidecar(directory);
    if (existing.is_err()) {
        safename_log(fmt::format("sidecar: not writing {}: {}", path, existing.error));
        return R::Err(existing.error);
    }

    SidecarDocument doc = existing.value ? *existing.value : SidecarDocument{};
    doc.mappings.insert(doc.mappings.end(), entries.begin(), entries.end());
    doc.timestamp = now_iso();

    std::string tmp = path + SIDECAR_TMP_SUFFIX;
    auto w = ops_.write_text(tmp, to_json(doc));
    if (w.is_err()) {
        safename_log(fmt::format("sidecar: write {} failed: {}", tmp, w.error));
        return R::Err(w.error);
    }
    auto rep = ops_.replace(tmp, path);
    if (rep.is_err()) {
        safename_log(fmt::format("sidecar: replace {} failed: {}", path, rep.error));
        return R::Err(rep.error);
    }

    safename_log(fmt::format("sidecar: {} +{} entries ({} total)",
                             path, entries.size(), doc.mappings.size()));
    return R::Ok(std::move(doc));
}
