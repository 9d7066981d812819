#include "storage/ConnectionStore.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace evpn::storage {

FileConnectionStore::FileConnectionStore(fs::path path) : path_(std::move(path)) {}

std::optional<std::string> FileConnectionStore::get() const {
    std::ifstream in(path_);
    if (!in.is_open()) return std::nullopt;

    const auto j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        log::Registry::storage()->warn("[ConnectionStore] Ignoring unreadable state file {}", path_.string());
        return std::nullopt;
    }

    const auto it = j.find("uuid");
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) return std::nullopt;
    return it->get<std::string>();
}

void FileConnectionStore::set(const std::string& uuid) {
    if (uuid.empty()) throw std::invalid_argument("Connection uuid cannot be empty");

    if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

    const fs::path tmp = path_.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) throw std::runtime_error("Failed to write state file: " + tmp.string());
        out << nlohmann::json{{"uuid", uuid}}.dump(2) << '\n';
        if (!out) throw std::runtime_error("Failed to write state file: " + tmp.string());
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("Failed to replace state file: " + path_.string());
    }

    log::Registry::storage()->debug("[ConnectionStore] Stored connection uuid {}", uuid);
}

void FileConnectionStore::clear() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) throw std::runtime_error("Failed to remove state file " + path_.string() + ": " + ec.message());
}

}
