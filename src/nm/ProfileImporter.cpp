#include "nm/ProfileImporter.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace evpn::nm {

namespace {

class TempDir {
public:
    TempDir() {
        std::string tmpl = (fs::temp_directory_path() / "evpn-XXXXXX").string();
        if (!::mkdtemp(tmpl.data()))
            throw std::runtime_error(std::string("Failed to create temp directory: ") + std::strerror(errno));
        path_ = tmpl;
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) log::Registry::nm()->warn("[ProfileImporter] Failed to remove {}: {}", path_.string(), ec.message());
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

}

std::string renderProfile(const std::string& config, const std::string& privateKey, const std::string& certificate) {
    std::string out;
    out.reserve(config.size() + privateKey.size() + certificate.size() + 64);
    out += config;
    out += "\n<key>\n";
    out += privateKey;
    out += "\n</key>\n<cert>\n";
    out += certificate;
    out += "\n</cert>\n";
    return out;
}

void writeProfile(const std::string& config, const std::string& privateKey, const std::string& certificate,
                  const fs::path& target) {
    {
        std::ofstream out(target, std::ios::trunc);
        if (!out.is_open()) throw std::runtime_error("Failed to open profile for writing: " + target.string());
        out << renderProfile(config, privateKey, certificate);
        if (!out) throw std::runtime_error("Failed to write profile: " + target.string());
    }
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
}

ProfileImporter::ProfileImporter(ProfileImportBoundary& boundary, std::string fileName)
    : boundary_(boundary), fileName_(std::move(fileName)) {
    if (fileName_.empty() || fs::path(fileName_).has_parent_path())
        throw std::invalid_argument("Profile file name must be a bare file name");
}

ConnectionPtr ProfileImporter::importProfile(const std::string& config,
                                             const std::string& privateKey,
                                             const std::string& certificate) const {
    const TempDir dir;
    const auto target = dir.path() / fileName_;
    writeProfile(config, privateKey, certificate, target);

    log::Registry::nm()->debug("[ProfileImporter] Importing profile from {}", target.string());
    auto connection = boundary_.importFile(target);
    if (!connection) throw std::runtime_error("Profile import produced no connection");
    return connection;
}

}
