#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace evpn::storage {

// Holds the UUID of the single NetworkManager connection this client manages.
class ConnectionStore {
public:
    virtual ~ConnectionStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get() const = 0;
    virtual void set(const std::string& uuid) = 0;
    virtual void clear() = 0;
};

// JSON state file, replaced atomically through a rename.
class FileConnectionStore final : public ConnectionStore {
public:
    explicit FileConnectionStore(std::filesystem::path path);

    [[nodiscard]] std::optional<std::string> get() const override;
    void set(const std::string& uuid) override;
    void clear() override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
