#include "nm/LibnmPluginImporter.hpp"
#include "nm/LibnmClient.hpp"
#include "log/Registry.hpp"

#include <NetworkManager.h>
#include <stdexcept>
#include <vector>

namespace evpn::nm {

namespace {

struct PluginInfoListFree {
    void operator()(GSList* list) const { g_slist_free_full(list, g_object_unref); }
};

}

LibnmPluginImporter::LibnmPluginImporter(std::string pluginName) : pluginName_(std::move(pluginName)) {}

ConnectionPtr LibnmPluginImporter::importFile(const std::filesystem::path& path) {
    const std::unique_ptr<GSList, PluginInfoListFree> infos(nm_vpn_plugin_info_list_load());

    std::vector<NMVpnPluginInfo*> matching;
    for (const GSList* it = infos.get(); it; it = it->next) {
        auto* info = NM_VPN_PLUGIN_INFO(it->data);
        const char* name = nm_vpn_plugin_info_get_name(info);
        if (name && pluginName_ == name) matching.push_back(info);
    }

    if (matching.size() != 1)
        throw std::runtime_error("Expected one " + pluginName_ + " VPN plugin, got: " + std::to_string(matching.size()));

    GError* raw = nullptr;
    NMVpnEditorPlugin* plugin = nm_vpn_plugin_info_load_editor_plugin(matching.front(), &raw);
    glib::ScopedGError err(raw);
    if (!plugin)
        throw std::runtime_error("Failed to load " + pluginName_ + " editor plugin: " + glib::messageOf(err.get()));

    raw = nullptr;
    NMConnection* imported = nm_vpn_editor_plugin_import(plugin, path.c_str(), &raw);
    err.reset(raw);
    if (!imported)
        throw std::runtime_error("Failed to import " + path.string() + ": " + glib::messageOf(err.get()));

    glib::ScopedGObject<NMConnection> connection(imported);

    raw = nullptr;
    if (!nm_connection_normalize(connection.get(), nullptr, nullptr, &raw)) {
        err.reset(raw);
        throw std::runtime_error("Imported connection is invalid: " + glib::messageOf(err.get()));
    }

    log::Registry::nm()->debug("[LibnmPluginImporter] Imported connection {}",
                               nm_connection_get_id(connection.get()) ? nm_connection_get_id(connection.get()) : "");
    return std::make_shared<LibnmConnection>(std::move(connection));
}

}
